/**
 * @file backend.hpp
 * @brief Execution backend interface and the per-task outcome it reports.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workflow/task.hpp"

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace pipeflow {

/**
 * @brief Outcome of running one task to completion.
 *
 * final_state is Succeeded, Failed or Cancelled. `failure` carries
 * TaskExecutionFailed, TimeLimitExceeded or Cancelled when the task did not
 * succeed.
 */
struct ExecutionResult {
    TaskState final_state{TaskState::Failed};
    int exit_code{-1};
    std::string stdout_summary;
    std::string stderr_summary;
    Duration duration{0};
    std::optional<ErrorCode> failure;
    std::optional<std::string> error_message;

    [[nodiscard]] bool succeeded() const noexcept {
        return final_state == TaskState::Succeeded;
    }
};

/**
 * @brief Runs one task in isolation honoring its resource limits.
 *
 * Implementations must release everything the task held (processes,
 * containers) before returning, and must return promptly once `stop` is
 * requested, reporting Cancelled. No retries: one call, one attempt.
 * Called concurrently from worker threads.
 */
class IExecutionBackend {
public:
    virtual ~IExecutionBackend() = default;

    virtual ExecutionResult execute(const Task& task, std::stop_token stop) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace pipeflow
