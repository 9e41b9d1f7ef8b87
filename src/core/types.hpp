/**
 * @file types.hpp
 * @brief Fundamental types used throughout pipeflow.
 *
 * Defines task identity, resource requirements, the per-task runtime state
 * machine, and the clock/duration vocabulary shared by every module.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pipeflow {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

/// Position of a task in the list handed to the core (stable for a run).
using TaskIndex = std::size_t;

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────

/**
 * @brief Compute resources a task declares.
 *
 * Zero or empty fields mean "not supplied"; the ResourceValidator rejects
 * them before anything runs.
 */
struct Resources {
    int64_t cpus{0};
    int64_t memory_mb{0};
    int64_t time_limit_minutes{0};
    std::string container;
    std::string extra_runtime_args;

    bool operator==(const Resources&) const = default;
};

// ─────────────────────────────────────────────
// Task State
// ─────────────────────────────────────────────

enum class TaskState : uint8_t {
    Pending,       ///< Has unmet dependencies
    Ready,         ///< All dependencies succeeded, awaiting admission
    Running,       ///< Admitted and handed to the execution backend
    Succeeded,
    Failed,
    Skipped,       ///< Never started (dependency failed or run halted)
    Cancelled      ///< Terminated by a hard cancel
};

[[nodiscard]] constexpr std::string_view to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:    return "pending";
        case TaskState::Ready:      return "ready";
        case TaskState::Running:    return "running";
        case TaskState::Succeeded:  return "succeeded";
        case TaskState::Failed:     return "failed";
        case TaskState::Skipped:    return "skipped";
        case TaskState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskState state) noexcept {
    return state == TaskState::Succeeded
        || state == TaskState::Failed
        || state == TaskState::Skipped
        || state == TaskState::Cancelled;
}

}  // namespace pipeflow
