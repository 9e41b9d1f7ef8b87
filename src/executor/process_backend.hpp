/**
 * @file process_backend.hpp
 * @brief Execution backend running each task as a child process group.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "executor/backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pipeflow {

/**
 * @brief Runs tasks through a container runtime (or a plain shell).
 *
 * Each task gets its own session so the whole process tree can be killed.
 * The child's stdout/stderr are written to `<log_dir>/<name>-<seq>.out|.err`
 * and the tails of those files become the result summaries. The wall-clock
 * limit is `time_limit_minutes × time_unit`; on expiry or on a stop request
 * the process group is SIGKILLed and reaped before execute() returns.
 */
class ProcessBackend : public IExecutionBackend {
public:
    struct Options {
        std::string job_runner = "local";            ///< "local" or "shell"
        std::string singularity_bin = "singularity";
        std::filesystem::path log_dir;               ///< empty = $TMPDIR/pipeflow
        std::chrono::milliseconds poll_interval{10};
        size_t summary_bytes = 4096;
        bool apply_memory_rlimit = false;
        std::chrono::milliseconds time_unit = std::chrono::minutes{1};
    };

    /// Backend options for a resolved configuration; rejects unknown runners.
    static Result<Options> options_from(const Config& config);

    explicit ProcessBackend(Options options);

    ExecutionResult execute(const Task& task, std::stop_token stop) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

    /// Command line used to launch `task`.
    [[nodiscard]] std::vector<std::string> build_argv(const Task& task) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::filesystem::path log_dir() const;

    Options options_;
    std::atomic<uint64_t> sequence_{0};
};

}  // namespace pipeflow
