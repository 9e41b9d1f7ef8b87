/**
 * @file run_journal.hpp
 * @brief Structured NDJSON record of a workflow run.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace pipeflow {

/**
 * @brief Records run lifecycle, admissions and task state changes.
 *
 * One JSON object per line, e.g.
 *   {"event":"task_state_change","task":"bwa","index":0,"state":"running"}
 */
class RunJournal {
public:
    explicit RunJournal(std::unique_ptr<ILogSink> sink);

    void record_run_started(size_t task_count, size_t edge_count);
    void record_admission(TaskIndex index, std::string_view name,
                          int64_t cpus_in_use, int64_t memory_in_use_mb);
    void record_task_event(TaskIndex index, std::string_view name, TaskState state,
                           Duration duration = Duration{0},
                           std::optional<int> exit_code = std::nullopt,
                           std::string_view reason = {});
    void record_run_finished(bool success, size_t succeeded, size_t failed,
                             size_t skipped, size_t cancelled, Duration wall_time);

    void flush();

private:
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
};

}  // namespace pipeflow
