/**
 * @file run_journal.cpp
 * @brief RunJournal implementation.
 */

#include "telemetry/run_journal.hpp"

#include <sstream>

namespace pipeflow {

RunJournal::RunJournal(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void RunJournal::record_run_started(size_t task_count, size_t edge_count) {
    std::ostringstream oss;
    oss << R"({"event":"run_started")"
        << R"(,"tasks":)" << task_count
        << R"(,"edges":)" << edge_count
        << "}";
    emit(oss.str());
}

void RunJournal::record_admission(TaskIndex index, std::string_view name,
                                  int64_t cpus_in_use, int64_t memory_in_use_mb) {
    std::ostringstream oss;
    oss << R"({"event":"admission")"
        << R"(,"task":")" << json_escape(name) << "\""
        << R"(,"index":)" << index
        << R"(,"cpus_in_use":)" << cpus_in_use
        << R"(,"memory_in_use_mb":)" << memory_in_use_mb
        << "}";
    emit(oss.str());
}

void RunJournal::record_task_event(TaskIndex index, std::string_view name, TaskState state,
                                   Duration duration, std::optional<int> exit_code,
                                   std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"task_state_change")"
        << R"(,"task":")" << json_escape(name) << "\""
        << R"(,"index":)" << index
        << R"(,"state":")" << to_string(state) << "\"";
    if (is_terminal(state)) {
        oss << R"(,"duration_ms":)" << duration.count();
    }
    if (exit_code) {
        oss << R"(,"exit_code":)" << *exit_code;
    }
    if (!reason.empty()) {
        oss << R"(,"reason":")" << json_escape(reason) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void RunJournal::record_run_finished(bool success, size_t succeeded, size_t failed,
                                     size_t skipped, size_t cancelled, Duration wall_time) {
    std::ostringstream oss;
    oss << R"({"event":"run_finished")"
        << R"(,"success":)" << (success ? "true" : "false")
        << R"(,"succeeded":)" << succeeded
        << R"(,"failed":)" << failed
        << R"(,"skipped":)" << skipped
        << R"(,"cancelled":)" << cancelled
        << R"(,"wall_time_ms":)" << wall_time.count()
        << "}";
    emit(oss.str());
}

void RunJournal::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void RunJournal::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace pipeflow
