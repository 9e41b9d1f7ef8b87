/**
 * @file run_outcome.hpp
 * @brief Aggregate result of executing a workflow graph.
 */

#pragma once

#include "core/types.hpp"
#include "executor/backend.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pipeflow {

/**
 * @brief Final state of one task, in input order.
 */
struct TaskReport {
    TaskIndex index{0};
    std::string analysis_name;
    TaskState state{TaskState::Pending};
    std::optional<ExecutionResult> execution;   ///< Present iff the task ran
    std::string reason;                         ///< Why it was skipped/failed
};

/**
 * @brief Outcome of a whole run.
 *
 * success is true iff no task failed or was cancelled and no cancel was
 * requested. `failed` is in completion order, so its front is the first
 * failure; `skipped` and `cancelled` are ascending.
 */
struct RunOutcome {
    bool success{true};
    bool cancel_requested{false};
    std::vector<TaskReport> tasks;
    std::vector<TaskIndex> failed;
    std::vector<TaskIndex> skipped;
    std::vector<TaskIndex> cancelled;
    Duration wall_time{0};

    [[nodiscard]] size_t executed_count() const {
        size_t n = 0;
        for (const auto& t : tasks) {
            if (t.execution) ++n;
        }
        return n;
    }

    [[nodiscard]] size_t succeeded_count() const {
        size_t n = 0;
        for (const auto& t : tasks) {
            if (t.state == TaskState::Succeeded) ++n;
        }
        return n;
    }

    [[nodiscard]] std::vector<std::string> names(const std::vector<TaskIndex>& indices) const {
        std::vector<std::string> out;
        out.reserve(indices.size());
        for (auto i : indices) out.push_back(tasks.at(i).analysis_name);
        return out;
    }

    [[nodiscard]] std::string summary() const {
        std::string result = success ? "Workflow succeeded"
                           : cancel_requested ? "Workflow cancelled"
                           : "Workflow failed";
        result += " (succeeded=" + std::to_string(succeeded_count());
        result += ", failed=" + std::to_string(failed.size());
        result += ", skipped=" + std::to_string(skipped.size());
        result += ", cancelled=" + std::to_string(cancelled.size()) + ")";
        return result;
    }
};

}  // namespace pipeflow
