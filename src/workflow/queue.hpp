/**
 * @file queue.hpp
 * @brief Ordered collection of frozen tasks handed to the run controller.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "engine/run_controller.hpp"
#include "scheduler/run_outcome.hpp"
#include "workflow/task.hpp"

#include <cstddef>
#include <vector>

namespace pipeflow {

/**
 * @brief Authoring boundary between workflow definitions and the core.
 *
 * Insertion order is the task index order used for tie-breaking.
 */
class Queue {
public:
    Queue() = default;

    /// Freeze and append a task. Returns its index.
    TaskIndex add(Task task);

    template <TaskDescriptorLike T>
    TaskIndex add(const T& descriptor) {
        return add(to_task(descriptor));
    }

    [[nodiscard]] const std::vector<Task>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }

    /// Hand the frozen list to `controller`. The queue keeps its tasks.
    Result<RunOutcome> run(RunController& controller, Logger& logger) const;

private:
    std::vector<Task> tasks_;
};

}  // namespace pipeflow
