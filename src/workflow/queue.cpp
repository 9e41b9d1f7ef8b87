/**
 * @file queue.cpp
 * @brief Queue implementation.
 */

#include "workflow/queue.hpp"

#include <string>
#include <utility>

namespace pipeflow {

TaskIndex Queue::add(Task task) {
    tasks_.push_back(freeze_task(std::move(task)));
    return tasks_.size() - 1;
}

Result<RunOutcome> Queue::run(RunController& controller, Logger& logger) const {
    if (!tasks_.empty()) {
        logger.info("Starting workflow with " + std::to_string(tasks_.size()) + " jobs");
    }
    return controller.run(tasks_);
}

}  // namespace pipeflow
