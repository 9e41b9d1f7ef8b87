/**
 * @file task.hpp
 * @brief Task descriptor: one schedulable unit of containerized work.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace pipeflow {

/**
 * @brief Immutable record of one unit of work.
 *
 * Produced by the authoring side (Queue, workflow files) with absolute
 * input/output paths. The core never interprets `command`; it is passed
 * verbatim to the execution backend.
 */
struct Task {
    std::string analysis_name;
    std::string command;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    Resources resources;

    bool operator==(const Task&) const = default;
};

/**
 * @brief Convert any TaskDescriptorLike object into a Task.
 */
template <TaskDescriptorLike T>
Task to_task(const T& descriptor) {
    Task task;
    task.analysis_name = std::string{descriptor.analysis_name()};
    task.command = std::string{descriptor.command()};
    for (const auto& path : descriptor.inputs()) task.inputs.emplace_back(path);
    for (const auto& path : descriptor.outputs()) task.outputs.emplace_back(path);
    task.resources = descriptor.resources();
    return task;
}

/**
 * @brief Make every declared path absolute and lexically normal.
 *
 * Relative paths are resolved against the current working directory.
 */
Task freeze_task(Task task);

/// Human-readable label used in logs: "name#index".
std::string task_label(const Task& task, TaskIndex index);

}  // namespace pipeflow
