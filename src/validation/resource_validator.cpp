/**
 * @file resource_validator.cpp
 * @brief ResourceValidator implementation.
 */

#include "validation/resource_validator.hpp"

#include <string>

namespace pipeflow {

namespace {

Error missing(const Task& task, std::string_view field) {
    return Error{ErrorCode::MissingResourceSpec,
                 "no " + std::string{field} + " resource for task: " + task.analysis_name,
                 {task.analysis_name, std::string{field}}};
}

Error too_large(const Task& task, std::string_view field, int64_t value, int64_t limit) {
    return Error{ErrorCode::UnsatisfiableResources,
                 "task " + task.analysis_name + " declares " + std::to_string(value) + " "
                     + std::string{field} + ", above the limit of " + std::to_string(limit),
                 {task.analysis_name, std::string{field}}};
}

}  // anonymous namespace

Result<void> validate_resources(std::span<const Task> tasks) {
    for (const auto& task : tasks) {
        const auto& res = task.resources;
        if (res.cpus <= 0)                return missing(task, "cpus");
        if (res.memory_mb <= 0)           return missing(task, "memory");
        if (res.time_limit_minutes <= 0)  return missing(task, "time");
        if (res.container.empty())        return missing(task, "container");

        if (res.cpus > kMaxTaskCpus) return too_large(task, "cpus", res.cpus, kMaxTaskCpus);
        if (res.memory_mb > kMaxTaskMemoryMb) {
            return too_large(task, "memory", res.memory_mb, kMaxTaskMemoryMb);
        }
        if (res.time_limit_minutes > kMaxTaskMinutes) {
            return too_large(task, "time", res.time_limit_minutes, kMaxTaskMinutes);
        }
    }
    return {};
}

Result<void> validate_against_budget(std::span<const Task> tasks,
                                     const SchedulerConfig& budget) {
    for (const auto& task : tasks) {
        const auto& res = task.resources;
        if (budget.max_cpus > 0 && res.cpus > budget.max_cpus) {
            return Error{ErrorCode::UnsatisfiableResources,
                         "task " + task.analysis_name + " needs " + std::to_string(res.cpus)
                             + " cpus but the budget is " + std::to_string(budget.max_cpus),
                         {task.analysis_name, "cpus"}};
        }
        if (budget.max_memory_mb > 0 && res.memory_mb > budget.max_memory_mb) {
            return Error{ErrorCode::UnsatisfiableResources,
                         "task " + task.analysis_name + " needs " + std::to_string(res.memory_mb)
                             + " MB but the budget is " + std::to_string(budget.max_memory_mb)
                             + " MB",
                         {task.analysis_name, "memory"}};
        }
    }
    return {};
}

}  // namespace pipeflow
