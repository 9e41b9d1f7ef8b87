/**
 * @file resource_validator.hpp
 * @brief Pre-flight checks on task resource requirements.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "workflow/task.hpp"

#include <cstdint>
#include <span>

namespace pipeflow {

/// Largest declarable values; anything above cannot be a real requirement.
inline constexpr int64_t kMaxTaskCpus = int64_t{1} << 20;
inline constexpr int64_t kMaxTaskMemoryMb = int64_t{1} << 40;
inline constexpr int64_t kMaxTaskMinutes = int64_t{1} << 32;

/**
 * @brief Confirm every task declares cpus, memory, time and a container.
 *
 * Stops at the first violation with MissingResourceSpec; subjects are
 * {analysis name, field}. A value above the kMaxTask* limits fails with
 * UnsatisfiableResources and the same subjects. Runs before graph
 * construction so that no task of an invalid workflow ever starts.
 */
Result<void> validate_resources(std::span<const Task> tasks);

/**
 * @brief Reject tasks that could never be admitted under a finite budget.
 *
 * A task needing more cpus or memory than the whole budget fails with
 * UnsatisfiableResources. Unlimited (zero) budget dimensions are skipped.
 */
Result<void> validate_against_budget(std::span<const Task> tasks,
                                     const SchedulerConfig& budget);

}  // namespace pipeflow
