/**
 * @file resource_budget.cpp
 * @brief ResourceBudget implementation.
 */

#include "scheduler/resource_budget.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace pipeflow {

ResourceBudget::ResourceBudget(int64_t max_cpus, int64_t max_memory_mb, size_t max_parallel)
    : max_cpus_(max_cpus)
    , max_memory_mb_(max_memory_mb)
    , max_parallel_(max_parallel == 0 ? 1 : max_parallel) {}

namespace {

/// `in_use + amount` stays within `limit` (0 = unlimited) without overflowing.
bool within(int64_t in_use, int64_t amount, int64_t limit) noexcept {
    if (amount < 0) return false;
    const int64_t ceiling = limit > 0 ? limit : std::numeric_limits<int64_t>::max();
    return amount <= ceiling - in_use;
}

}  // namespace

bool ResourceBudget::fits(const Resources& res) const noexcept {
    if (running_ >= max_parallel_) return false;
    return within(cpus_in_use_, res.cpus, max_cpus_)
        && within(memory_in_use_, res.memory_mb, max_memory_mb_);
}

Result<void> ResourceBudget::acquire(const Resources& res) {
    if (!fits(res)) {
        return Error{ErrorCode::InternalSchedulingError,
                     "admission over budget: " + std::to_string(res.cpus) + " cpus, "
                         + std::to_string(res.memory_mb) + " MB requested with "
                         + std::to_string(cpus_in_use_) + " cpus, "
                         + std::to_string(memory_in_use_) + " MB and "
                         + std::to_string(running_) + " tasks in use"};
    }
    cpus_in_use_ += res.cpus;
    memory_in_use_ += res.memory_mb;
    ++running_;

    peak_cpus_ = std::max(peak_cpus_, cpus_in_use_);
    peak_memory_ = std::max(peak_memory_, memory_in_use_);
    peak_running_ = std::max(peak_running_, running_);
    return {};
}

Result<void> ResourceBudget::release(const Resources& res) {
    if (running_ == 0 || res.cpus > cpus_in_use_ || res.memory_mb > memory_in_use_) {
        return Error{ErrorCode::InternalSchedulingError,
                     "budget release without matching admission"};
    }
    cpus_in_use_ -= res.cpus;
    memory_in_use_ -= res.memory_mb;
    --running_;
    return {};
}

}  // namespace pipeflow
