/**
 * @file resource_budget.hpp
 * @brief Global admission budget over running tasks.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>

namespace pipeflow {

/**
 * @brief Tracks cpus, memory and slots held by Running tasks.
 *
 * A zero cpu or memory ceiling means that dimension is unlimited. Owned by
 * the scheduler's coordination point; not thread-safe.
 */
class ResourceBudget {
public:
    ResourceBudget(int64_t max_cpus, int64_t max_memory_mb, size_t max_parallel);

    [[nodiscard]] bool fits(const Resources& res) const noexcept;

    /// Fails with InternalSchedulingError if `res` does not fit.
    Result<void> acquire(const Resources& res);

    /// Fails with InternalSchedulingError if more is released than held.
    Result<void> release(const Resources& res);

    [[nodiscard]] int64_t cpus_in_use() const noexcept { return cpus_in_use_; }
    [[nodiscard]] int64_t memory_in_use() const noexcept { return memory_in_use_; }
    [[nodiscard]] size_t running() const noexcept { return running_; }

    [[nodiscard]] int64_t peak_cpus() const noexcept { return peak_cpus_; }
    [[nodiscard]] int64_t peak_memory() const noexcept { return peak_memory_; }
    [[nodiscard]] size_t peak_running() const noexcept { return peak_running_; }

    [[nodiscard]] int64_t max_cpus() const noexcept { return max_cpus_; }
    [[nodiscard]] int64_t max_memory_mb() const noexcept { return max_memory_mb_; }
    [[nodiscard]] size_t max_parallel() const noexcept { return max_parallel_; }

private:
    int64_t max_cpus_;
    int64_t max_memory_mb_;
    size_t max_parallel_;

    int64_t cpus_in_use_{0};
    int64_t memory_in_use_{0};
    size_t running_{0};

    int64_t peak_cpus_{0};
    int64_t peak_memory_{0};
    size_t peak_running_{0};
};

}  // namespace pipeflow
