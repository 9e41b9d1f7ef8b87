/**
 * @file scheduler.hpp
 * @brief Readiness-driven scheduler over a validated DependencyGraph.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/backend.hpp"
#include "executor/thread_pool.hpp"
#include "graph/dependency_graph.hpp"
#include "scheduler/resource_budget.hpp"
#include "scheduler/run_outcome.hpp"
#include "telemetry/run_journal.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pipeflow {

struct SchedulerOptions {
    int64_t max_cpus = 0;               ///< 0 = unlimited
    int64_t max_memory_mb = 0;          ///< 0 = unlimited
    size_t max_parallel = 1;
    FailurePolicy failure_policy = FailurePolicy::FailFast;
    CancelPolicy cancel_policy = CancelPolicy::Drain;
};

/// Invoked on the coordination thread for every state change.
using TransitionObserver = std::function<void(TaskIndex, TaskState)>;

/**
 * @brief Drives every task of a graph to a terminal state.
 *
 * All state lives here and is mutated only on the thread calling run().
 * Worker jobs report through a completion queue, which is the single
 * coordination point. Ready tasks are admitted in ascending index order
 * while the budget fits; a task that does not fit is passed over so
 * smaller tasks behind it may start.
 */
class Scheduler {
public:
    Scheduler(const DependencyGraph& graph,
              IExecutionBackend& backend,
              ThreadPool& pool,
              SchedulerOptions options,
              Logger& logger,
              RunJournal* journal = nullptr);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Execute the graph. Callable once.
     *
     * Returns the outcome whenever every task reached a terminal state,
     * including failed and cancelled runs. Fails with
     * InternalSchedulingError only if the bookkeeping is inconsistent.
     */
    Result<RunOutcome> run();

    /// Request cancellation. Thread-safe, idempotent.
    void cancel();

    void set_transition_observer(TransitionObserver observer);

    [[nodiscard]] const ResourceBudget& budget() const noexcept { return budget_; }

private:
    struct Completion {
        TaskIndex index;
        ExecutionResult result;
    };

    Result<void> admit_ready();
    Result<void> launch(TaskIndex index);
    Result<void> handle_completion(Completion completion);
    void cascade_skip(TaskIndex failed);
    void halt(const std::string& reason);
    void transition(TaskIndex index, TaskState state, const std::string& reason = {});

    void post_completion(Completion completion);
    bool take_cancel_request();
    std::optional<Completion> wait_for_event();
    Error abort_run(Error error);

    RunOutcome build_outcome(Duration wall_time) const;

    const DependencyGraph& graph_;
    IExecutionBackend& backend_;
    ThreadPool& pool_;
    SchedulerOptions options_;
    Logger& logger_;
    RunJournal* journal_;
    TransitionObserver observer_;

    ResourceBudget budget_;
    std::vector<TaskState> states_;
    std::vector<size_t> unmet_deps_;
    std::vector<TaskReport> reports_;
    std::set<TaskIndex> ready_;
    std::vector<TaskIndex> failed_order_;
    size_t terminal_count_{0};
    size_t running_count_{0};
    bool halted_{false};
    bool cancel_seen_{false};
    bool started_{false};

    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::deque<Completion> events_;
    bool cancel_pending_{false};
};

}  // namespace pipeflow
