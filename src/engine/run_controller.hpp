/**
 * @file run_controller.hpp
 * @brief Run entry point: validate, build the graph, schedule, report.
 *
 * Pipeline for one run:
 *   tasks → resource validation → budget check → DependencyGraph → Scheduler
 *
 * Structural errors are returned before any task starts. Task failures are
 * not errors at this level; they are reported in the RunOutcome.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/backend.hpp"
#include "scheduler/run_outcome.hpp"
#include "scheduler/scheduler.hpp"
#include "telemetry/run_journal.hpp"
#include "workflow/task.hpp"

#include <mutex>
#include <vector>

namespace pipeflow {

class RunController {
public:
    RunController(const Config& config,
                  IExecutionBackend& backend,
                  Logger& logger,
                  RunJournal* journal = nullptr);

    RunController(const RunController&) = delete;
    RunController& operator=(const RunController&) = delete;

    /**
     * @brief Execute a frozen task list to completion.
     *
     * An empty list is a successful no-op. Fails with MissingResourceSpec,
     * UnsatisfiableResources, AmbiguousProducer or CyclicDependency without
     * starting anything, and with InternalSchedulingError on a scheduler
     * invariant violation.
     */
    Result<RunOutcome> run(std::vector<Task> tasks);

    /**
     * @brief Cancel the current run, or the next one if none is active.
     *        Thread-safe.
     *
     * No new tasks start; running tasks drain or are terminated according
     * to the configured cancel policy. A request affects one run only.
     */
    void cancel();

    /// Observer forwarded to the Scheduler of each run.
    void set_transition_observer(TransitionObserver observer);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] size_t effective_parallelism(size_t task_count) const;

    const Config& config_;
    IExecutionBackend& backend_;
    Logger& logger_;
    RunJournal* journal_;
    TransitionObserver observer_;

    std::mutex cancel_mutex_;
    Scheduler* active_{nullptr};
    bool cancel_requested_{false};
};

}  // namespace pipeflow
