/**
 * @file scheduler.cpp
 * @brief Scheduler implementation.
 */

#include "scheduler/scheduler.hpp"

#include <chrono>
#include <exception>
#include <utility>

namespace pipeflow {

namespace {

bool is_unstarted(TaskState state) noexcept {
    return state == TaskState::Pending || state == TaskState::Ready;
}

}  // namespace

Scheduler::Scheduler(const DependencyGraph& graph,
                     IExecutionBackend& backend,
                     ThreadPool& pool,
                     SchedulerOptions options,
                     Logger& logger,
                     RunJournal* journal)
    : graph_(graph)
    , backend_(backend)
    , pool_(pool)
    , options_(options)
    , logger_(logger)
    , journal_(journal)
    , budget_(options.max_cpus, options.max_memory_mb, options.max_parallel) {}

void Scheduler::set_transition_observer(TransitionObserver observer) {
    observer_ = std::move(observer);
}

void Scheduler::cancel() {
    std::lock_guard lock(events_mutex_);
    cancel_pending_ = true;
    events_cv_.notify_one();
}

Result<RunOutcome> Scheduler::run() {
    if (started_) {
        return make_error<RunOutcome>(ErrorCode::InternalSchedulingError,
                                      "scheduler already ran");
    }
    started_ = true;

    auto start = std::chrono::steady_clock::now();
    const size_t n = graph_.task_count();

    states_.assign(n, TaskState::Pending);
    unmet_deps_.resize(n);
    reports_.resize(n);
    for (TaskIndex i = 0; i < n; ++i) {
        reports_[i].index = i;
        reports_[i].analysis_name = graph_.task(i).analysis_name;
        unmet_deps_[i] = graph_.predecessors(i).size();
    }

    if (journal_) journal_->record_run_started(n, graph_.edge_count());

    for (TaskIndex i = 0; i < n; ++i) {
        if (unmet_deps_[i] == 0) {
            transition(i, TaskState::Ready);
            ready_.insert(i);
        }
    }

    while (terminal_count_ < n) {
        if (take_cancel_request()) {
            cancel_seen_ = true;
            logger_.warn("Cancellation requested, no further tasks will be started");
            halt("run cancelled");
        }

        if (!halted_) {
            if (auto admitted = admit_ready(); !admitted) {
                return abort_run(admitted.error());
            }
        }

        if (terminal_count_ == n) break;

        if (running_count_ == 0) {
            return abort_run(Error{ErrorCode::InternalSchedulingError,
                                   "no task running and none admissible with "
                                       + std::to_string(n - terminal_count_)
                                       + " tasks unfinished"});
        }

        auto event = wait_for_event();
        if (!event) continue;

        if (auto handled = handle_completion(std::move(*event)); !handled) {
            return abort_run(handled.error());
        }
    }

    auto wall_time = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);
    auto outcome = build_outcome(wall_time);

    if (journal_) {
        journal_->record_run_finished(outcome.success, outcome.succeeded_count(),
                                      outcome.failed.size(), outcome.skipped.size(),
                                      outcome.cancelled.size(), wall_time);
        journal_->flush();
    }
    return outcome;
}

// ─────────────────────────────────────────────
// Admission
// ─────────────────────────────────────────────

Result<void> Scheduler::admit_ready() {
    for (auto it = ready_.begin(); it != ready_.end();) {
        if (budget_.running() >= budget_.max_parallel()) break;

        TaskIndex index = *it;
        if (!budget_.fits(graph_.task(index).resources)) {
            ++it;
            continue;
        }
        it = ready_.erase(it);
        if (auto launched = launch(index); !launched) return launched;
    }
    return {};
}

Result<void> Scheduler::launch(TaskIndex index) {
    const Task& task = graph_.task(index);
    if (auto acquired = budget_.acquire(task.resources); !acquired) {
        return acquired;
    }

    transition(index, TaskState::Running);
    ++running_count_;
    if (journal_) {
        journal_->record_admission(index, task.analysis_name,
                                   budget_.cpus_in_use(), budget_.memory_in_use());
    }

    (void)pool_.submit_cancellable([this, index](std::stop_token stop) {
        ExecutionResult result;
        try {
            result = backend_.execute(graph_.task(index), stop);
        } catch (const std::exception& e) {
            result.final_state = TaskState::Failed;
            result.failure = ErrorCode::TaskExecutionFailed;
            result.error_message = std::string{"backend error: "} + e.what();
        } catch (...) {
            result.final_state = TaskState::Failed;
            result.failure = ErrorCode::TaskExecutionFailed;
            result.error_message = "backend error: unknown exception";
        }
        post_completion({index, std::move(result)});
    });
    return {};
}

// ─────────────────────────────────────────────
// Completion handling
// ─────────────────────────────────────────────

Result<void> Scheduler::handle_completion(Completion completion) {
    const TaskIndex index = completion.index;
    if (index >= states_.size() || states_[index] != TaskState::Running) {
        return Error{ErrorCode::InternalSchedulingError,
                     "completion for task that is not running: " + std::to_string(index)};
    }

    --running_count_;
    if (auto released = budget_.release(graph_.task(index).resources); !released) {
        return released;
    }

    ExecutionResult& result = completion.result;
    TaskState state = result.final_state;
    if (state != TaskState::Succeeded && state != TaskState::Cancelled) {
        state = TaskState::Failed;
    }

    std::string reason = result.error_message.value_or("");
    reports_[index].execution = std::move(result);

    transition(index, state, reason);

    const std::string label = task_label(graph_.task(index), index);
    switch (state) {
        case TaskState::Succeeded:
            for (TaskIndex succ : graph_.successors(index)) {
                if (states_[succ] != TaskState::Pending) continue;
                if (--unmet_deps_[succ] == 0) {
                    transition(succ, TaskState::Ready);
                    ready_.insert(succ);
                }
            }
            break;

        case TaskState::Failed:
            failed_order_.push_back(index);
            logger_.error("Task " + label + " failed: "
                          + (reason.empty() ? std::string{"non-zero exit"} : reason));
            cascade_skip(index);
            if (options_.failure_policy == FailurePolicy::FailFast && !halted_) {
                halt("run halted after failure of " + label);
            }
            break;

        default:
            logger_.warn("Task " + label + " was cancelled");
            cascade_skip(index);
            break;
    }
    return {};
}

void Scheduler::cascade_skip(TaskIndex failed) {
    const std::string reason = "dependency failed: " + task_label(graph_.task(failed), failed);
    for (TaskIndex desc : graph_.descendants(failed)) {
        if (!is_unstarted(states_[desc])) continue;
        ready_.erase(desc);
        transition(desc, TaskState::Skipped, reason);
    }
}

void Scheduler::halt(const std::string& reason) {
    if (halted_) return;
    halted_ = true;

    for (TaskIndex i = 0; i < states_.size(); ++i) {
        if (is_unstarted(states_[i])) transition(i, TaskState::Skipped, reason);
    }
    ready_.clear();

    if (options_.cancel_policy == CancelPolicy::Hard && running_count_ > 0) {
        logger_.warn("Terminating " + std::to_string(running_count_) + " running tasks");
        pool_.cancel_all();
    }
}

void Scheduler::transition(TaskIndex index, TaskState state, const std::string& reason) {
    states_[index] = state;
    reports_[index].state = state;
    if (!reason.empty()) reports_[index].reason = reason;
    if (is_terminal(state)) ++terminal_count_;

    const Task& task = graph_.task(index);
    if (state == TaskState::Running) {
        logger_.info("Starting " + task_label(task, index));
    } else if (state == TaskState::Succeeded) {
        logger_.info("Finished " + task_label(task, index));
    } else if (state == TaskState::Skipped) {
        logger_.debug("Skipping " + task_label(task, index) + ": " + reason);
    }

    if (journal_) {
        const auto& exec = reports_[index].execution;
        journal_->record_task_event(index, task.analysis_name, state,
                                    exec ? exec->duration : Duration{0},
                                    exec ? std::optional<int>{exec->exit_code} : std::nullopt,
                                    reason);
    }
    if (observer_) observer_(index, state);
}

// ─────────────────────────────────────────────
// Event channel
// ─────────────────────────────────────────────

void Scheduler::post_completion(Completion completion) {
    // Notify under the lock: once the last completion is visible, run() may
    // return and the Scheduler be destroyed before an unlocked notify runs.
    std::lock_guard lock(events_mutex_);
    events_.push_back(std::move(completion));
    events_cv_.notify_one();
}

bool Scheduler::take_cancel_request() {
    std::lock_guard lock(events_mutex_);
    return cancel_pending_ && !cancel_seen_;
}

std::optional<Scheduler::Completion> Scheduler::wait_for_event() {
    std::unique_lock lock(events_mutex_);
    events_cv_.wait(lock, [this] {
        return !events_.empty() || (cancel_pending_ && !cancel_seen_);
    });
    if (events_.empty()) return std::nullopt;

    Completion completion = std::move(events_.front());
    events_.pop_front();
    return completion;
}

Error Scheduler::abort_run(Error error) {
    logger_.error("Scheduler aborted: " + error.describe());
    pool_.cancel_all();

    // Jobs capture `this`; wait for every outstanding completion.
    std::unique_lock lock(events_mutex_);
    while (running_count_ > 0) {
        events_cv_.wait(lock, [this] { return !events_.empty(); });
        events_.pop_front();
        --running_count_;
    }
    return error;
}

RunOutcome Scheduler::build_outcome(Duration wall_time) const {
    RunOutcome outcome;
    outcome.tasks = reports_;
    outcome.failed = failed_order_;
    outcome.cancel_requested = cancel_seen_;
    outcome.wall_time = wall_time;
    for (TaskIndex i = 0; i < states_.size(); ++i) {
        if (states_[i] == TaskState::Skipped) outcome.skipped.push_back(i);
        if (states_[i] == TaskState::Cancelled) outcome.cancelled.push_back(i);
    }
    outcome.success = outcome.failed.empty() && outcome.cancelled.empty() && !cancel_seen_;
    return outcome;
}

}  // namespace pipeflow
