/**
 * @file run_controller.cpp
 * @brief RunController implementation.
 */

#include "engine/run_controller.hpp"

#include "executor/thread_pool.hpp"
#include "graph/dependency_graph.hpp"
#include "validation/resource_validator.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <utility>

namespace pipeflow {

RunController::RunController(const Config& config,
                             IExecutionBackend& backend,
                             Logger& logger,
                             RunJournal* journal)
    : config_(config)
    , backend_(backend)
    , logger_(logger)
    , journal_(journal) {}

void RunController::set_transition_observer(TransitionObserver observer) {
    observer_ = std::move(observer);
}

void RunController::cancel() {
    std::lock_guard lock(cancel_mutex_);
    cancel_requested_ = true;
    if (active_) active_->cancel();
}

size_t RunController::effective_parallelism(size_t task_count) const {
    size_t limit = config_.scheduler.max_parallel;
    if (limit == 0) {
        limit = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(limit, task_count));
}

Result<RunOutcome> RunController::run(std::vector<Task> tasks) {
    if (tasks.empty()) {
        logger_.info("No jobs were added to the queue, nothing to do!");
        return RunOutcome{};
    }

    if (auto valid = validate_resources(tasks); !valid) {
        logger_.error(valid.error().describe());
        return valid.error();
    }
    if (auto fits = validate_against_budget(tasks, config_.scheduler); !fits) {
        logger_.error(fits.error().describe());
        return fits.error();
    }

    auto graph = DependencyGraph::build(tasks);
    if (!graph) {
        logger_.error(graph.error().describe());
        return graph.error();
    }

    logger_.info("Dependency graph: " + std::to_string(graph->task_count()) + " tasks, "
                 + std::to_string(graph->edge_count()) + " edges, critical path "
                 + std::to_string(graph->critical_path_minutes()) + " min");
    for (const auto& path : graph->external_inputs()) {
        logger_.debug("External input: " + path);
    }

    const size_t parallelism = effective_parallelism(graph->task_count());
    ThreadPool pool(parallelism);

    SchedulerOptions options;
    options.max_cpus = config_.scheduler.max_cpus;
    options.max_memory_mb = config_.scheduler.max_memory_mb;
    options.max_parallel = parallelism;
    options.failure_policy = config_.scheduler.failure_policy;
    options.cancel_policy = config_.scheduler.cancel_policy;

    Scheduler scheduler(*graph, backend_, pool, options, logger_, journal_);
    if (observer_) scheduler.set_transition_observer(observer_);

    {
        std::lock_guard lock(cancel_mutex_);
        active_ = &scheduler;
        if (cancel_requested_) {
            scheduler.cancel();
            cancel_requested_ = false;
        }
    }

    auto outcome = scheduler.run();

    {
        std::lock_guard lock(cancel_mutex_);
        active_ = nullptr;
        cancel_requested_ = false;
    }

    if (!outcome) return outcome;

    logger_.info(outcome->summary() + " in "
                 + std::to_string(outcome->wall_time.count()) + " ms, peak "
                 + std::to_string(scheduler.budget().peak_cpus()) + " cpus / "
                 + std::to_string(scheduler.budget().peak_memory()) + " MB");
    return outcome;
}

}  // namespace pipeflow
