/**
 * @file dependency_graph.hpp
 * @brief Dependency graph inferred from declared input/output paths.
 *
 * An edge producer → consumer exists when some path in producer.outputs is
 * string-equal to some path in consumer.inputs. Paths produced by no task
 * are external files and contribute no edge. Built once per run and
 * immutable afterwards; runtime state lives in the Scheduler.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workflow/task.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pipeflow {

class DependencyGraph {
public:
    // ── Construction ──────────────────────────

    /**
     * @brief Build and validate the graph for a task list.
     *
     * Fails with AmbiguousProducer when two tasks declare the same output
     * path, and with CyclicDependency (naming the tasks on the cycle) when
     * any task is its own predecessor. Pure: no I/O, deterministic.
     */
    static Result<DependencyGraph> build(std::span<const Task> tasks);

    // ── Queries ───────────────────────────────
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edge_count_; }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }

    [[nodiscard]] const Task& task(TaskIndex index) const { return tasks_.at(index); }
    [[nodiscard]] std::span<const Task> tasks() const noexcept { return tasks_; }

    [[nodiscard]] const std::vector<TaskIndex>& successors(TaskIndex index) const {
        return successors_.at(index);
    }
    [[nodiscard]] const std::vector<TaskIndex>& predecessors(TaskIndex index) const {
        return predecessors_.at(index);
    }

    [[nodiscard]] bool has_edge(TaskIndex from, TaskIndex to) const;
    [[nodiscard]] std::vector<TaskIndex> roots() const;
    [[nodiscard]] std::vector<TaskIndex> topological_order() const;

    /// Every transitive successor of `index`, ascending.
    [[nodiscard]] std::vector<TaskIndex> descendants(TaskIndex index) const;

    /// Declared inputs that no task produces, sorted and de-duplicated.
    [[nodiscard]] const std::vector<std::string>& external_inputs() const noexcept {
        return external_inputs_;
    }

    // ── Metrics ───────────────────────────────

    /// Longest dependency chain measured in declared time limits.
    [[nodiscard]] int64_t critical_path_minutes() const;

private:
    DependencyGraph() = default;

    void add_edge(TaskIndex from, TaskIndex to);
    [[nodiscard]] std::vector<TaskIndex> find_cycle() const;

    std::vector<Task> tasks_;
    std::vector<std::vector<TaskIndex>> successors_;     // forward edges
    std::vector<std::vector<TaskIndex>> predecessors_;   // backward edges
    size_t edge_count_{0};
    std::vector<std::string> external_inputs_;
};

}  // namespace pipeflow
