/**
 * @file dependency_graph.cpp
 * @brief DependencyGraph implementation: edge inference and graph algorithms.
 *
 * Edge inference indexes every output path to its producer and looks up the
 * index with each input path: O(total paths). Cycle detection is an
 * iterative three-colour DFS that keeps its frames on a vector so the cycle
 * can be read back off the stack. Topological order is Kahn's algorithm
 * taking the smallest ready index first.
 */

#include "graph/dependency_graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <set>
#include <unordered_map>

namespace pipeflow {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<DependencyGraph> DependencyGraph::build(std::span<const Task> tasks) {
    DependencyGraph graph;
    graph.tasks_.assign(tasks.begin(), tasks.end());
    graph.successors_.resize(tasks.size());
    graph.predecessors_.resize(tasks.size());

    std::unordered_map<std::string, TaskIndex> producer_of;
    for (TaskIndex i = 0; i < tasks.size(); ++i) {
        for (const auto& path : tasks[i].outputs) {
            auto [it, inserted] = producer_of.emplace(path, i);
            if (!inserted && it->second != i) {
                const auto& first = tasks[it->second].analysis_name;
                const auto& second = tasks[i].analysis_name;
                return Error{ErrorCode::AmbiguousProducer,
                             "output " + path + " is declared by both " + first
                                 + " and " + second,
                             {first, second, path}};
            }
        }
    }

    std::set<std::string> external;
    for (TaskIndex consumer = 0; consumer < tasks.size(); ++consumer) {
        for (const auto& path : tasks[consumer].inputs) {
            auto it = producer_of.find(path);
            if (it == producer_of.end()) {
                external.insert(path);
                continue;
            }
            graph.add_edge(it->second, consumer);
        }
    }
    graph.external_inputs_.assign(external.begin(), external.end());

    if (auto cycle = graph.find_cycle(); !cycle.empty()) {
        std::vector<std::string> names;
        std::string chain;
        for (auto index : cycle) {
            names.push_back(graph.tasks_[index].analysis_name);
            chain += graph.tasks_[index].analysis_name + " -> ";
        }
        chain += graph.tasks_[cycle.front()].analysis_name;
        return Error{ErrorCode::CyclicDependency, "cyclic dependency: " + chain,
                     std::move(names)};
    }

    return graph;
}

void DependencyGraph::add_edge(TaskIndex from, TaskIndex to) {
    auto& out = successors_[from];
    if (std::find(out.begin(), out.end(), to) != out.end()) return;
    out.push_back(to);
    predecessors_[to].push_back(from);
    ++edge_count_;
}

// ─────────────────────────────────────────────
// Cycle Detection
// ─────────────────────────────────────────────

std::vector<TaskIndex> DependencyGraph::find_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::vector<Color> color(tasks_.size(), Color::White);

    struct Frame {
        TaskIndex node;
        size_t neighbor_idx;
    };

    for (TaskIndex start = 0; start < tasks_.size(); ++start) {
        if (color[start] != Color::White) continue;

        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({start, 0});
        color[start] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.back();
            const auto& out = successors_[node];

            if (idx >= out.size()) {
                color[node] = Color::Black;
                dfs_stack.pop_back();
                continue;
            }

            TaskIndex neighbor = out[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                // The gray nodes on the stack from `neighbor` up form the cycle.
                std::vector<TaskIndex> cycle;
                auto it = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                       [neighbor](const Frame& f) { return f.node == neighbor; });
                for (; it != dfs_stack.end(); ++it) {
                    cycle.push_back(it->node);
                }
                return cycle;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push_back({neighbor, 0});
            }
        }
    }

    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool DependencyGraph::has_edge(TaskIndex from, TaskIndex to) const {
    if (from >= successors_.size()) return false;
    const auto& out = successors_[from];
    return std::find(out.begin(), out.end(), to) != out.end();
}

std::vector<TaskIndex> DependencyGraph::roots() const {
    std::vector<TaskIndex> result;
    for (TaskIndex i = 0; i < tasks_.size(); ++i) {
        if (predecessors_[i].empty()) result.push_back(i);
    }
    return result;
}

std::vector<TaskIndex> DependencyGraph::topological_order() const {
    std::vector<size_t> in_degree(tasks_.size(), 0);
    for (TaskIndex i = 0; i < tasks_.size(); ++i) {
        in_degree[i] = predecessors_[i].size();
    }

    std::priority_queue<TaskIndex, std::vector<TaskIndex>, std::greater<>> zero_in;
    for (TaskIndex i = 0; i < tasks_.size(); ++i) {
        if (in_degree[i] == 0) zero_in.push(i);
    }

    std::vector<TaskIndex> order;
    order.reserve(tasks_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.top();
        zero_in.pop();
        order.push_back(current);

        for (auto next : successors_[current]) {
            if (--in_degree[next] == 0) {
                zero_in.push(next);
            }
        }
    }

    return order;
}

std::vector<TaskIndex> DependencyGraph::descendants(TaskIndex index) const {
    std::vector<bool> seen(tasks_.size(), false);
    std::vector<TaskIndex> pending(successors_.at(index));
    std::vector<TaskIndex> result;

    while (!pending.empty()) {
        auto current = pending.back();
        pending.pop_back();
        if (seen[current]) continue;
        seen[current] = true;
        result.push_back(current);
        for (auto next : successors_[current]) {
            if (!seen[next]) pending.push_back(next);
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

int64_t DependencyGraph::critical_path_minutes() const {
    if (tasks_.empty()) return 0;

    // dist[v] = longest chain ending at v, inclusive of v's own limit
    std::vector<int64_t> dist(tasks_.size(), 0);
    int64_t longest = 0;

    for (auto u : topological_order()) {
        int64_t best_parent = 0;
        for (auto p : predecessors_[u]) {
            best_parent = std::max(best_parent, dist[p]);
        }
        dist[u] = best_parent + tasks_[u].resources.time_limit_minutes;
        longest = std::max(longest, dist[u]);
    }

    return longest;
}

}  // namespace pipeflow
