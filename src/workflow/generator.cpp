/**
 * @file generator.cpp
 * @brief Synthetic workflow generator, all topology implementations.
 *
 * Generates task lists that model common pipeline shapes:
 * - Linear chains (sequential per-sample processing)
 * - Fan-out/fan-in (scatter over regions, then merge)
 * - Diamond (several scatter/gather stages)
 * - Random DAGs (for stress testing and benchmarking)
 */

#include "workflow/generator.hpp"

#include <string>
#include <utility>

namespace pipeflow {

namespace {

Task make_task(std::string name, std::vector<std::string> inputs,
               const std::filesystem::path& dir, const Resources& resources) {
    Task task;
    std::string output = (dir / (name + ".out")).string();
    task.command = WorkflowGenerator::concat_command(name, inputs, output);
    task.analysis_name = std::move(name);
    task.inputs = std::move(inputs);
    task.outputs = {std::move(output)};
    task.resources = resources;
    return task;
}

}  // anonymous namespace

std::string WorkflowGenerator::concat_command(const std::string& name,
                                              const std::vector<std::string>& inputs,
                                              const std::string& output) {
    if (inputs.empty()) {
        return "echo '" + name + "' > '" + output + "'";
    }
    std::string cmd = "cat";
    for (const auto& in : inputs) cmd += " '" + in + "'";
    cmd += " > '" + output + "'";
    return cmd;
}

// ─────────────────────────────────────────────
// Linear Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

std::vector<Task> WorkflowGenerator::linear_chain(size_t num_tasks,
                                                  const std::filesystem::path& dir,
                                                  Resources resources) {
    std::vector<Task> tasks;
    tasks.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        std::vector<std::string> inputs;
        if (i > 0) inputs.push_back(tasks.back().outputs.front());
        tasks.push_back(make_task("chain_" + std::to_string(i), std::move(inputs),
                                  dir, resources));
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          src
//       /   |   \   (backslash)
//     b_0  b_1  b_2  ... b_{width-1}
//       \   |   /
//          sink
// ─────────────────────────────────────────────

std::vector<Task> WorkflowGenerator::fan_out_fan_in(size_t width,
                                                    const std::filesystem::path& dir,
                                                    Resources resources) {
    std::vector<Task> tasks;
    tasks.reserve(width + 2);

    tasks.push_back(make_task("fan_src", {}, dir, resources));
    const std::string src_out = tasks.front().outputs.front();

    std::vector<std::string> branch_outputs;
    for (size_t i = 0; i < width; ++i) {
        tasks.push_back(make_task("fan_branch_" + std::to_string(i), {src_out},
                                  dir, resources));
        branch_outputs.push_back(tasks.back().outputs.front());
    }

    tasks.push_back(make_task("fan_sink", std::move(branch_outputs), dir, resources));
    return tasks;
}

// ─────────────────────────────────────────────
// Diamond: depth levels of fan-out/fan-in
// ─────────────────────────────────────────────

std::vector<Task> WorkflowGenerator::diamond(size_t depth, size_t width,
                                             const std::filesystem::path& dir,
                                             Resources resources) {
    std::vector<Task> tasks;

    tasks.push_back(make_task("diamond_src", {}, dir, resources));
    std::string join = tasks.back().outputs.front();

    for (size_t level = 0; level < depth; ++level) {
        const std::string prefix = "d" + std::to_string(level) + "_";

        std::vector<std::string> level_outputs;
        for (size_t i = 0; i < width; ++i) {
            tasks.push_back(make_task(prefix + "w" + std::to_string(i), {join},
                                      dir, resources));
            level_outputs.push_back(tasks.back().outputs.front());
        }

        tasks.push_back(make_task(prefix + "merge", std::move(level_outputs), dir, resources));
        join = tasks.back().outputs.front();
    }
    return tasks;
}

// ─────────────────────────────────────────────
// Random DAG: each earlier task feeds a later one with the given probability
// ─────────────────────────────────────────────

std::vector<Task> WorkflowGenerator::random_dag(size_t num_tasks,
                                                float edge_probability,
                                                const std::filesystem::path& dir,
                                                Resources resources,
                                                std::mt19937& rng) {
    std::uniform_real_distribution<float> coin(0.0f, 1.0f);
    std::vector<Task> tasks;
    tasks.reserve(num_tasks);

    for (size_t i = 0; i < num_tasks; ++i) {
        std::vector<std::string> inputs;
        for (size_t j = 0; j < i; ++j) {
            if (coin(rng) < edge_probability) {
                inputs.push_back(tasks[j].outputs.front());
            }
        }
        tasks.push_back(make_task("rand_" + std::to_string(i), std::move(inputs),
                                  dir, resources));
    }
    return tasks;
}

}  // namespace pipeflow
