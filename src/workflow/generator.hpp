/**
 * @file generator.hpp
 * @brief Synthetic workflow generators for testing, benchmarking and demos.
 */

#pragma once

#include "workflow/task.hpp"

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace pipeflow {

/**
 * @brief Factory for synthetic task lists with various topologies.
 *
 * Every task writes `<dir>/<name>.out`; dependencies are expressed only
 * through those paths. Commands are POSIX shell that concatenate the
 * task's inputs into its output, so generated workflows run unchanged
 * under the "shell" job runner.
 */
class WorkflowGenerator {
public:
    /// Linear chain: T0 → T1 → ... → Tn-1
    static std::vector<Task> linear_chain(size_t num_tasks,
                                          const std::filesystem::path& dir,
                                          Resources resources);

    /// Fan-out / fan-in: src → {branch_0 .. branch_w-1} → sink
    static std::vector<Task> fan_out_fan_in(size_t width,
                                            const std::filesystem::path& dir,
                                            Resources resources);

    /// Repeated fan-out/fan-in, one stage per depth level
    static std::vector<Task> diamond(size_t depth, size_t width,
                                     const std::filesystem::path& dir,
                                     Resources resources);

    /// Random DAG; edges only run from lower to higher index
    static std::vector<Task> random_dag(size_t num_tasks,
                                        float edge_probability,
                                        const std::filesystem::path& dir,
                                        Resources resources,
                                        std::mt19937& rng);

    /// Shell command that writes `inputs` (or the task name) into `output`.
    static std::string concat_command(const std::string& name,
                                      const std::vector<std::string>& inputs,
                                      const std::string& output);
};

}  // namespace pipeflow
