/**
 * @file registry.hpp
 * @brief Statically linked workflow definitions looked up by name.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "workflow/queue.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pipeflow {

/**
 * @brief Name → workflow function table.
 *
 * A workflow is a plain function that appends tasks to a queue, using the
 * resolved configuration for resource lookup.
 */
class WorkflowRegistry {
public:
    using WorkflowFn = std::function<Result<void>(Queue&, const Config&)>;

    struct Entry {
        std::string description;
        WorkflowFn build;
    };

    /// Fails with InvalidWorkflow if the name is taken or the function empty.
    Result<void> add(std::string name, std::string description, WorkflowFn build);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] const Entry* find(std::string_view name) const;

    /// Run the named workflow function into a fresh queue.
    Result<Queue> build(std::string_view name, const Config& config) const;

private:
    std::map<std::string, Entry, std::less<>> entries_;
};

/**
 * @brief Registry holding the built-in workflows ("demo").
 */
WorkflowRegistry builtin_workflows();

/**
 * @brief A → {B, C} demo: A writes a.bam, B and C each consume it.
 *
 * Files live under `<flowdir>/demo`. Resources come from the configuration
 * when present, otherwise one cpu, 64 MB and one minute.
 */
Result<void> demo_workflow(Queue& queue, const Config& config);

}  // namespace pipeflow
