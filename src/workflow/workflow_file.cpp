/**
 * @file workflow_file.cpp
 * @brief Workflow file loading using toml++.
 */

#include "workflow/workflow_file.hpp"

#include <string>
#include <vector>

#include <toml++/toml.hpp>

namespace pipeflow {

namespace {

Error invalid(std::string_view source, std::string message) {
    return Error{ErrorCode::InvalidWorkflow,
                 std::string{source} + ": " + std::move(message),
                 {std::string{source}}};
}

Result<std::vector<std::string>> read_paths(const toml::table& entry, std::string_view key,
                                            std::string_view source, const std::string& task) {
    std::vector<std::string> paths;
    auto node = entry[key];
    if (!node) return paths;

    const auto* array = node.as_array();
    if (!array) {
        return invalid(source, "task '" + task + "': " + std::string{key}
                               + " must be an array of strings");
    }
    for (const auto& element : *array) {
        auto path = element.value<std::string>();
        if (!path || path->empty()) {
            return invalid(source, "task '" + task + "': " + std::string{key}
                                   + " must contain non-empty strings");
        }
        paths.push_back(std::move(*path));
    }
    return paths;
}

Result<void> read_resources(const toml::table& entry, Resources& res,
                            std::string_view source, const std::string& task) {
    auto node = entry["resources"];
    if (!node) return {};

    const auto* table = node.as_table();
    if (!table) {
        return invalid(source, "task '" + task + "': resources must be a table");
    }
    res.cpus = (*table)["cpus"].value_or(res.cpus);
    res.memory_mb = (*table)["memory"].value_or(res.memory_mb);
    res.time_limit_minutes = (*table)["time"].value_or(res.time_limit_minutes);
    res.container = (*table)["container"].value_or(res.container);
    res.extra_runtime_args =
        (*table)["singularity_extra_args"].value_or(res.extra_runtime_args);
    return {};
}

Result<Queue> decode_workflow(const toml::table& doc, const Config& config,
                              std::string_view source) {
    Queue queue;
    auto tasks_node = doc["task"];
    if (!tasks_node) return queue;

    const auto* tasks = tasks_node.as_array();
    if (!tasks) {
        return invalid(source, "'task' must be an array of tables ([[task]])");
    }

    size_t position = 0;
    for (const auto& element : *tasks) {
        ++position;
        const auto* entry = element.as_table();
        if (!entry) {
            return invalid(source, "task entry " + std::to_string(position) + " is not a table");
        }

        auto name = (*entry)["name"].value<std::string>();
        if (!name || name->empty()) {
            return invalid(source, "task entry " + std::to_string(position) + " has no name");
        }
        auto command = (*entry)["command"].value<std::string>();
        if (!command || command->empty()) {
            return invalid(source, "task '" + *name + "' has no command");
        }

        Task task;
        task.analysis_name = *name;
        task.command = *command;
        task.resources = config.partial_resources_for(*name);

        auto inputs = read_paths(*entry, "inputs", source, *name);
        if (!inputs) return inputs.error();
        task.inputs = std::move(*inputs);

        auto outputs = read_paths(*entry, "outputs", source, *name);
        if (!outputs) return outputs.error();
        task.outputs = std::move(*outputs);

        if (auto r = read_resources(*entry, task.resources, source, *name); !r) {
            return r.error();
        }
        queue.add(std::move(task));
    }
    return queue;
}

}  // anonymous namespace

Result<Queue> parse_workflow(std::string_view text, const Config& config,
                             std::string_view source) {
    try {
        auto doc = toml::parse(text, source);
        return decode_workflow(doc, config, source);
    } catch (const toml::parse_error& err) {
        return invalid(source, "TOML parse error: " + std::string{err.description()});
    }
}

Result<Queue> load_workflow(const std::filesystem::path& path, const Config& config) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error{ErrorCode::Io, "Workflow file not found: " + path.string(),
                     {path.string()}};
    }
    try {
        auto doc = toml::parse_file(path.string());
        return decode_workflow(doc, config, path.string());
    } catch (const toml::parse_error& err) {
        return invalid(path.string(), "TOML parse error: " + std::string{err.description()});
    }
}

}  // namespace pipeflow
