/**
 * @file task.cpp
 * @brief Task path freezing and labels.
 */

#include "workflow/task.hpp"

#include <filesystem>
#include <system_error>

namespace pipeflow {

namespace {

std::string absolutize(const std::string& path) {
    if (path.empty()) return path;
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    if (ec) return std::filesystem::path{path}.lexically_normal().string();
    return abs.lexically_normal().string();
}

}  // anonymous namespace

Task freeze_task(Task task) {
    for (auto& path : task.inputs) path = absolutize(path);
    for (auto& path : task.outputs) path = absolutize(path);
    return task;
}

std::string task_label(const Task& task, TaskIndex index) {
    return task.analysis_name + "#" + std::to_string(index);
}

}  // namespace pipeflow
