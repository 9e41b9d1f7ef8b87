/**
 * @file registry.cpp
 * @brief WorkflowRegistry and the built-in workflows.
 */

#include "workflow/registry.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace pipeflow {

namespace {

constexpr std::string_view kDemoContainer = "docker://alpine:3";

Resources demo_resources(const Config& config, std::string_view name) {
    Resources res = config.partial_resources_for(name);
    if (res.cpus <= 0) res.cpus = 1;
    if (res.memory_mb <= 0) res.memory_mb = 64;
    if (res.time_limit_minutes <= 0) res.time_limit_minutes = 1;
    if (res.container.empty()) res.container = std::string{kDemoContainer};
    return res;
}

}  // anonymous namespace

Result<void> WorkflowRegistry::add(std::string name, std::string description,
                                   WorkflowFn build) {
    if (!build) {
        return Error{ErrorCode::InvalidWorkflow, "workflow '" + name + "' has no body", {name}};
    }
    if (entries_.contains(name)) {
        return Error{ErrorCode::InvalidWorkflow,
                     "workflow '" + name + "' is already registered", {name}};
    }
    entries_.emplace(std::move(name), Entry{std::move(description), std::move(build)});
    return {};
}

bool WorkflowRegistry::contains(std::string_view name) const {
    return entries_.find(name) != entries_.end();
}

std::vector<std::string> WorkflowRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) out.push_back(name);
    return out;
}

const WorkflowRegistry::Entry* WorkflowRegistry::find(std::string_view name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

Result<Queue> WorkflowRegistry::build(std::string_view name, const Config& config) const {
    const Entry* entry = find(name);
    if (!entry) {
        return make_error<Queue>(ErrorCode::InvalidWorkflow,
                                 "unknown workflow: " + std::string{name},
                                 {std::string{name}});
    }
    Queue queue;
    if (auto built = entry->build(queue, config); !built) return built.error();
    return queue;
}

// ─────────────────────────────────────────────
// Built-in workflows
// ─────────────────────────────────────────────

Result<void> demo_workflow(Queue& queue, const Config& config) {
    const auto dir = config.flowdir / "demo";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::Io, "cannot create " + dir.string() + ": " + ec.message(),
                     {dir.string()}};
    }

    const std::string bam = (dir / "a.bam").string();
    const std::string vcf = (dir / "b.vcf").string();
    const std::string txt = (dir / "c.txt").string();

    queue.add(Task{
        .analysis_name = "align",
        .command = "echo aligned > '" + bam + "'",
        .inputs = {},
        .outputs = {bam},
        .resources = demo_resources(config, "align"),
    });
    queue.add(Task{
        .analysis_name = "call",
        .command = "sed 's/aligned/called/' '" + bam + "' > '" + vcf + "'",
        .inputs = {bam},
        .outputs = {vcf},
        .resources = demo_resources(config, "call"),
    });
    queue.add(Task{
        .analysis_name = "stats",
        .command = "wc -c < '" + bam + "' > '" + txt + "'",
        .inputs = {bam},
        .outputs = {txt},
        .resources = demo_resources(config, "stats"),
    });
    return {};
}

WorkflowRegistry builtin_workflows() {
    WorkflowRegistry registry;
    // The table is fresh, so registration cannot collide.
    (void)registry.add("demo", "align -> {call, stats} on generated files", demo_workflow);
    return registry;
}

}  // namespace pipeflow
