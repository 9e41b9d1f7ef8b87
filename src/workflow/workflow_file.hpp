/**
 * @file workflow_file.hpp
 * @brief Declarative workflow definitions in TOML.
 *
 * Format:
 *   [[task]]
 *   name     = "bwa"
 *   command  = "bwa mem ref.fa reads.fq > aln.sam"
 *   inputs   = ["ref.fa", "reads.fq"]
 *   outputs  = ["aln.sam"]
 *
 *   [task.resources]          # optional, field-wise over [resources.bwa]
 *   cpus = 4
 *
 * Relative paths are resolved against the current working directory when
 * the task is added to the queue.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "workflow/queue.hpp"

#include <filesystem>
#include <string_view>

namespace pipeflow {

/**
 * @brief Load a workflow file into a queue.
 *
 * Fails with Io if the file cannot be read and with InvalidWorkflow if it
 * is not valid TOML or a task entry is malformed. Incomplete resources are
 * not an error here; the run reports them as MissingResourceSpec.
 */
Result<Queue> load_workflow(const std::filesystem::path& path, const Config& config);

/// Same as load_workflow, from TOML text. `source` names it in errors.
Result<Queue> parse_workflow(std::string_view text, const Config& config,
                             std::string_view source = "<string>");

}  // namespace pipeflow
