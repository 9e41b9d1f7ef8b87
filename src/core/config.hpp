/**
 * @file config.hpp
 * @brief Engine configuration with layered TOML/environment resolution.
 *
 * The resolved Config is built once at startup and passed by reference to
 * the components that need it; there is no process-wide instance.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pipeflow {

// ─────────────────────────────────────────────
// Policies
// ─────────────────────────────────────────────

enum class FailurePolicy : uint8_t {
    FailFast,      ///< Stop admitting work after the first failure
    Continue       ///< Keep running branches independent of the failure
};

enum class CancelPolicy : uint8_t {
    Drain,         ///< Let running tasks finish
    Hard           ///< Terminate running tasks
};

[[nodiscard]] constexpr std::string_view to_string(FailurePolicy policy) noexcept {
    return policy == FailurePolicy::FailFast ? "fail_fast" : "continue";
}

[[nodiscard]] constexpr std::string_view to_string(CancelPolicy policy) noexcept {
    return policy == CancelPolicy::Drain ? "drain" : "hard";
}

Result<FailurePolicy> parse_failure_policy(std::string_view name);
Result<CancelPolicy> parse_cancel_policy(std::string_view name);

// ─────────────────────────────────────────────
// Sections
// ─────────────────────────────────────────────

struct SchedulerConfig {
    int64_t max_cpus = 0;               ///< 0 = unlimited
    int64_t max_memory_mb = 0;          ///< 0 = unlimited
    uint32_t max_parallel = 0;          ///< 0 = hardware_concurrency
    FailurePolicy failure_policy = FailurePolicy::FailFast;
    CancelPolicy cancel_policy = CancelPolicy::Drain;
};

struct ExecutorConfig {
    uint32_t poll_interval_ms = 10;
    uint32_t summary_bytes = 4096;
    bool apply_memory_rlimit = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path log_dir;      ///< empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    std::filesystem::path flowdir = ".flow";
    bool start_from_scratch = false;
    std::string job_runner = "local";   ///< "local" (container) or "shell"
    std::string singularity_bin = "singularity";

    SchedulerConfig scheduler;
    ExecutorConfig executor;
    LoggingConfig logging;

    /// Per-analysis resources, keyed by lower-cased analysis name.
    std::map<std::string, Resources> resources;

    /**
     * @brief Complete resources for an analysis, or MissingResourceSpec
     *        naming the first absent field (cpus, memory, time, container).
     */
    [[nodiscard]] Result<Resources> resources_for(std::string_view analysis_name) const;

    /// Whatever is configured for the analysis; absent fields stay zero/empty.
    [[nodiscard]] Resources partial_resources_for(std::string_view analysis_name) const;
};

// ─────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────

/**
 * @brief Inputs to configuration resolution, lowest precedence first.
 */
struct ConfigSources {
    std::filesystem::path user_file;            ///< e.g. ~/.config/flow/flow.toml
    std::filesystem::path explicit_file;        ///< --config
    std::vector<std::string> environment;       ///< "KEY=VALUE" entries
    std::vector<std::pair<std::string, std::string>> overrides;  ///< dotted key → value
};

/**
 * @brief Sources for a normal process: $HOME user file and the process
 *        environment. No explicit file, no overrides.
 */
ConfigSources default_sources();

/**
 * @brief Resolve defaults → user file → explicit file → FLOW_* environment
 *        → overrides. Missing files are skipped; malformed ones are errors.
 */
Result<Config> load_config(const ConfigSources& sources);

/**
 * @brief Load a single TOML file on top of the defaults. The file must exist.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply one dotted-key override ("scheduler.max_cpus", "8").
 */
Result<void> apply_override(Config& config, std::string_view key, std::string_view value);

/**
 * @brief Create the flowdir (and its logs/ subdirectory).
 *
 * With start_from_scratch set, an existing logs/ directory is emptied first.
 */
Result<void> init_flowdir(const Config& config);

/**
 * @brief Write the default configuration as TOML. Refuses to overwrite.
 */
Result<void> write_default_config(const std::filesystem::path& path);

}  // namespace pipeflow
