/**
 * @file config.cpp
 * @brief Layered configuration loading using toml++.
 *
 * TOML documents are merged table-wise (later files win key by key), then
 * decoded onto the defaults. Environment variables and programmatic
 * overrides are applied last, through the same dotted-key setter.
 */

#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>
#include <unistd.h>

#include <toml++/toml.hpp>

namespace pipeflow {

namespace {

constexpr std::string_view kEnvPrefix = "FLOW_";
constexpr std::string_view kResourceEnvPrefix = "FLOW_RESOURCES_";

/// Scalar keys reachable through FLOW_* variables and --set overrides.
constexpr std::string_view kScalarKeys[] = {
    "flowdir",
    "start_from_scratch",
    "job_runner",
    "singularity_bin",
    "scheduler.max_cpus",
    "scheduler.max_memory_mb",
    "scheduler.max_parallel",
    "scheduler.failure_policy",
    "scheduler.cancel_policy",
    "executor.poll_interval_ms",
    "executor.summary_bytes",
    "executor.apply_memory_rlimit",
    "logging.level",
    "logging.log_dir",
    "logging.max_file_size_mb",
    "logging.rotate_count",
};

std::string to_lower(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string env_name_for(std::string_view key) {
    std::string out{kEnvPrefix};
    for (char c : key) {
        out += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

Error config_error(std::string_view key, std::string message) {
    return Error{ErrorCode::Config, std::move(message), {std::string{key}}};
}

Result<int64_t> parse_int(std::string_view key, std::string_view value) {
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return config_error(key, "expected an integer for " + std::string{key}
                                 + ", got '" + std::string{value} + "'");
    }
    return out;
}

Result<int64_t> parse_non_negative(std::string_view key, std::string_view value) {
    auto parsed = parse_int(key, value);
    if (!parsed) return parsed.error();
    if (*parsed < 0) {
        return config_error(key, std::string{key} + " must not be negative");
    }
    return *parsed;
}

Result<uint32_t> parse_count(std::string_view key, std::string_view value) {
    auto parsed = parse_non_negative(key, value);
    if (!parsed) return parsed.error();
    if (*parsed > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return config_error(key, std::string{key} + " is too large");
    }
    return static_cast<uint32_t>(*parsed);
}

Result<bool> parse_bool(std::string_view key, std::string_view value) {
    auto lowered = to_lower(value);
    if (lowered == "true" || lowered == "1" || lowered == "yes") return true;
    if (lowered == "false" || lowered == "0" || lowered == "no") return false;
    return config_error(key, "expected a boolean for " + std::string{key}
                             + ", got '" + std::string{value} + "'");
}

void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, node] : overlay) {
        if (const auto* overlay_table = node.as_table()) {
            if (auto* base_table = base.get_as<toml::table>(key.str())) {
                merge_tables(*base_table, *overlay_table);
                continue;
            }
        }
        node.visit([&base, k = key.str()](const auto& concrete) {
            base.insert_or_assign(k, concrete);
        });
    }
}

Result<void> merge_file(toml::table& merged, const std::filesystem::path& path) {
    if (path.empty() || !std::filesystem::exists(path)) return {};
    try {
        auto tbl = toml::parse_file(path.string());
        merge_tables(merged, tbl);
        return {};
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     "TOML parse error in " + path.string() + ": "
                         + std::string{err.description()},
                     {path.string()}};
    }
}

/// Unsigned 32-bit setting from TOML; absent keys keep `current`.
template <typename NodeView>
Result<uint32_t> read_count(NodeView node, std::string_view key, uint32_t current) {
    const int64_t value = node.value_or(int64_t{current});
    if (value < 0 || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return config_error(key, std::string{key} + " must be between 0 and "
                                 + std::to_string(std::numeric_limits<uint32_t>::max()));
    }
    return static_cast<uint32_t>(value);
}

Result<void> decode(const toml::table& tbl, Config& config) {
    config.flowdir = tbl["flowdir"].value_or(config.flowdir.string());
    config.start_from_scratch = tbl["start_from_scratch"].value_or(config.start_from_scratch);
    config.job_runner = tbl["job_runner"].value_or(config.job_runner);
    config.singularity_bin = tbl["singularity_bin"].value_or(config.singularity_bin);

    // [scheduler]
    if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
        config.scheduler.max_cpus =
            scheduler["max_cpus"].value_or(config.scheduler.max_cpus);
        config.scheduler.max_memory_mb =
            scheduler["max_memory_mb"].value_or(config.scheduler.max_memory_mb);
        auto max_parallel = read_count(scheduler["max_parallel"], "scheduler.max_parallel",
                                       config.scheduler.max_parallel);
        if (!max_parallel) return max_parallel.error();
        config.scheduler.max_parallel = *max_parallel;
        if (config.scheduler.max_cpus < 0 || config.scheduler.max_memory_mb < 0) {
            return config_error("scheduler", "scheduler budget must not be negative");
        }

        if (auto name = scheduler["failure_policy"].value<std::string>()) {
            auto policy = parse_failure_policy(*name);
            if (!policy) return policy.error();
            config.scheduler.failure_policy = *policy;
        }
        if (auto name = scheduler["cancel_policy"].value<std::string>()) {
            auto policy = parse_cancel_policy(*name);
            if (!policy) return policy.error();
            config.scheduler.cancel_policy = *policy;
        }
    }

    // [executor]
    if (auto executor = tbl["executor"]; executor.is_table()) {
        auto poll = read_count(executor["poll_interval_ms"], "executor.poll_interval_ms",
                               config.executor.poll_interval_ms);
        if (!poll) return poll.error();
        config.executor.poll_interval_ms = *poll;

        auto summary = read_count(executor["summary_bytes"], "executor.summary_bytes",
                                  config.executor.summary_bytes);
        if (!summary) return summary.error();
        config.executor.summary_bytes = *summary;
        config.executor.apply_memory_rlimit =
            executor["apply_memory_rlimit"].value_or(config.executor.apply_memory_rlimit);
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        config.logging.level = logging["level"].value_or(config.logging.level);
        config.logging.log_dir = logging["log_dir"].value_or(config.logging.log_dir.string());
        auto file_size = read_count(logging["max_file_size_mb"], "logging.max_file_size_mb",
                                    config.logging.max_file_size_mb);
        if (!file_size) return file_size.error();
        config.logging.max_file_size_mb = *file_size;

        auto rotate = read_count(logging["rotate_count"], "logging.rotate_count",
                                 config.logging.rotate_count);
        if (!rotate) return rotate.error();
        config.logging.rotate_count = *rotate;
    }

    // [resources.<analysis>]
    if (const auto* resources = tbl["resources"].as_table()) {
        for (auto&& [name, node] : *resources) {
            const auto* entry = node.as_table();
            if (!entry) {
                return config_error("resources." + std::string{name.str()},
                                    "resources." + std::string{name.str()} + " must be a table");
            }
            auto& res = config.resources[to_lower(name.str())];
            res.cpus = (*entry)["cpus"].value_or(res.cpus);
            res.memory_mb = (*entry)["memory"].value_or(res.memory_mb);
            res.time_limit_minutes = (*entry)["time"].value_or(res.time_limit_minutes);
            res.container = (*entry)["container"].value_or(res.container);
            res.extra_runtime_args =
                (*entry)["singularity_extra_args"].value_or(res.extra_runtime_args);
        }
    }

    return {};
}

Result<void> apply_resource_override(Config& config, std::string_view key,
                                     std::string_view value) {
    // resources.<name>.<field>
    auto rest = key.substr(std::string_view{"resources."}.size());
    auto dot = rest.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return config_error(key, "malformed resource key: " + std::string{key});
    }
    auto name = to_lower(rest.substr(0, dot));
    auto field = rest.substr(dot + 1);
    auto& res = config.resources[name];

    if (field == "container") {
        res.container = std::string{value};
        return {};
    }
    if (field == "singularity_extra_args") {
        res.extra_runtime_args = std::string{value};
        return {};
    }

    auto number = parse_int(key, value);
    if (!number) return number.error();
    if (field == "cpus") {
        res.cpus = *number;
    } else if (field == "memory") {
        res.memory_mb = *number;
    } else if (field == "time") {
        res.time_limit_minutes = *number;
    } else {
        return config_error(key, "unknown resource field: " + std::string{field});
    }
    return {};
}

Result<void> apply_environment(Config& config, const std::vector<std::string>& environment) {
    std::map<std::string, std::string, std::less<>> env;
    for (const auto& entry : environment) {
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }

    for (auto key : kScalarKeys) {
        if (auto it = env.find(env_name_for(key)); it != env.end()) {
            if (auto applied = apply_override(config, key, it->second); !applied) {
                return applied;
            }
        }
    }

    constexpr std::pair<std::string_view, std::string_view> kResourceFields[] = {
        {"_SINGULARITY_EXTRA_ARGS", "singularity_extra_args"},
        {"_CONTAINER", "container"},
        {"_MEMORY", "memory"},
        {"_CPUS", "cpus"},
        {"_TIME", "time"},
    };

    for (const auto& [name, value] : env) {
        if (!name.starts_with(kResourceEnvPrefix)) continue;
        std::string_view rest{name};
        rest.remove_prefix(kResourceEnvPrefix.size());
        for (const auto& [suffix, field] : kResourceFields) {
            if (rest.size() > suffix.size() && rest.ends_with(suffix)) {
                auto analysis = to_lower(rest.substr(0, rest.size() - suffix.size()));
                auto key = "resources." + analysis + "." + std::string{field};
                if (auto applied = apply_resource_override(config, key, value); !applied) {
                    return applied;
                }
                break;
            }
        }
    }
    return {};
}

toml::table to_toml(const Config& config) {
    toml::table resources;
    for (const auto& [name, res] : config.resources) {
        resources.insert_or_assign(name, toml::table{
            {"cpus", res.cpus},
            {"memory", res.memory_mb},
            {"time", res.time_limit_minutes},
            {"container", res.container},
            {"singularity_extra_args", res.extra_runtime_args},
        });
    }

    return toml::table{
        {"flowdir", config.flowdir.string()},
        {"start_from_scratch", config.start_from_scratch},
        {"job_runner", config.job_runner},
        {"singularity_bin", config.singularity_bin},
        {"scheduler", toml::table{
            {"max_cpus", config.scheduler.max_cpus},
            {"max_memory_mb", config.scheduler.max_memory_mb},
            {"max_parallel", int64_t{config.scheduler.max_parallel}},
            {"failure_policy", std::string{to_string(config.scheduler.failure_policy)}},
            {"cancel_policy", std::string{to_string(config.scheduler.cancel_policy)}},
        }},
        {"executor", toml::table{
            {"poll_interval_ms", int64_t{config.executor.poll_interval_ms}},
            {"summary_bytes", int64_t{config.executor.summary_bytes}},
            {"apply_memory_rlimit", config.executor.apply_memory_rlimit},
        }},
        {"logging", toml::table{
            {"level", config.logging.level},
            {"log_dir", config.logging.log_dir.string()},
            {"max_file_size_mb", int64_t{config.logging.max_file_size_mb}},
            {"rotate_count", int64_t{config.logging.rotate_count}},
        }},
        {"resources", std::move(resources)},
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Policies
// ─────────────────────────────────────────────

Result<FailurePolicy> parse_failure_policy(std::string_view name) {
    if (name == "fail_fast") return FailurePolicy::FailFast;
    if (name == "continue") return FailurePolicy::Continue;
    return config_error("scheduler.failure_policy",
                        "unknown failure policy: " + std::string{name});
}

Result<CancelPolicy> parse_cancel_policy(std::string_view name) {
    if (name == "drain") return CancelPolicy::Drain;
    if (name == "hard") return CancelPolicy::Hard;
    return config_error("scheduler.cancel_policy",
                        "unknown cancel policy: " + std::string{name});
}

// ─────────────────────────────────────────────
// Resource lookup
// ─────────────────────────────────────────────

Resources Config::partial_resources_for(std::string_view analysis_name) const {
    auto it = resources.find(to_lower(analysis_name));
    if (it == resources.end()) return Resources{};
    return it->second;
}

Result<Resources> Config::resources_for(std::string_view analysis_name) const {
    auto res = partial_resources_for(analysis_name);
    std::string name{analysis_name};

    if (res.cpus <= 0) {
        return make_error<Resources>(ErrorCode::MissingResourceSpec,
                                     "no cpus resource for " + name, {name, "cpus"});
    }
    if (res.memory_mb <= 0) {
        return make_error<Resources>(ErrorCode::MissingResourceSpec,
                                     "no memory resource for " + name, {name, "memory"});
    }
    if (res.time_limit_minutes <= 0) {
        return make_error<Resources>(ErrorCode::MissingResourceSpec,
                                     "no time resource for " + name, {name, "time"});
    }
    if (res.container.empty()) {
        return make_error<Resources>(ErrorCode::MissingResourceSpec,
                                     "no container resource for " + name, {name, "container"});
    }
    return res;
}

// ─────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────

ConfigSources default_sources() {
    ConfigSources sources;
    if (const char* home = std::getenv("HOME"); home && *home) {
        sources.user_file = std::filesystem::path{home} / ".config" / "flow" / "flow.toml";
    }
    for (char** env = environ; env && *env; ++env) {
        sources.environment.emplace_back(*env);
    }
    return sources;
}

Result<Config> load_config(const ConfigSources& sources) {
    toml::table merged;
    if (auto r = merge_file(merged, sources.user_file); !r) return r.error();
    if (auto r = merge_file(merged, sources.explicit_file); !r) return r.error();

    Config config = default_config();
    if (auto r = decode(merged, config); !r) return r.error();
    if (auto r = apply_environment(config, sources.environment); !r) return r.error();

    for (const auto& [key, value] : sources.overrides) {
        if (auto r = apply_override(config, key, value); !r) return r.error();
    }

    if (auto level = parse_log_level(config.logging.level); !level) {
        return level.error();
    }
    return config;
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string(),
                     {path.string()}};
    }
    ConfigSources sources;
    sources.explicit_file = path;
    return load_config(sources);
}

Config default_config() {
    return Config{};
}

Result<void> apply_override(Config& config, std::string_view key, std::string_view value) {
    if (key.starts_with("resources.")) {
        return apply_resource_override(config, key, value);
    }

    if (key == "flowdir") {
        config.flowdir = std::string{value};
    } else if (key == "start_from_scratch") {
        auto b = parse_bool(key, value);
        if (!b) return b.error();
        config.start_from_scratch = *b;
    } else if (key == "job_runner") {
        config.job_runner = std::string{value};
    } else if (key == "singularity_bin") {
        config.singularity_bin = std::string{value};
    } else if (key == "scheduler.max_cpus") {
        auto n = parse_non_negative(key, value);
        if (!n) return n.error();
        config.scheduler.max_cpus = *n;
    } else if (key == "scheduler.max_memory_mb") {
        auto n = parse_non_negative(key, value);
        if (!n) return n.error();
        config.scheduler.max_memory_mb = *n;
    } else if (key == "scheduler.max_parallel") {
        auto n = parse_count(key, value);
        if (!n) return n.error();
        config.scheduler.max_parallel = *n;
    } else if (key == "scheduler.failure_policy") {
        auto policy = parse_failure_policy(value);
        if (!policy) return policy.error();
        config.scheduler.failure_policy = *policy;
    } else if (key == "scheduler.cancel_policy") {
        auto policy = parse_cancel_policy(value);
        if (!policy) return policy.error();
        config.scheduler.cancel_policy = *policy;
    } else if (key == "executor.poll_interval_ms") {
        auto n = parse_count(key, value);
        if (!n) return n.error();
        config.executor.poll_interval_ms = *n;
    } else if (key == "executor.summary_bytes") {
        auto n = parse_count(key, value);
        if (!n) return n.error();
        config.executor.summary_bytes = *n;
    } else if (key == "executor.apply_memory_rlimit") {
        auto b = parse_bool(key, value);
        if (!b) return b.error();
        config.executor.apply_memory_rlimit = *b;
    } else if (key == "logging.level") {
        config.logging.level = std::string{value};
    } else if (key == "logging.log_dir") {
        config.logging.log_dir = std::string{value};
    } else if (key == "logging.max_file_size_mb") {
        auto n = parse_count(key, value);
        if (!n) return n.error();
        config.logging.max_file_size_mb = *n;
    } else if (key == "logging.rotate_count") {
        auto n = parse_count(key, value);
        if (!n) return n.error();
        config.logging.rotate_count = *n;
    } else {
        return config_error(key, "unknown configuration key: " + std::string{key});
    }
    return {};
}

Result<void> init_flowdir(const Config& config) {
    std::error_code ec;
    auto logs = config.flowdir / "logs";

    if (config.start_from_scratch) {
        std::filesystem::remove_all(logs, ec);
        if (ec) {
            return Error{ErrorCode::Io, "failed to clear " + logs.string() + ": " + ec.message(),
                         {logs.string()}};
        }
    }

    std::filesystem::create_directories(logs, ec);
    if (ec) {
        return Error{ErrorCode::Io,
                     "failed to create flowdir: " + config.flowdir.string() + ": " + ec.message(),
                     {config.flowdir.string()}};
    }
    return {};
}

Result<void> write_default_config(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "config file already exists: " + path.string(),
                     {path.string()}};
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream ofs(path);
    if (!ofs) {
        return Error{ErrorCode::Io, "cannot open " + path.string() + " for writing",
                     {path.string()}};
    }
    ofs << to_toml(default_config()) << '\n';
    if (!ofs) {
        return Error{ErrorCode::Io, "failed writing " + path.string(), {path.string()}};
    }
    return {};
}

}  // namespace pipeflow
