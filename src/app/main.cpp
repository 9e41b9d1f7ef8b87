/**
 * @file main.cpp
 * @brief pipeflow command-line entry point.
 *
 * Wires the modules into one run:
 *   Config → Logger → Queue (workflow file or built-in) → RunController
 *   → ProcessBackend, with the RunJournal recording every transition.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/run_controller.hpp"
#include "executor/process_backend.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/run_journal.hpp"
#include "workflow/queue.hpp"
#include "workflow/registry.hpp"
#include "workflow/workflow_file.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace pipeflow;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_cancel_requested = 0;

void signal_handler(int /*signal*/) {
    g_cancel_requested = 1;
}

void print_usage(std::ostream& out) {
    out << "Usage:\n"
        << "  pipeflow run <workflow.toml> [OPTIONS]   Execute a workflow file\n"
        << "  pipeflow demo [OPTIONS]                  Run the built-in demo workflow\n"
        << "  pipeflow init-config <path>              Write the default configuration\n"
        << "\n"
        << "Options:\n"
        << "  --config <path>      Configuration file (over ~/.config/flow/flow.toml)\n"
        << "  --set <key=value>    Override a configuration key, repeatable\n"
        << "  --flowdir <path>     Work and log directory (default: .flow)\n"
        << "  --help, -h           Show this help message\n";
}

struct CLIArgs {
    std::string command;
    std::filesystem::path target;
    std::filesystem::path config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    bool help = false;
};

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--config" || arg == "--set" || arg == "--flowdir") {
            if (i + 1 >= argc) {
                return Error{ErrorCode::Config, arg + " needs a value"};
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                args.config_path = value;
            } else if (arg == "--flowdir") {
                args.overrides.emplace_back("flowdir", value);
            } else {
                auto eq = value.find('=');
                if (eq == std::string::npos || eq == 0) {
                    return Error{ErrorCode::Config, "--set expects key=value, got '" + value + "'"};
                }
                args.overrides.emplace_back(value.substr(0, eq), value.substr(eq + 1));
            }
        } else if (arg.starts_with("-")) {
            return Error{ErrorCode::Config, "unknown option: " + arg};
        } else if (args.command.empty()) {
            args.command = arg;
        } else if (args.target.empty()) {
            args.target = arg;
        } else {
            return Error{ErrorCode::Config, "unexpected argument: " + arg};
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_log_sink(const Config& config) {
    if (config.logging.log_dir.empty()) {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(config.logging.log_dir, "pipeflow",
                                          config.logging.max_file_size_mb,
                                          config.logging.rotate_count);
}

void print_summary(const RunOutcome& outcome, std::ostream& out) {
    out << "\n" << std::left
        << std::setw(6) << "#" << std::setw(24) << "TASK" << std::setw(12) << "STATE"
        << std::setw(6) << "EXIT" << "DURATION\n";

    for (const auto& report : outcome.tasks) {
        out << std::setw(6) << report.index
            << std::setw(24) << report.analysis_name
            << std::setw(12) << to_string(report.state);
        if (report.execution) {
            out << std::setw(6) << report.execution->exit_code
                << report.execution->duration.count() << " ms";
        } else {
            out << std::setw(6) << "-" << "-";
        }
        if (!report.reason.empty()) out << "  (" << report.reason << ")";
        out << "\n";
    }

    auto join = [](const std::vector<std::string>& names) {
        std::string s;
        for (const auto& n : names) s += (s.empty() ? "" : ", ") + n;
        return s;
    };
    if (!outcome.failed.empty()) out << "Failed:  " << join(outcome.names(outcome.failed)) << "\n";
    if (!outcome.skipped.empty()) out << "Skipped: " << join(outcome.names(outcome.skipped)) << "\n";
    if (!outcome.cancelled.empty()) {
        out << "Cancelled: " << join(outcome.names(outcome.cancelled)) << "\n";
    }
    out << outcome.summary() << " in " << outcome.wall_time.count() << " ms\n";
}

int execute(const CLIArgs& args) {
    // ── Resolve configuration ────────────────
    auto sources = default_sources();
    sources.explicit_file = args.config_path;
    if (args.command == "demo") {
        // The demo uses plain shell commands unless told otherwise.
        sources.overrides.emplace_back("job_runner", "shell");
    }
    for (const auto& kv : args.overrides) sources.overrides.push_back(kv);

    if (!args.config_path.empty() && !std::filesystem::exists(args.config_path)) {
        std::cerr << "Configuration file not found: " << args.config_path.string()
                  << ", continuing without it" << std::endl;
    }

    auto config_result = load_config(sources);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().describe() << std::endl;
        return kExitUsage;
    }
    const Config config = std::move(*config_result);

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.logging.level);
    Logger logger(make_log_sink(config), level.value_or(LogLevel::Info));

    if (auto dir = init_flowdir(config); !dir) {
        logger.error(dir.error().describe());
        return kExitUsage;
    }
    logger.debug("Flow directory: " + config.flowdir.string()
                 + ", job runner: " + config.job_runner
                 + ", failure policy: " + std::string{to_string(config.scheduler.failure_policy)});

    RunJournal journal(std::make_unique<JsonFileSink>(config.flowdir, "journal",
                                                      config.logging.max_file_size_mb,
                                                      config.logging.rotate_count));

    // ── Build the queue ──────────────────────
    Result<Queue> queue = args.command == "demo"
        ? builtin_workflows().build("demo", config)
        : load_workflow(args.target, config);
    if (!queue) {
        logger.error(queue.error().describe());
        std::cerr << queue.error().describe() << std::endl;
        return kExitUsage;
    }

    // ── Initialize Executor ──────────────────
    auto backend_options = ProcessBackend::options_from(config);
    if (!backend_options) {
        logger.error(backend_options.error().describe());
        std::cerr << backend_options.error().describe() << std::endl;
        return kExitUsage;
    }
    ProcessBackend backend(std::move(*backend_options));
    RunController controller(config, backend, logger, &journal);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::jthread signal_watcher([&controller, &logger](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_cancel_requested) {
                logger.warn("Signal received, cancelling run");
                controller.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    // ── Run ──────────────────────────────────
    auto outcome = queue->run(controller, logger);

    signal_watcher.request_stop();
    signal_watcher.join();
    logger.flush();

    if (!outcome) {
        std::cerr << outcome.error().describe() << std::endl;
        return kExitUsage;
    }

    print_summary(*outcome, std::cout);
    return outcome->success ? kExitSuccess : kExitRunFailed;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().message << "\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    if (args->help || args->command.empty()) {
        print_usage(args->help ? std::cout : std::cerr);
        return args->help ? kExitSuccess : kExitUsage;
    }

    if (args->command == "init-config") {
        if (args->target.empty()) {
            std::cerr << "init-config needs a path\n";
            return kExitUsage;
        }
        if (auto written = write_default_config(args->target); !written) {
            std::cerr << written.error().describe() << std::endl;
            return kExitUsage;
        }
        std::cout << "Wrote default configuration to " << args->target.string() << std::endl;
        return kExitSuccess;
    }

    if (args->command == "run") {
        if (args->target.empty()) {
            std::cerr << "run needs a workflow file\n\n";
            print_usage(std::cerr);
            return kExitUsage;
        }
        return execute(*args);
    }

    if (args->command == "demo") {
        return execute(*args);
    }

    std::cerr << "unknown command: " << args->command << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}
