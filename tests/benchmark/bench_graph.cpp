/**
 * @file bench_graph.cpp
 * @brief Performance benchmarks for graph construction, scheduling overhead
 *        and process launch.
 *
 * Usage: ./bench_graph [--csv]
 */

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/process_backend.hpp"
#include "executor/thread_pool.hpp"
#include "graph/dependency_graph.hpp"
#include "scheduler/scheduler.hpp"
#include "validation/resource_validator.hpp"
#include "workflow/generator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace pipeflow;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Resources bench_resources() {
    return Resources{1, 100, 10, "bench.sif", ""};
}

/// Completes every task immediately.
class InstantBackend : public IExecutionBackend {
public:
    ExecutionResult execute(const Task&, std::stop_token) override {
        ExecutionResult r;
        r.final_state = TaskState::Succeeded;
        r.exit_code = 0;
        return r;
    }
    [[nodiscard]] std::string_view name() const noexcept override { return "instant"; }
};

class DiscardSink : public ILogSink {
public:
    void write(std::string_view) override {}
    void flush() override {}
};

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_graph() {
    std::vector<BenchResult> R;
    constexpr size_t N = 200;
    const std::filesystem::path dir = "/bench";

    for (size_t n : {10, 100, 1000}) {
        auto tasks = WorkflowGenerator::linear_chain(n, dir, bench_resources());
        R.push_back(run_bench("build_chain(" + std::to_string(n) + ")", "Graph Construction", N,
            [&]{ auto g = DependencyGraph::build(tasks); (void)g; },
            std::to_string(n) + " tasks"));
    }

    for (size_t w : {10, 100, 500}) {
        auto tasks = WorkflowGenerator::fan_out_fan_in(w, dir, bench_resources());
        R.push_back(run_bench("build_fan(" + std::to_string(w) + ")", "Graph Construction", N,
            [&]{ auto g = DependencyGraph::build(tasks); (void)g; },
            std::to_string(w + 2) + " tasks"));
    }

    std::mt19937 rng(1234);
    auto random = WorkflowGenerator::random_dag(500, 0.02f, dir, bench_resources(), rng);
    R.push_back(run_bench("build_random(500)", "Graph Construction", N,
        [&]{ auto g = DependencyGraph::build(random); (void)g; }, "p=0.02"));
    R.push_back(run_bench("validate_resources(500)", "Graph Construction", N,
        [&]{ auto v = validate_resources(random); (void)v; }, "500 tasks"));

    auto graph = DependencyGraph::build(random);
    if (!graph) return R;

    R.push_back(run_bench("topo_order(500)", "Graph Analysis", N,
        [&]{ auto o = graph->topological_order(); (void)o; }, "500 tasks"));
    R.push_back(run_bench("critical_path(500)", "Graph Analysis", N,
        [&]{ auto c = graph->critical_path_minutes(); (void)c; }, "500 tasks"));
    R.push_back(run_bench("descendants(root)", "Graph Analysis", N,
        [&]{ auto d = graph->descendants(0); (void)d; }, "500 tasks"));

    return R;
}

std::vector<BenchResult> bench_scheduling() {
    std::vector<BenchResult> R;
    InstantBackend backend;
    Logger logger(std::make_unique<DiscardSink>(), LogLevel::Error);
    const std::filesystem::path dir = "/bench";

    for (size_t n : {10, 100, 500}) {
        auto tasks = WorkflowGenerator::fan_out_fan_in(n, dir, bench_resources());
        auto graph = DependencyGraph::build(tasks);
        if (!graph) continue;

        for (size_t parallel : {1, 4}) {
            SchedulerOptions options;
            options.max_parallel = parallel;
            ThreadPool pool(parallel);
            R.push_back(run_bench("schedule_fan(" + std::to_string(n) + ", p="
                                      + std::to_string(parallel) + ")",
                                  "Scheduling", 50,
                [&]{
                    Scheduler s(*graph, backend, pool, options, logger);
                    auto o = s.run();
                    (void)o;
                },
                std::to_string(n + 2) + " tasks"));
        }
    }

    return R;
}

std::vector<BenchResult> bench_executor() {
    std::vector<BenchResult> R;

    ThreadPool tpool(4);
    R.push_back(run_bench("threadpool_submit", "Executor", 500, [&]{
        std::promise<void> p; auto f = p.get_future();
        (void)tpool.submit([&p]{ p.set_value(); }); f.wait();
    }));

    ProcessBackend::Options options;
    options.job_runner = "shell";
    options.poll_interval = std::chrono::milliseconds{1};
    ProcessBackend backend(options);
    Task task;
    task.analysis_name = "bench_true";
    task.command = "true";
    task.resources = bench_resources();
    std::stop_source ss;
    R.push_back(run_bench("process_spawn(sh -c true)", "Executor", 50,
        [&]{ auto r = backend.execute(task, ss.get_token()); (void)r; }, "fork+exec+reap"));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  pipeflow Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_graph());
    append(bench_scheduling());
    append(bench_executor());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
