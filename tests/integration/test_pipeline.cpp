/**
 * @file test_pipeline.cpp
 * @brief Integration tests running workflows end to end with real processes.
 *
 * Uses the "shell" job runner so no container runtime is needed.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "engine/run_controller.hpp"
#include "executor/process_backend.hpp"
#include "support/fake_backend.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/run_journal.hpp"
#include "workflow/generator.hpp"
#include "workflow/queue.hpp"
#include "workflow/registry.hpp"
#include "workflow/workflow_file.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace pipeflow;
using namespace std::chrono_literals;
using test_support::CaptureSink;
using test_support::test_resources;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

}  // namespace

class PipelineIntegration : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    Config config_ = default_config();
    std::vector<std::string> log_lines_;
    Logger logger_{std::make_unique<CaptureSink>(log_lines_), LogLevel::Debug};

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
               / ("pipeflow_it_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_ / "work");

        config_.flowdir = dir_ / "flow";
        config_.job_runner = "shell";
        config_.scheduler.max_parallel = 4;
        config_.executor.poll_interval_ms = 1;
        ASSERT_TRUE(init_flowdir(config_).has_value());
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    ProcessBackend make_backend() {
        auto options = ProcessBackend::options_from(config_);
        EXPECT_TRUE(options.has_value());
        return ProcessBackend(options ? *options : ProcessBackend::Options{});
    }
};

TEST_F(PipelineIntegration, DiamondProducesEveryOutput) {
    auto backend = make_backend();
    RunController controller(config_, backend, logger_);

    Queue queue;
    for (auto& task : WorkflowGenerator::diamond(2, 3, dir_ / "work", test_resources())) {
        queue.add(std::move(task));
    }

    auto outcome = queue.run(controller, logger_);
    ASSERT_TRUE(outcome.has_value()) << outcome.error().describe();
    EXPECT_TRUE(outcome->success) << outcome->summary();
    EXPECT_EQ(outcome->succeeded_count(), queue.size());

    for (const auto& task : queue.tasks()) {
        EXPECT_TRUE(std::filesystem::exists(task.outputs.front())) << task.analysis_name;
    }
    // Source output flows through every stage into the final merge.
    EXPECT_NE(read_file(queue.tasks().back().outputs.front()).find("diamond_src"),
              std::string::npos);
}

TEST_F(PipelineIntegration, FailingCommandCascades) {
    auto backend = make_backend();
    RunController controller(config_, backend, logger_);

    const auto work = dir_ / "work";
    Queue queue;
    Task broken;
    broken.analysis_name = "broken";
    broken.command = "echo partial > '" + (work / "x").string() + "'; exit 7";
    broken.outputs = {(work / "x").string()};
    broken.resources = test_resources();
    queue.add(broken);

    Task downstream;
    downstream.analysis_name = "downstream";
    downstream.command = "cat '" + (work / "x").string() + "' > '" + (work / "y").string() + "'";
    downstream.inputs = {(work / "x").string()};
    downstream.outputs = {(work / "y").string()};
    downstream.resources = test_resources();
    queue.add(downstream);

    auto outcome = queue.run(controller, logger_);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(outcome->names(outcome->failed), (std::vector<std::string>{"broken"}));
    EXPECT_EQ(outcome->names(outcome->skipped), (std::vector<std::string>{"downstream"}));
    EXPECT_EQ(outcome->tasks[0].execution->exit_code, 7);
    EXPECT_FALSE(std::filesystem::exists(work / "y"));
}

TEST_F(PipelineIntegration, JournalFileRecordsRun) {
    auto backend = make_backend();
    RunJournal journal(std::make_unique<JsonFileSink>(config_.flowdir, "journal"));
    RunController controller(config_, backend, logger_, &journal);

    auto tasks = WorkflowGenerator::linear_chain(3, dir_ / "work", test_resources());
    auto outcome = controller.run(tasks);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success);

    auto contents = read_file(config_.flowdir / "journal.ndjson");
    EXPECT_NE(contents.find(R"("event":"run_started","tasks":3,"edges":2)"), std::string::npos);
    EXPECT_NE(contents.find(R"("task":"chain_2","index":2,"state":"succeeded")"),
              std::string::npos);
    EXPECT_NE(contents.find(R"("event":"run_finished","success":true)"), std::string::npos);
}

TEST_F(PipelineIntegration, DemoWorkflowRuns) {
    auto backend = make_backend();
    RunController controller(config_, backend, logger_);

    auto queue = builtin_workflows().build("demo", config_);
    ASSERT_TRUE(queue.has_value());
    auto outcome = queue->run(controller, logger_);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success) << outcome->summary();

    const auto demo = config_.flowdir / "demo";
    EXPECT_EQ(read_file(demo / "b.vcf"), "called\n");
    EXPECT_TRUE(std::filesystem::exists(demo / "c.txt"));
}

TEST_F(PipelineIntegration, WorkflowFileRuns) {
    const auto work = dir_ / "work";
    std::ofstream(dir_ / "flow.toml")
        << "[[task]]\n"
        << "name = \"make\"\n"
        << "command = \"printf data > '" << (work / "m").string() << "'\"\n"
        << "outputs = [\"" << (work / "m").string() << "\"]\n"
        << "[task.resources]\ncpus = 1\nmemory = 10\ntime = 1\ncontainer = \"none\"\n";

    auto queue = load_workflow(dir_ / "flow.toml", config_);
    ASSERT_TRUE(queue.has_value()) << queue.error().describe();

    auto backend = make_backend();
    RunController controller(config_, backend, logger_);
    auto outcome = queue->run(controller, logger_);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success);
    EXPECT_EQ(read_file(work / "m"), "data");
}

TEST_F(PipelineIntegration, HardCancelStopsLongTask) {
    config_.scheduler.cancel_policy = CancelPolicy::Hard;
    auto backend = make_backend();
    RunController controller(config_, backend, logger_);

    std::vector<Task> tasks(1);
    tasks[0].analysis_name = "forever";
    tasks[0].command = "sleep 60";
    tasks[0].outputs = {(dir_ / "work" / "never").string()};
    tasks[0].resources = test_resources();

    auto future = std::async(std::launch::async, [&] { return controller.run(tasks); });
    std::this_thread::sleep_for(200ms);
    controller.cancel();

    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    auto outcome = future.get();
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->cancel_requested);
    EXPECT_EQ(outcome->cancelled, (std::vector<TaskIndex>{0}));
}
