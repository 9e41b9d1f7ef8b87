/**
 * @file test_config.cpp
 * @brief Unit tests for layered configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace pipeflow;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path()
                    / ("pipeflow_test_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& name, const std::string& content) {
        auto path = temp_dir_ / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.flowdir.string(), ".flow");
    EXPECT_FALSE(config.start_from_scratch);
    EXPECT_EQ(config.job_runner, "local");
    EXPECT_EQ(config.singularity_bin, "singularity");
    EXPECT_EQ(config.scheduler.max_cpus, 0);
    EXPECT_EQ(config.scheduler.max_memory_mb, 0);
    EXPECT_EQ(config.scheduler.failure_policy, FailurePolicy::FailFast);
    EXPECT_EQ(config.scheduler.cancel_policy, CancelPolicy::Drain);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.resources.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml("full.toml", R"(
        flowdir = "/tmp/work"
        job_runner = "shell"

        [scheduler]
        max_cpus = 16
        max_memory_mb = 64000
        max_parallel = 4
        failure_policy = "continue"
        cancel_policy = "hard"

        [executor]
        poll_interval_ms = 5
        summary_bytes = 128

        [logging]
        level = "debug"

        [resources.BWA]
        cpus = 4
        memory = 8000
        time = 60
        container = "/images/bwa.sif"
        singularity_extra_args = "--bind /data"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    const auto& config = *result;
    EXPECT_EQ(config.flowdir.string(), "/tmp/work");
    EXPECT_EQ(config.job_runner, "shell");
    EXPECT_EQ(config.scheduler.max_cpus, 16);
    EXPECT_EQ(config.scheduler.max_memory_mb, 64000);
    EXPECT_EQ(config.scheduler.max_parallel, 4u);
    EXPECT_EQ(config.scheduler.failure_policy, FailurePolicy::Continue);
    EXPECT_EQ(config.scheduler.cancel_policy, CancelPolicy::Hard);
    EXPECT_EQ(config.executor.poll_interval_ms, 5u);
    EXPECT_EQ(config.executor.summary_bytes, 128u);
    EXPECT_EQ(config.logging.level, "debug");

    auto bwa = config.resources_for("bwa");
    ASSERT_TRUE(bwa.has_value());
    EXPECT_EQ(bwa->cpus, 4);
    EXPECT_EQ(bwa->memory_mb, 8000);
    EXPECT_EQ(bwa->time_limit_minutes, 60);
    EXPECT_EQ(bwa->container, "/images/bwa.sif");
    EXPECT_EQ(bwa->extra_runtime_args, "--bind /data");
}

TEST_F(ConfigTest, MissingExplicitFileIsError) {
    auto result = load_config(temp_dir_ / "nonexistent.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, MissingLayerFilesAreSkipped) {
    ConfigSources sources;
    sources.user_file = temp_dir_ / "absent-user.toml";
    sources.explicit_file = temp_dir_ / "absent.toml";
    auto result = load_config(sources);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->flowdir.string(), ".flow");
}

TEST_F(ConfigTest, MalformedTomlIsError) {
    auto path = write_toml("bad.toml", "[scheduler\nmax_cpus = ");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, UnknownPolicyIsError) {
    auto path = write_toml("policy.toml", R"(
        [scheduler]
        failure_policy = "sometimes"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, NegativeCountsInFileAreRejected) {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"scheduler", "max_parallel = -1"},
        {"executor", "poll_interval_ms = -1"},
        {"executor", "summary_bytes = -4096"},
        {"logging", "max_file_size_mb = -50"},
        {"logging", "rotate_count = 4294967296"},
    };
    for (const auto& [section, line] : cases) {
        auto path = write_toml("counts.toml", "[" + section + "]\n" + line + "\n");
        auto result = load_config(path);
        ASSERT_FALSE(result.has_value()) << line;
        EXPECT_EQ(result.error().code, ErrorCode::Config) << line;
    }

    auto path = write_toml("counts.toml", "[executor]\npoll_interval_ms = 0\n");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->executor.poll_interval_ms, 0u);
}

TEST_F(ConfigTest, OversizedCountOverrideIsRejected) {
    Config config = default_config();
    auto result = apply_override(config, "executor.summary_bytes", "5000000000");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
    EXPECT_EQ(config.executor.summary_bytes, 4096u);
}

TEST_F(ConfigTest, UnknownLogLevelIsError) {
    ConfigSources sources;
    sources.overrides = {{"logging.level", "loud"}};
    auto result = load_config(sources);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, LayersMergeTableWise) {
    ConfigSources sources;
    sources.user_file = write_toml("user.toml", R"(
        [scheduler]
        max_cpus = 8
        max_memory_mb = 1000

        [resources.bwa]
        cpus = 2
        memory = 500
        time = 10
        container = "user.sif"
    )");
    sources.explicit_file = write_toml("explicit.toml", R"(
        [scheduler]
        max_cpus = 32

        [resources.bwa]
        container = "explicit.sif"
    )");

    auto result = load_config(sources);
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(result->scheduler.max_cpus, 32);
    EXPECT_EQ(result->scheduler.max_memory_mb, 1000);

    auto bwa = result->resources_for("bwa");
    ASSERT_TRUE(bwa.has_value());
    EXPECT_EQ(bwa->cpus, 2);
    EXPECT_EQ(bwa->container, "explicit.sif");
}

TEST_F(ConfigTest, EnvironmentOverridesFiles) {
    ConfigSources sources;
    sources.explicit_file = write_toml("env.toml", R"(
        [scheduler]
        max_cpus = 4
    )");
    sources.environment = {
        "HOME=/root",
        "FLOW_SCHEDULER_MAX_CPUS=12",
        "FLOW_JOB_RUNNER=shell",
        "FLOW_RESOURCES_BWA_CPUS=3",
        "FLOW_RESOURCES_BWA_MEMORY=300",
        "FLOW_RESOURCES_BWA_TIME=5",
        "FLOW_RESOURCES_BWA_CONTAINER=env.sif",
        "FLOW_RESOURCES_BWA_SINGULARITY_EXTRA_ARGS=--nv",
    };

    auto result = load_config(sources);
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(result->scheduler.max_cpus, 12);
    EXPECT_EQ(result->job_runner, "shell");

    auto bwa = result->resources_for("bwa");
    ASSERT_TRUE(bwa.has_value()) << bwa.error().describe();
    EXPECT_EQ(bwa->cpus, 3);
    EXPECT_EQ(bwa->memory_mb, 300);
    EXPECT_EQ(bwa->time_limit_minutes, 5);
    EXPECT_EQ(bwa->container, "env.sif");
    EXPECT_EQ(bwa->extra_runtime_args, "--nv");
}

TEST_F(ConfigTest, OverridesWinOverEnvironment) {
    ConfigSources sources;
    sources.environment = {"FLOW_SCHEDULER_MAX_CPUS=12"};
    sources.overrides = {{"scheduler.max_cpus", "2"}, {"resources.gatk.cpus", "6"}};

    auto result = load_config(sources);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->scheduler.max_cpus, 2);
    EXPECT_EQ(result->partial_resources_for("GATK").cpus, 6);
}

TEST_F(ConfigTest, ApplyOverrideRejectsBadInput) {
    auto config = default_config();

    auto unknown = apply_override(config, "scheduler.speed", "fast");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::Config);
    ASSERT_EQ(unknown.error().subjects.size(), 1u);
    EXPECT_EQ(unknown.error().subjects[0], "scheduler.speed");

    EXPECT_FALSE(apply_override(config, "scheduler.max_cpus", "many").has_value());
    EXPECT_FALSE(apply_override(config, "scheduler.max_cpus", "-1").has_value());
    EXPECT_FALSE(apply_override(config, "resources.bwa.gpus", "1").has_value());
    EXPECT_TRUE(apply_override(config, "start_from_scratch", "yes").has_value());
    EXPECT_TRUE(config.start_from_scratch);
}

TEST_F(ConfigTest, ResourcesForNamesFirstMissingField) {
    auto config = default_config();

    auto none = config.resources_for("bwa");
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, ErrorCode::MissingResourceSpec);
    EXPECT_EQ(none.error().subjects, (std::vector<std::string>{"bwa", "cpus"}));

    config.resources["bwa"] = Resources{4, 0, 60, "bwa.sif", ""};
    auto no_memory = config.resources_for("bwa");
    ASSERT_FALSE(no_memory.has_value());
    EXPECT_EQ(no_memory.error().subjects, (std::vector<std::string>{"bwa", "memory"}));

    config.resources["bwa"].memory_mb = 1000;
    config.resources["bwa"].container.clear();
    auto no_container = config.resources_for("bwa");
    ASSERT_FALSE(no_container.has_value());
    EXPECT_EQ(no_container.error().subjects, (std::vector<std::string>{"bwa", "container"}));
}

TEST_F(ConfigTest, WriteDefaultConfigRoundTripsAndRefusesOverwrite) {
    auto path = temp_dir_ / "nested" / "flow.toml";
    ASSERT_TRUE(write_default_config(path).has_value());
    ASSERT_TRUE(std::filesystem::exists(path));

    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().describe();
    EXPECT_EQ(loaded->flowdir.string(), default_config().flowdir.string());
    EXPECT_EQ(loaded->scheduler.failure_policy, FailurePolicy::FailFast);

    auto again = write_default_config(path);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::Io);
}

TEST_F(ConfigTest, InitFlowdirCreatesAndClearsLogs) {
    auto config = default_config();
    config.flowdir = temp_dir_ / "flow";

    ASSERT_TRUE(init_flowdir(config).has_value());
    ASSERT_TRUE(std::filesystem::is_directory(config.flowdir / "logs"));

    auto stale = config.flowdir / "logs" / "old.out";
    std::ofstream(stale) << "stale";

    ASSERT_TRUE(init_flowdir(config).has_value());
    EXPECT_TRUE(std::filesystem::exists(stale));

    config.start_from_scratch = true;
    ASSERT_TRUE(init_flowdir(config).has_value());
    EXPECT_FALSE(std::filesystem::exists(stale));
    EXPECT_TRUE(std::filesystem::is_directory(config.flowdir / "logs"));
}

TEST_F(ConfigTest, InitFlowdirReportsIoError) {
    auto blocker = write_toml("not_a_dir", "x");
    auto config = default_config();
    config.flowdir = blocker / "flow";

    auto result = init_flowdir(config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
}
