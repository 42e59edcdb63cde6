/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace agent_orchestrator;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ao_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
        ::unsetenv(std::string{kEnvStatusInterval}.c_str());
        ::unsetenv(std::string{kEnvWatchdogInterval}.c_str());
        ::unsetenv(std::string{kEnvRunnerNoop}.c_str());
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.run.poll_interval, Millis{1000});
    EXPECT_EQ(config.run.max_parallel, 0u);
    ASSERT_EQ(config.run.privileged_phases.size(), 1u);
    EXPECT_EQ(config.run.privileged_phases[0], Phase::Main);
    EXPECT_EQ(config.watchdog.stuck_threshold, Millis{900000});
    EXPECT_EQ(config.escalation.max_retries, 3u);
    EXPECT_TRUE(config.tasks.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [run]
        project_root = "project"
        logs_dir = "out/logs"
        poll_interval = 0.25
        status_interval = 0
        max_parallel = 2

        [log]
        level = "debug"
        file = false

        [runners.codex]
        command = "codex exec {prompt}"
        interrupt_signal = "SIGUSR1"

        [watchdog]
        check_interval = 5
        stuck_threshold = 300
        indicators = ["filesystem", "vcs"]

        [escalation]
        strategies = ["notify", "kill_and_retry"]
        max_retries = 1

        [[tasks]]
        id = "a"
        phase = "discovery"
        workspace_path = "../wt/a"
        prompt = "prompts/a.md"
        runner = "codex"

        [[tasks]]
        id = "b"
        workspace_path = "../wt/b"
        command = "make test"
        depends_on = ["a"]
        manual = true

          [tasks.watchdog]
          stuck_threshold = 60

          [tasks.escalation]
          strategies = ["switch_agent"]
          alternate_runner = "codex"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.run.project_root, (temp_dir_ / "project").lexically_normal());
    EXPECT_EQ(config.run.config_path, std::filesystem::absolute(path).lexically_normal());
    EXPECT_EQ(config.run.logs_dir, (temp_dir_ / "project/out/logs").lexically_normal());
    EXPECT_EQ(config.run.summary_dir, (temp_dir_ / "project/docs").lexically_normal());
    EXPECT_EQ(config.run.poll_interval, Millis{250});
    EXPECT_EQ(config.run.status_interval, Millis{0});
    EXPECT_EQ(config.run.max_parallel, 2u);
    EXPECT_EQ(config.log.level, "debug");
    EXPECT_FALSE(config.log.file);

    ASSERT_EQ(config.runners.count("codex"), 1u);
    EXPECT_EQ(config.runners.at("codex").interrupt_signal, SIGUSR1);

    ASSERT_EQ(config.tasks.size(), 2u);
    const auto& a = config.tasks[0];
    EXPECT_EQ(a.phase, Phase::Discovery);
    EXPECT_EQ(a.branch, "task/{task}");
    EXPECT_EQ(a.watchdog.stuck_threshold, Millis{300000});
    EXPECT_TRUE(a.watchdog.uses(Indicator::Filesystem));
    EXPECT_FALSE(a.watchdog.uses(Indicator::LogGrowth));
    ASSERT_EQ(a.escalation.strategies.size(), 2u);
    EXPECT_EQ(a.escalation.strategies[1], Strategy::KillAndRetry);

    const auto& b = config.tasks[1];
    EXPECT_EQ(b.phase, Phase::Main);
    EXPECT_TRUE(b.manual);
    EXPECT_EQ(b.command, "make test");
    ASSERT_EQ(b.depends_on.size(), 1u);
    EXPECT_EQ(b.depends_on[0], "a");
    // Task-level tables override only the keys they name
    EXPECT_EQ(b.watchdog.stuck_threshold, Millis{60000});
    EXPECT_EQ(b.watchdog.check_interval, Millis{5000});
    ASSERT_EQ(b.escalation.strategies.size(), 1u);
    EXPECT_EQ(b.escalation.strategies[0], Strategy::SwitchAgent);
    EXPECT_EQ(b.escalation.max_retries, 1u);
    EXPECT_EQ(b.escalation.alternate_runner, "codex");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [[tasks]]
        id = "only"
        workspace_path = "wt"
        command = "true"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->tasks.size(), 1u);
    EXPECT_EQ(result->run.project_root, temp_dir_.lexically_normal());
    EXPECT_EQ(result->escalation.strategies.size(), 3u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, CollectsAllFieldErrors) {
    auto result = parse_config(R"(
        [watchdog]
        indicators = ["telepathy"]

        [escalation]
        strategies = ["pray"]

        [[tasks]]
        id = "x"
        phase = "release"
    )", temp_dir_);

    ASSERT_FALSE(result.has_value());
    const auto& message = result.error().message;
    EXPECT_NE(message.find("telepathy"), std::string::npos);
    EXPECT_NE(message.find("pray"), std::string::npos);
    EXPECT_NE(message.find("release"), std::string::npos);
}

TEST_F(ConfigTest, RejectsNegativeDuration) {
    auto result = parse_config("[watchdog]\nstuck_threshold = -1\n", temp_dir_);
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, RejectsEmptyRunnerCommand) {
    auto result = parse_config("[runners.empty]\ncommand = \"\"\n", temp_dir_);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("empty"), std::string::npos);
}

TEST_F(ConfigTest, EnvOverrides) {
    auto result = parse_config(R"(
        [runners.codex]
        command = "codex {prompt}"

        [[tasks]]
        id = "a"
        workspace_path = "wt"
        runner = "codex"

        [[tasks]]
        id = "b"
        workspace_path = "wt2"
        command = "make"
    )", temp_dir_);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    ::setenv(std::string{kEnvStatusInterval}.c_str(), "2.5", 1);
    ::setenv(std::string{kEnvWatchdogInterval}.c_str(), "1", 1);
    ::setenv(std::string{kEnvRunnerNoop}.c_str(), "yes", 1);
    apply_env_overrides(*result);

    EXPECT_EQ(result->run.status_interval, Millis{2500});
    EXPECT_EQ(result->watchdog.check_interval, Millis{1000});
    EXPECT_EQ(result->tasks[0].watchdog.check_interval, Millis{1000});
    EXPECT_EQ(result->runners.at("codex").command, kNoopRunnerCommand);
    EXPECT_EQ(result->tasks[1].command, kNoopRunnerCommand);
}

TEST(ConfigHelpersTest, SignalNames) {
    EXPECT_EQ(parse_signal_name("SIGINT"), SIGINT);
    EXPECT_EQ(parse_signal_name("term"), SIGTERM);
    EXPECT_FALSE(parse_signal_name("SIGFOO").has_value());
}

TEST(ConfigHelpersTest, Truthy) {
    EXPECT_TRUE(truthy("1"));
    EXPECT_TRUE(truthy("On"));
    EXPECT_FALSE(truthy("0"));
    EXPECT_FALSE(truthy(""));
}
