/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

using namespace code_sandbox;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path()
                    / ("cs_test_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
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
    EXPECT_TRUE(config.sandbox.prefer_container);
    EXPECT_EQ(config.sandbox.poll_interval_ms, 50u);
    EXPECT_EQ(config.feedback.max_retries, 2u);
    EXPECT_EQ(config.executor.thread_count, 0u);
    EXPECT_DOUBLE_EQ(config.disciplines.min_coverage_percent, 80.0);
    EXPECT_EQ(config.disciplines.security_severity_floor, Severity::Medium);
    EXPECT_FALSE(config.disciplines.max_duration_ms.has_value());
    EXPECT_EQ(config.container.image_for(Language::Java), "code-sandbox/java:17");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [sandbox]
        prefer_container = false
        probe_timeout_ms = 1500
        poll_interval_ms = 20
        workspace_root = "/var/tmp/cs"

        [policy]
        memory_mb = 256
        wall_timeout_seconds = 4
        max_output_kb = 64

        [container]
        docker_binary = "/usr/local/bin/docker"
        python_image = "registry.local/py:3.12"
        tmpfs_size_mb = 32

        [process]
        sandbox_uid = 1500
        sandbox_gid = 1500
        unshare_network = true

        [toolchain]
        python = "python3.12"
        csharp_target_framework = "net7.0"

        [disciplines]
        max_duration_ms = 2000.0
        max_memory_kb = 65536.0
        min_coverage_percent = 90.0
        security_severity_floor = "high"

        [feedback]
        max_retries = 4

        [executor]
        thread_count = 2
        memory_budget_mb = 2048

        [telemetry]
        log_dir = "/tmp/cs_logs"
        log_level = "debug"
        rotate_count = 3

        [report]
        output_path = "out/report.json"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_FALSE(config.sandbox.prefer_container);
    EXPECT_EQ(config.sandbox.probe_timeout_ms, 1500u);
    EXPECT_EQ(config.sandbox.poll_interval_ms, 20u);
    EXPECT_EQ(config.sandbox.workspace_root.string(), "/var/tmp/cs");
    EXPECT_EQ(config.container.docker_binary, "/usr/local/bin/docker");
    EXPECT_EQ(config.container.image_for(Language::Python), "registry.local/py:3.12");
    EXPECT_EQ(config.container.image_for(Language::JavaScript), "code-sandbox/node:20");
    EXPECT_EQ(config.container.tmpfs_size_mb, 32u);
    EXPECT_EQ(config.process.sandbox_uid, 1500u);
    EXPECT_TRUE(config.process.unshare_network);
    EXPECT_EQ(config.toolchain.python, "python3.12");
    EXPECT_EQ(config.toolchain.node, "node");
    EXPECT_EQ(config.toolchain.csharp_target_framework, "net7.0");
    EXPECT_DOUBLE_EQ(config.disciplines.max_duration_ms.value_or(0), 2000.0);
    EXPECT_DOUBLE_EQ(config.disciplines.max_memory_kb.value_or(0), 65536.0);
    EXPECT_DOUBLE_EQ(config.disciplines.min_coverage_percent, 90.0);
    EXPECT_EQ(config.disciplines.security_severity_floor, Severity::High);
    EXPECT_EQ(config.feedback.max_retries, 4u);
    EXPECT_EQ(config.executor.thread_count, 2u);
    EXPECT_EQ(config.executor.memory_budget_mb, 2048u);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
    EXPECT_EQ(config.report.output_path.string(), "out/report.json");
}

TEST_F(ConfigTest, PolicyOverridesApplyOnTopOfBackendDefault) {
    auto path = write_toml(R"(
        [policy]
        memory_mb = 256
        wall_timeout_seconds = 4
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto process = result->policy_for(BackendKind::Subprocess);
    EXPECT_EQ(process.memory_bytes, 256ULL * 1024 * 1024);
    EXPECT_EQ(process.wall_timeout_seconds, 4u);
    EXPECT_EQ(process.cpu_time_seconds, 10u);

    auto container = result->policy_for(BackendKind::Container);
    EXPECT_EQ(container.memory_bytes, 256ULL * 1024 * 1024);
    EXPECT_EQ(container.cpu_time_seconds, 30u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [feedback]
        max_retries = 0
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->feedback.max_retries, 0u);
    // Defaults for everything else
    EXPECT_TRUE(result->sandbox.prefer_container);
    EXPECT_EQ(result->toolchain.javac, "javac");
    EXPECT_EQ(result->policy_for(BackendKind::Subprocess), ResourceLimitPolicy::subprocess_default());
}

TEST_F(ConfigTest, UnknownSeverityRejected) {
    auto path = write_toml(R"(
        [disciplines]
        security_severity_floor = "critical"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, UnknownLogLevelRejected) {
    auto path = write_toml(R"(
        [telemetry]
        log_level = "chatty"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, InvalidPolicyRejected) {
    auto path = write_toml(R"(
        [policy]
        wall_timeout_seconds = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("wall_timeout_seconds"), std::string::npos);
}

TEST_F(ConfigTest, NegativeCountsRejected) {
    const std::vector<std::pair<std::string, std::string>> cases{
        {"[feedback]\nmax_retries = -1\n", "feedback.max_retries"},
        {"[executor]\nthread_count = -4\n", "executor.thread_count"},
        {"[process]\nsandbox_uid = -1\n", "process.sandbox_uid"},
        {"[sandbox]\nprobe_timeout_ms = -100\n", "sandbox.probe_timeout_ms"},
        {"[policy]\nmemory_mb = -512\n", "policy.memory_mb"}};

    for (const auto& [toml, key] : cases) {
        auto result = load_config(write_toml(toml));
        ASSERT_FALSE(result.has_value()) << toml;
        EXPECT_EQ(result.error().kind, ErrorKind::Config) << toml;
        EXPECT_NE(result.error().message.find(key), std::string::npos) << result.error().message;
    }
}

TEST_F(ConfigTest, CountBeyondFieldWidthRejected) {
    auto result = load_config(write_toml("[executor]\nthread_count = 5000000000\n"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    EXPECT_FALSE(result.has_value());
}
