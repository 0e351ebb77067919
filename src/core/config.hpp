/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace code_sandbox {

struct SandboxConfig {
    bool prefer_container = true;
    uint32_t probe_timeout_ms = 5000;
    uint32_t poll_interval_ms = 50;         ///< Supervisory polling granularity
    std::filesystem::path workspace_root;   ///< Empty = system temp directory
};

/**
 * @brief Optional per-field overrides applied on top of the backend default.
 */
struct PolicyOverrides {
    std::optional<uint32_t> cpu_time_seconds;
    std::optional<uint64_t> memory_mb;
    std::optional<uint32_t> wall_timeout_seconds;
    std::optional<uint32_t> compile_timeout_seconds;
    std::optional<uint64_t> max_output_kb;
    std::optional<uint64_t> max_file_size_kb;
    std::optional<uint32_t> max_file_descriptors;
    std::optional<uint32_t> max_processes;

    void apply_to(ResourceLimitPolicy& policy) const;
};

struct ContainerConfig {
    std::string docker_binary = "docker";
    std::string entry_command = "/usr/local/bin/sandbox-entry";
    std::string python_image = "code-sandbox/python:3.11";
    std::string javascript_image = "code-sandbox/node:20";
    std::string java_image = "code-sandbox/java:17";
    std::string csharp_image = "code-sandbox/dotnet:8.0";
    uint32_t tmpfs_size_mb = 64;
    uint32_t sandbox_uid = 65534;
    uint32_t sandbox_gid = 65534;

    [[nodiscard]] const std::string& image_for(Language language) const noexcept;
};

struct ProcessConfig {
    uint32_t sandbox_uid = 65534;           ///< Used when the engine runs as root
    uint32_t sandbox_gid = 65534;
    bool unshare_network = false;           ///< Best-effort network namespace
};

struct ToolchainConfig {
    std::string python = "python3";
    std::string node = "node";
    std::string javac = "javac";
    std::string java = "java";
    std::string dotnet = "dotnet";
    std::string csharp_target_framework = "net8.0";
};

struct DisciplineConfig {
    std::optional<double> max_duration_ms;  ///< Performance thresholds; unset = metric only
    std::optional<double> max_memory_kb;
    double min_coverage_percent = 80.0;
    Severity security_severity_floor = Severity::Medium;
};

struct FeedbackConfig {
    uint32_t max_retries = 2;               ///< 2 retries = 3 total attempts
};

struct ExecutorConfig {
    uint32_t thread_count = 0;              ///< 0 = min(hardware_concurrency, subtasks)
    uint64_t memory_budget_mb = 0;          ///< 0 = half of physical memory
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

struct ReportConfig {
    std::filesystem::path output_path = "./sandbox_report.json";
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    SandboxConfig sandbox;
    PolicyOverrides policy;
    ContainerConfig container;
    ProcessConfig process;
    ToolchainConfig toolchain;
    DisciplineConfig disciplines;
    FeedbackConfig feedback;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
    ReportConfig report;

    /// Backend default with the [policy] overrides applied.
    [[nodiscard]] ResourceLimitPolicy policy_for(BackendKind kind) const;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace code_sandbox
