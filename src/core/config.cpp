/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <stdexcept>
#include <string>

namespace code_sandbox {

namespace {

/// Out-of-range value; load_config turns it into an ErrorKind::Config error.
struct InvalidValue : std::runtime_error {
    using std::runtime_error::runtime_error;
};

template <typename T>
T checked_unsigned(int64_t value, std::string_view key) {
    if (value < 0 || static_cast<uint64_t>(value) > std::numeric_limits<T>::max()) {
        throw InvalidValue{std::string{key} + " must be between 0 and "
                           + std::to_string(std::numeric_limits<T>::max())
                           + ", got " + std::to_string(value)};
    }
    return static_cast<T>(value);
}

template <typename T, typename Node>
std::optional<T> optional_u(Node node, std::string_view key) {
    if (auto v = node.template value<int64_t>()) {
        return checked_unsigned<T>(*v, key);
    }
    return std::nullopt;
}

template <typename T, typename Node>
T unsigned_or(Node node, std::string_view key, T fallback) {
    return optional_u<T>(node, key).value_or(fallback);
}

template <typename Node>
std::optional<double> optional_f(Node node) {
    return node.template value<double>();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

void PolicyOverrides::apply_to(ResourceLimitPolicy& policy) const {
    if (cpu_time_seconds) policy.cpu_time_seconds = *cpu_time_seconds;
    if (memory_mb) policy.memory_bytes = *memory_mb * 1024 * 1024;
    if (wall_timeout_seconds) policy.wall_timeout_seconds = *wall_timeout_seconds;
    if (compile_timeout_seconds) policy.compile_timeout_seconds = *compile_timeout_seconds;
    if (max_output_kb) policy.max_output_bytes = *max_output_kb * 1024;
    if (max_file_size_kb) policy.max_file_size_bytes = *max_file_size_kb * 1024;
    if (max_file_descriptors) policy.max_file_descriptors = *max_file_descriptors;
    if (max_processes) policy.max_processes = *max_processes;
}

const std::string& ContainerConfig::image_for(Language language) const noexcept {
    switch (language) {
        case Language::Python:     return python_image;
        case Language::JavaScript: return javascript_image;
        case Language::Java:       return java_image;
        case Language::CSharp:     return csharp_image;
    }
    return python_image;
}

ResourceLimitPolicy Config::policy_for(BackendKind kind) const {
    auto result = ResourceLimitPolicy::for_backend(kind);
    policy.apply_to(result);
    return result;
}

// ─────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorKind::Config};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.prefer_container = sandbox["prefer_container"].value_or(true);
            config.sandbox.probe_timeout_ms = unsigned_or<uint32_t>(
                sandbox["probe_timeout_ms"], "sandbox.probe_timeout_ms", uint32_t{5000});
            config.sandbox.poll_interval_ms = unsigned_or<uint32_t>(
                sandbox["poll_interval_ms"], "sandbox.poll_interval_ms", uint32_t{50});
            config.sandbox.workspace_root = sandbox["workspace_root"].value_or(std::string{});
        }

        // [policy]
        if (auto policy = tbl["policy"]; policy.is_table()) {
            auto& o = config.policy;
            o.cpu_time_seconds = optional_u<uint32_t>(
                policy["cpu_time_seconds"], "policy.cpu_time_seconds");
            o.memory_mb = optional_u<uint64_t>(policy["memory_mb"], "policy.memory_mb");
            o.wall_timeout_seconds = optional_u<uint32_t>(
                policy["wall_timeout_seconds"], "policy.wall_timeout_seconds");
            o.compile_timeout_seconds = optional_u<uint32_t>(
                policy["compile_timeout_seconds"], "policy.compile_timeout_seconds");
            o.max_output_kb = optional_u<uint64_t>(policy["max_output_kb"], "policy.max_output_kb");
            o.max_file_size_kb = optional_u<uint64_t>(
                policy["max_file_size_kb"], "policy.max_file_size_kb");
            o.max_file_descriptors = optional_u<uint32_t>(
                policy["max_file_descriptors"], "policy.max_file_descriptors");
            o.max_processes = optional_u<uint32_t>(policy["max_processes"], "policy.max_processes");
        }

        // [container]
        if (auto container = tbl["container"]; container.is_table()) {
            auto& c = config.container;
            c.docker_binary = container["docker_binary"].value_or(c.docker_binary);
            c.entry_command = container["entry_command"].value_or(c.entry_command);
            c.python_image = container["python_image"].value_or(c.python_image);
            c.javascript_image = container["javascript_image"].value_or(c.javascript_image);
            c.java_image = container["java_image"].value_or(c.java_image);
            c.csharp_image = container["csharp_image"].value_or(c.csharp_image);
            c.tmpfs_size_mb = unsigned_or<uint32_t>(
                container["tmpfs_size_mb"], "container.tmpfs_size_mb", uint32_t{64});
            c.sandbox_uid = unsigned_or<uint32_t>(
                container["sandbox_uid"], "container.sandbox_uid", uint32_t{65534});
            c.sandbox_gid = unsigned_or<uint32_t>(
                container["sandbox_gid"], "container.sandbox_gid", uint32_t{65534});
        }

        // [process]
        if (auto process = tbl["process"]; process.is_table()) {
            config.process.sandbox_uid = unsigned_or<uint32_t>(
                process["sandbox_uid"], "process.sandbox_uid", uint32_t{65534});
            config.process.sandbox_gid = unsigned_or<uint32_t>(
                process["sandbox_gid"], "process.sandbox_gid", uint32_t{65534});
            config.process.unshare_network = process["unshare_network"].value_or(false);
        }

        // [toolchain]
        if (auto toolchain = tbl["toolchain"]; toolchain.is_table()) {
            auto& t = config.toolchain;
            t.python = toolchain["python"].value_or(t.python);
            t.node = toolchain["node"].value_or(t.node);
            t.javac = toolchain["javac"].value_or(t.javac);
            t.java = toolchain["java"].value_or(t.java);
            t.dotnet = toolchain["dotnet"].value_or(t.dotnet);
            t.csharp_target_framework =
                toolchain["csharp_target_framework"].value_or(t.csharp_target_framework);
        }

        // [disciplines]
        if (auto disciplines = tbl["disciplines"]; disciplines.is_table()) {
            auto& d = config.disciplines;
            d.max_duration_ms = optional_f(disciplines["max_duration_ms"]);
            d.max_memory_kb = optional_f(disciplines["max_memory_kb"]);
            d.min_coverage_percent = disciplines["min_coverage_percent"].value_or(80.0);

            auto floor_name = disciplines["security_severity_floor"].value_or(std::string{"medium"});
            auto floor = parse_severity(floor_name);
            if (!floor) {
                return Error{"Unknown security_severity_floor: " + floor_name, ErrorKind::Config};
            }
            d.security_severity_floor = *floor;
        }

        // [feedback]
        if (auto feedback = tbl["feedback"]; feedback.is_table()) {
            config.feedback.max_retries = unsigned_or<uint32_t>(
                feedback["max_retries"], "feedback.max_retries", uint32_t{2});
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.thread_count = unsigned_or<uint32_t>(
                executor["thread_count"], "executor.thread_count", uint32_t{0});
            config.executor.memory_budget_mb = unsigned_or<uint64_t>(
                executor["memory_budget_mb"], "executor.memory_budget_mb", uint64_t{0});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = unsigned_or<uint32_t>(
                telemetry["max_file_size_mb"], "telemetry.max_file_size_mb", uint32_t{50});
            config.telemetry.rotate_count = unsigned_or<uint32_t>(
                telemetry["rotate_count"], "telemetry.rotate_count", uint32_t{5});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            if (!parse_log_level(config.telemetry.log_level)) {
                return Error{"Unknown log_level: " + config.telemetry.log_level, ErrorKind::Config};
            }
        }

        // [report]
        if (auto report = tbl["report"]; report.is_table()) {
            config.report.output_path =
                report["output_path"].value_or(std::string{"./sandbox_report.json"});
        }

        auto problem = config.policy_for(BackendKind::Subprocess).validate();
        if (!problem.empty()) {
            return Error{"Invalid [policy]: " + problem, ErrorKind::Config};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorKind::Config};
    } catch (const InvalidValue& err) {
        return Error{std::string{"Invalid configuration: "} + err.what(), ErrorKind::Config};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace code_sandbox
