/**
 * @file main.cpp
 * @brief CodeSandbox command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a complete evaluation run:
 *   Config → Logger → SandboxEnvironment → TestRun → Report
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "feedback/developer_client.hpp"
#include "pipeline/test_run.hpp"
#include "sandbox/sandbox_environment.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/manifest.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace code_sandbox;

namespace {

constexpr int kExitAllPassed = 0;
constexpr int kExitSomeFailed = 1;
constexpr int kExitUsage = 2;

const std::filesystem::path kDefaultConfigPath = "config/default.toml";

struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::filesystem::path manifest_path;
    std::optional<std::filesystem::path> report_path;
    std::optional<std::filesystem::path> log_dir;
    bool force_process = false;
    bool show_help = false;
    std::string problem;
};

void print_usage(std::ostream& out) {
    out << "Usage: code_sandbox --manifest <path> [OPTIONS]\n"
        << "  --config <path>    Configuration file (default: config/default.toml if present)\n"
        << "  --manifest <path>  Task manifest with [[subtask]] entries\n"
        << "  --report <path>    JSON report output path\n"
        << "  --log-dir <path>   Log output directory\n"
        << "  --force-process    Skip the container backend probe\n"
        << "  --help, -h         Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--manifest" && has_value) {
            args.manifest_path = argv[++i];
        } else if (arg == "--report" && has_value) {
            args.report_path = argv[++i];
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--force-process") {
            args.force_process = true;
        } else if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        } else {
            args.problem = "Unrecognized or incomplete option: " + arg;
            return args;
        }
    }
    if (!args.show_help && args.manifest_path.empty()) {
        args.problem = "--manifest is required";
    }
    return args;
}

Result<Config> resolve_config(const CLIArgs& args) {
    if (args.config_path) return load_config(*args.config_path);
    if (std::filesystem::exists(kDefaultConfigPath)) return load_config(kDefaultConfigPath);
    return default_config();
}

void print_results(const RunReport& report) {
    std::cout << "\nBackend: " << to_string(report.backend)
              << (report.degraded ? " (degraded)" : "") << "\n\n";
    std::cout << std::left << std::setw(24) << "SUBTASK" << std::setw(13) << "DISCIPLINE"
              << std::setw(8) << "STATUS" << std::setw(10) << "ATTEMPTS" << "DETAIL\n";
    for (const auto& row : report.results) {
        const auto& v = row.verdict;
        std::cout << std::left << std::setw(24) << v.subtask_id
                  << std::setw(13) << to_string(v.discipline)
                  << std::setw(8) << to_string(v.status)
                  << std::setw(10) << row.attempts;
        if (v.metric) {
            std::cout << to_string(v.metric->kind) << "=" << v.metric->value << " ";
        }
        if (!v.passed()) std::cout << v.message;
        std::cout << "\n";
    }

    const auto& s = report.summary;
    std::cout << "\n" << s.passed << "/" << s.total << " passed, " << s.failed << " failed, "
              << s.errors << " error(s), " << s.attempts << " attempt(s)\n";
    if (report.report_path) std::cout << "Report: " << report.report_path->string() << "\n";
    if (report.report_error) std::cerr << "Report not written: " << *report.report_error << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.show_help) {
        print_usage(std::cout);
        return kExitAllPassed;
    }
    if (!args.problem.empty()) {
        std::cerr << args.problem << "\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    // Load configuration
    auto config_result = resolve_config(args);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return kExitUsage;
    }
    auto config = *config_result;

    // Apply CLI overrides
    if (args.report_path) config.report.output_path = *args.report_path;
    if (args.log_dir) config.telemetry.log_dir = *args.log_dir;
    if (args.force_process) config.sandbox.prefer_container = false;

    // ── Initialize Logger ────────────────────
    const auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "code_sandbox",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    }
    Logger logger(std::move(log_sink), level, "engine");
    MetricsCollector metrics(std::move(metrics_sink));
    logger.info("CodeSandbox starting...");

    // ── Load Manifest ────────────────────────
    auto submissions = load_manifest(args.manifest_path);
    if (!submissions) {
        logger.error(submissions.error().message);
        std::cerr << "Failed to load manifest: " << submissions.error().message << std::endl;
        return kExitUsage;
    }
    logger.info("Manifest: " + std::to_string(submissions->size()) + " subtask(s) from "
                + args.manifest_path.string());

    // ── Select Isolation Backend ─────────────
    auto environment = SandboxEnvironment::from_config(config, logger, &metrics);
    if (!environment) {
        logger.error(environment.error().message);
        std::cerr << "No isolation backend available: " << environment.error().message
                  << std::endl;
        return kExitUsage;
    }

    // ── Evaluate ─────────────────────────────
    DecliningDeveloper developer;
    TestRun run(config, *environment, developer, logger, &metrics);
    auto report = run.run(*submissions);
    if (!report) {
        logger.error(report.error().message);
        std::cerr << report.error().message << std::endl;
        return kExitUsage;
    }

    print_results(*report);
    logger.info("CodeSandbox finished.");
    logger.flush();
    return report->summary.all_passed() ? kExitAllPassed : kExitSomeFailed;
}
