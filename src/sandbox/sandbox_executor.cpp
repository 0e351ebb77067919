/**
 * @file sandbox_executor.cpp
 * @brief SandboxExecutor implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/sandbox_executor.hpp"

#include "sandbox/temp_workspace.hpp"
#include "telemetry/metrics_collector.hpp"

#include <csignal>
#include <exception>
#include <sstream>
#include <variant>

namespace code_sandbox {

namespace {

FailureKind failure_for(ErrorKind kind) noexcept {
    return kind == ErrorKind::BackendUnavailable ? FailureKind::BackendUnavailable
                                                 : FailureKind::SetupFailure;
}

Duration elapsed_since(SteadyTime started) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
}

}  // anonymous namespace

SandboxExecutor::SandboxExecutor(const SandboxEnvironment& environment, Logger& logger,
                                 Options options)
    : environment_(environment)
    , logger_(logger)
    , options_(std::move(options)) {}

ExecutionUnit SandboxExecutor::prepare(Language language,
                                       std::string source,
                                       std::vector<SourceFile> companions) const {
    auto adapter = make_adapter(language, options_.toolchain);
    return std::visit([&](const auto& a) { return a.prepare(std::move(source), std::move(companions)); },
                      adapter);
}

ExecutionOutcome SandboxExecutor::run(std::string_view code,
                                      Language language,
                                      const ResourceLimitPolicy& policy,
                                      std::chrono::milliseconds timeout) {
    return run(prepare(language, std::string{code}), policy, timeout);
}

ExecutionOutcome SandboxExecutor::run(const ExecutionUnit& unit,
                                      const ResourceLimitPolicy& policy,
                                      std::chrono::milliseconds timeout) {
    const auto started = std::chrono::steady_clock::now();

    ResourceGate::Reservation reservation;
    if (options_.gate) reservation = options_.gate->reserve(policy.memory_bytes);

    auto workspace = TempWorkspace::create(options_.workspace_root);
    if (!workspace) {
        auto outcome = setup_failure(workspace.error().message, started, FailureKind::SetupFailure);
        finish(unit.language(), outcome);
        return outcome;
    }

    const auto adapter = make_adapter(unit.language(), options_.toolchain);
    const auto files = std::visit([&](const auto& a) { return a.layout(unit); }, adapter);
    if (auto written = workspace->write(files); !written) {
        auto outcome = setup_failure(written.error().message, started, FailureKind::SetupFailure);
        finish(unit.language(), outcome);
        return outcome;
    }

    // ── Compile step ─────────────────────────
    const auto compile = std::visit([&](const auto& a) { return a.compile_command(unit, policy); },
                                    adapter);
    if (compile) {
        const auto compile_budget =
            std::chrono::duration_cast<std::chrono::milliseconds>(policy.compile_timeout());
        auto compiled = invoke(*compile, workspace->path(), unit.language(), policy,
                               compile_budget, true);
        const bool infrastructure = compiled.failure == FailureKind::SetupFailure
                                    || compiled.failure == FailureKind::BackendUnavailable;
        if (!infrastructure && !compiled.succeeded()) {
            // A compile step that overruns its budget is still a compile error;
            // timed_out is reserved for the program itself.
            std::ostringstream oss;
            if (compiled.timed_out) {
                oss << "compile step exceeded " << policy.compile_timeout_seconds << " s";
            } else {
                oss << "compile step failed with exit status " << compiled.exit_status;
            }
            compiled.timed_out = false;
            compiled.failure = FailureKind::CompileError;
            compiled.diagnostic = oss.str();
        }
        if (compiled.failure != FailureKind::None) {
            compiled.wall_duration = elapsed_since(started);
            finish(unit.language(), compiled);
            return compiled;
        }
    }

    // ── Run step ─────────────────────────────
    const auto invocation = std::visit([&](const auto& a) { return a.invocation_for(unit, policy); },
                                       adapter);
    auto outcome = invoke(invocation, workspace->path(), unit.language(), policy, timeout, false);
    outcome.failure = classify(outcome);
    finish(unit.language(), outcome);
    return outcome;
}

ExecutionOutcome SandboxExecutor::invoke(const CommandTemplate& command,
                                         const std::filesystem::path& workdir,
                                         Language language,
                                         const ResourceLimitPolicy& policy,
                                         std::chrono::milliseconds timeout,
                                         bool writable_workdir) {
    const auto started = std::chrono::steady_clock::now();

    ExecutionRequest request;
    request.argv = command.argv;
    request.workdir = workdir;
    request.policy = policy;
    request.language = language;
    request.timeout = timeout;
    request.writable_workdir = writable_workdir;
    request.limit_address_space = command.limit_address_space;
    request.extra_env = command.extra_env;

    ExecutionOutcome outcome;
    try {
        auto result = environment_.backend().execute(request);
        if (!result) {
            return setup_failure(result.error().message, started, failure_for(result.error().kind));
        }
        outcome = std::move(*result);
    } catch (const std::exception& e) {
        logger_.error(std::string{"Backend raised during execution: "} + e.what());
        return setup_failure(std::string{"backend exception: "} + e.what(), started,
                             FailureKind::SetupFailure);
    }

    // Supervisory deadline independent of the backend's own enforcement.
    if (outcome.wall_duration >= std::chrono::duration_cast<Duration>(timeout)) {
        outcome.timed_out = true;
    }
    return outcome;
}

ExecutionOutcome SandboxExecutor::setup_failure(std::string message, SteadyTime started,
                                                FailureKind kind) {
    logger_.warn("Sandbox setup failed: " + message);
    ExecutionOutcome outcome;
    outcome.failure = kind;
    outcome.diagnostic = std::move(message);
    outcome.backend_used = environment_.kind();
    outcome.wall_duration = elapsed_since(started);
    return outcome;
}

void SandboxExecutor::finish(Language language, const ExecutionOutcome& outcome) {
    if (logger_.level() == LogLevel::Debug) {
        std::ostringstream oss;
        oss << "Executed " << to_string(language) << " on " << to_string(outcome.backend_used)
            << ": exit " << outcome.exit_status
            << ", " << to_string(outcome.failure)
            << ", " << outcome.duration_ms() << " ms";
        logger_.debug(oss.str());
    }
    if (options_.metrics) options_.metrics->record_execution(language, outcome);
}

FailureKind SandboxExecutor::classify(const ExecutionOutcome& outcome) noexcept {
    if (outcome.failure != FailureKind::None) return outcome.failure;
    if (outcome.timed_out) return FailureKind::TimeoutExceeded;
    if (outcome.output_truncated) return FailureKind::ResourceExceeded;
    if (outcome.term_signal
        && (*outcome.term_signal == SIGXCPU || *outcome.term_signal == SIGXFSZ)) {
        return FailureKind::ResourceExceeded;
    }
    if (outcome.exit_status != 0 || outcome.term_signal) return FailureKind::RuntimeFailure;
    return FailureKind::None;
}

}  // namespace code_sandbox
