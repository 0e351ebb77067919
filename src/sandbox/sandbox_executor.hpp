/**
 * @file sandbox_executor.hpp
 * @brief One sandboxed execution: workspace, compile step, run step, cleanup.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/resource_gate.hpp"
#include "sandbox/language_adapter.hpp"
#include "sandbox/sandbox_environment.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

class MetricsCollector;

/**
 * @brief Runs execution units on the environment's backend.
 *
 * Stateless apart from its collaborators, so one executor is shared by all
 * workers. Every call gets a private workspace that is removed before the
 * call returns, whatever the outcome. Expected failures (compile errors,
 * timeouts, limits, crashes) come back as FailureKind on the outcome; this
 * class never throws for them.
 */
class SandboxExecutor {
public:
    struct Options {
        ToolchainConfig toolchain;
        std::filesystem::path workspace_root;   ///< Empty = system temp directory
        ResourceGate* gate = nullptr;           ///< Memory budget, optional
        MetricsCollector* metrics = nullptr;
    };

    SandboxExecutor(const SandboxEnvironment& environment, Logger& logger, Options options);

    /// Wrap raw code with the language's adapter, then run it.
    ExecutionOutcome run(std::string_view code,
                         Language language,
                         const ResourceLimitPolicy& policy,
                         std::chrono::milliseconds timeout);

    ExecutionOutcome run(const ExecutionUnit& unit,
                         const ResourceLimitPolicy& policy,
                         std::chrono::milliseconds timeout);

    /// Build an execution unit through the language adapter.
    [[nodiscard]] ExecutionUnit prepare(Language language,
                                        std::string source,
                                        std::vector<SourceFile> companions = {}) const;

    [[nodiscard]] BackendKind backend_kind() const noexcept { return environment_.kind(); }
    [[nodiscard]] const ToolchainConfig& toolchain() const noexcept { return options_.toolchain; }

    /**
     * @brief Failure kind of a finished run step.
     *
     * A kind already set by the backend (e.g. OOM kill) is kept. Otherwise:
     * timeout, then output overflow / SIGXCPU / SIGXFSZ as ResourceExceeded,
     * then non-zero exit or any signal as RuntimeFailure.
     */
    [[nodiscard]] static FailureKind classify(const ExecutionOutcome& outcome) noexcept;

private:
    ExecutionOutcome invoke(const CommandTemplate& command,
                            const std::filesystem::path& workdir,
                            Language language,
                            const ResourceLimitPolicy& policy,
                            std::chrono::milliseconds timeout,
                            bool writable_workdir);

    ExecutionOutcome setup_failure(std::string message, SteadyTime started, FailureKind kind);
    void finish(Language language, const ExecutionOutcome& outcome);

    const SandboxEnvironment& environment_;
    Logger& logger_;
    Options options_;
};

}  // namespace code_sandbox
