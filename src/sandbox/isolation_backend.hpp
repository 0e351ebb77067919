/**
 * @file isolation_backend.hpp
 * @brief IIsolationBackend: where a single sandboxed command actually runs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/environment_filter.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

/**
 * @brief Language-level description of one command.
 *
 * argv is relative to the workspace root; the backend decides where that
 * root lives (host path or /sandbox inside a container).
 */
struct CommandTemplate {
    std::vector<std::string> argv;
    EnvList extra_env;
    bool limit_address_space = true;   ///< False for runtimes that reserve large heaps up front
};

/**
 * @brief One command to execute against a materialized workspace.
 */
struct ExecutionRequest {
    std::vector<std::string> argv;
    std::filesystem::path workdir;
    ResourceLimitPolicy policy;
    Language language{Language::Python};
    std::chrono::milliseconds timeout{10'000};
    bool writable_workdir = false;     ///< Compile steps write class files / build output
    bool limit_address_space = true;
    EnvList extra_env;
};

/**
 * @brief Abstract interface for isolation backends (runtime polymorphism).
 *
 * Selected once at startup by SandboxEnvironment and shared read-only by
 * every worker, so implementations must be safe to call concurrently.
 */
class IIsolationBackend {
public:
    virtual ~IIsolationBackend() = default;

    /// BackendUnavailable when the backend cannot be used on this host.
    virtual Result<void> probe() = 0;

    /**
     * @brief Run one command to completion or deadline.
     *
     * Errors mean the command never ran (SetupFailure). Everything the
     * program does is reported in the outcome.
     */
    virtual Result<ExecutionOutcome> execute(const ExecutionRequest& request) = 0;

    [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace code_sandbox
