/**
 * @file process_backend.hpp
 * @brief Same-host subprocess isolation (degraded mode).
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "sandbox/isolation_backend.hpp"
#include "sandbox/subprocess.hpp"

#include <atomic>

namespace code_sandbox {

/**
 * @brief Runs commands as plain child processes under rlimits.
 *
 * Weaker than a container: the program shares the host filesystem view and
 * kernel. Mitigations are a stripped environment, an unprivileged uid when
 * the engine itself runs as root, no_new_privs, and an optional network
 * namespace.
 */
class ProcessBackend final : public IIsolationBackend {
public:
    ProcessBackend(ProcessConfig config, std::chrono::milliseconds poll_interval);

    Result<void> probe() override;
    Result<ExecutionOutcome> execute(const ExecutionRequest& request) override;

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Subprocess; }
    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

    /// False when a network namespace was requested but cannot be created here.
    [[nodiscard]] bool network_isolated() const noexcept { return network_isolated_.load(); }

    /// Spawn options for a request; exposed for tests.
    [[nodiscard]] SpawnOptions spawn_options_for(const ExecutionRequest& request) const;

private:
    ProcessConfig config_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> network_isolated_{false};
};

}  // namespace code_sandbox
