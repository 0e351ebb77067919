/**
 * @file sandbox_environment.hpp
 * @brief Backend selection, performed once at startup.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "sandbox/isolation_backend.hpp"

#include <memory>
#include <string>

namespace code_sandbox {

class MetricsCollector;

/**
 * @brief The isolation backend every execution of this run uses.
 *
 * Probes the preferred backend (container) and falls back to the process
 * backend when it reports BackendUnavailable. After construction the choice
 * never changes and the object is shared by reference across workers
 * without locking.
 */
class SandboxEnvironment {
public:
    /// Select between explicit backends; `preferred` may be null.
    static Result<SandboxEnvironment> select(std::unique_ptr<IIsolationBackend> preferred,
                                             std::unique_ptr<IIsolationBackend> fallback,
                                             Logger& logger,
                                             MetricsCollector* metrics = nullptr);

    /// Build container/process backends from config and select.
    static Result<SandboxEnvironment> from_config(const Config& config,
                                                  Logger& logger,
                                                  MetricsCollector* metrics = nullptr);

    SandboxEnvironment(SandboxEnvironment&&) noexcept = default;
    SandboxEnvironment& operator=(SandboxEnvironment&&) noexcept = default;
    SandboxEnvironment(const SandboxEnvironment&) = delete;
    SandboxEnvironment& operator=(const SandboxEnvironment&) = delete;

    [[nodiscard]] IIsolationBackend& backend() const noexcept { return *backend_; }
    [[nodiscard]] BackendKind kind() const noexcept { return backend_->kind(); }

    /// True when the preferred backend was unavailable.
    [[nodiscard]] bool degraded() const noexcept { return degraded_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    SandboxEnvironment(std::unique_ptr<IIsolationBackend> backend, bool degraded, std::string reason)
        : backend_(std::move(backend)), degraded_(degraded), reason_(std::move(reason)) {}

    std::unique_ptr<IIsolationBackend> backend_;
    bool degraded_ = false;
    std::string reason_;
};

}  // namespace code_sandbox
