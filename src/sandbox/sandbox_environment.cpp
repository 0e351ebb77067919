/**
 * @file sandbox_environment.cpp
 * @brief SandboxEnvironment implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/sandbox_environment.hpp"

#include "sandbox/container_backend.hpp"
#include "sandbox/process_backend.hpp"
#include "telemetry/metrics_collector.hpp"

namespace code_sandbox {

Result<SandboxEnvironment> SandboxEnvironment::select(std::unique_ptr<IIsolationBackend> preferred,
                                                      std::unique_ptr<IIsolationBackend> fallback,
                                                      Logger& logger,
                                                      MetricsCollector* metrics) {
    std::string reason = "preferred backend disabled by configuration";

    if (preferred) {
        auto probed = preferred->probe();
        if (probed) {
            std::string name{preferred->name()};
            logger.info("Isolation backend selected: " + name);
            if (metrics) metrics->record_backend_selection(preferred->kind(), false, "probe ok");
            return SandboxEnvironment{std::move(preferred), false, "probe ok"};
        }
        reason = probed.error().message;
    }

    if (!fallback) {
        return Error{"No isolation backend available: " + reason, ErrorKind::BackendUnavailable};
    }
    if (auto probed = fallback->probe(); !probed) {
        return Error{"No isolation backend available: " + reason + "; "
                     + std::string{fallback->name()} + ": " + probed.error().message,
                     ErrorKind::BackendUnavailable};
    }

    logger.warn("Degraded mode: running untrusted code with the "
                + std::string{fallback->name()} + " backend (" + reason + ")");
    if (metrics) metrics->record_backend_selection(fallback->kind(), true, reason);
    return SandboxEnvironment{std::move(fallback), true, std::move(reason)};
}

Result<SandboxEnvironment> SandboxEnvironment::from_config(const Config& config,
                                                           Logger& logger,
                                                           MetricsCollector* metrics) {
    const std::chrono::milliseconds poll{config.sandbox.poll_interval_ms};

    std::unique_ptr<IIsolationBackend> container;
    if (config.sandbox.prefer_container) {
        container = std::make_unique<ContainerBackend>(
            config.container, std::chrono::milliseconds{config.sandbox.probe_timeout_ms}, poll);
    }

    auto process = std::make_unique<ProcessBackend>(config.process, poll);
    ProcessBackend* process_view = process.get();

    auto selected = select(std::move(container), std::move(process), logger, metrics);
    if (!selected) return selected;

    if (selected->kind() == BackendKind::Subprocess && config.process.unshare_network
        && !process_view->network_isolated()) {
        logger.warn("Network namespace unavailable (needs CAP_SYS_ADMIN); "
                    "sandboxed processes share the host network");
    }
    return selected;
}

}  // namespace code_sandbox
