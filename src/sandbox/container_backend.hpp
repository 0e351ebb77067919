/**
 * @file container_backend.hpp
 * @brief Ephemeral-container isolation through the docker CLI.
 * @author Dimitris Kafetzis
 *
 * Every execute() call creates one container named after the engine pid and
 * a sequence number, runs the image's entry command against the workspace
 * bind-mounted at /sandbox, and removes the container on every exit path.
 */

#pragma once

#include "core/config.hpp"
#include "sandbox/isolation_backend.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

class ContainerBackend final : public IIsolationBackend {
public:
    /// Mount point of the workspace inside the container.
    static constexpr std::string_view kMountPoint = "/sandbox";

    /// Exit code of the entry command when its own deadline fires.
    static constexpr int kEntryTimeoutExit = 124;

    /// Exit code of `docker run` itself failing before the program starts.
    static constexpr int kDockerRunFailure = 125;

    ContainerBackend(ContainerConfig config,
                     std::chrono::milliseconds probe_timeout,
                     std::chrono::milliseconds poll_interval);

    Result<void> probe() override;
    Result<ExecutionOutcome> execute(const ExecutionRequest& request) override;

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Container; }
    [[nodiscard]] std::string_view name() const noexcept override { return "container"; }

    /**
     * @brief Full `docker run ...` argv for a request (without the binary).
     *
     * Pure function of its inputs so the isolation flags can be checked
     * without a container runtime.
     */
    [[nodiscard]] static std::vector<std::string> build_run_args(const ContainerConfig& config,
                                                                 const ExecutionRequest& request,
                                                                 const std::string& container_name);

    /// The only variables a container ever sees.
    [[nodiscard]] static EnvList allowed_environment(const ExecutionRequest& request);

    /// Run time of a stopped container from `docker inspect` output
    /// "<StartedAt> <FinishedAt>" (RFC 3339, UTC). Empty when either is unset.
    [[nodiscard]] static std::optional<Duration> container_run_time(std::string_view started_finished);

    /// In-container deadline in seconds with millisecond precision, e.g. "2.500".
    [[nodiscard]] static std::string deadline_argument(std::chrono::milliseconds timeout);

private:
    [[nodiscard]] std::string next_container_name();

    ContainerConfig config_;
    std::chrono::milliseconds probe_timeout_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<uint64_t> sequence_{0};
};

}  // namespace code_sandbox
