/**
 * @file process_backend.cpp
 * @brief ProcessBackend implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/process_backend.hpp"

#include "sandbox/temp_workspace.hpp"

#include <unistd.h>

namespace code_sandbox {

namespace {

bool should_drop_privileges(const ResourceLimitPolicy& policy) {
    return ::geteuid() == 0 && !policy.run_as_privileged;
}

}  // anonymous namespace

ProcessBackend::ProcessBackend(ProcessConfig config, std::chrono::milliseconds poll_interval)
    : config_(std::move(config))
    , poll_interval_(poll_interval) {}

Result<void> ProcessBackend::probe() {
    if (!config_.unshare_network) {
        network_isolated_ = false;
        return {};
    }

    // Network namespaces need CAP_SYS_ADMIN; find out once with a trivial child.
    SpawnOptions trial;
    trial.argv = {"true"};
    trial.env = strip_credentials(current_environment());
    trial.unshare_network = true;
    trial.timeout = std::chrono::milliseconds{2000};
    trial.poll_interval = poll_interval_;
    auto result = run_supervised(trial);
    network_isolated_ = result.has_value() && result->exit_code == 0;
    return {};
}

SpawnOptions ProcessBackend::spawn_options_for(const ExecutionRequest& request) const {
    const auto& policy = request.policy;
    const bool drop = should_drop_privileges(policy);
    const std::string workdir = request.workdir.string();

    SpawnOptions options;
    options.argv = request.argv;
    options.working_dir = request.workdir;

    options.env = strip_credentials(current_environment());
    merge_environment(options.env, {{"TMPDIR", workdir}});
    if (drop) {
        // The invoking user's home is not readable after the uid switch.
        merge_environment(options.env, {{"HOME", workdir}});
    }
    merge_environment(options.env, request.extra_env);

    options.limits.cpu_seconds = policy.cpu_time_seconds;
    if (request.limit_address_space) {
        options.limits.address_space_bytes = policy.memory_bytes;
    }
    options.limits.file_size_bytes = policy.max_file_size_bytes;
    options.limits.open_files = policy.max_file_descriptors;
    if (drop) {
        // RLIMIT_NPROC counts every process of the uid, so it is only
        // meaningful for the dedicated sandbox user.
        options.limits.processes = policy.max_processes;
        options.drop_to = Credentials{config_.sandbox_uid, config_.sandbox_gid};
    }

    options.unshare_network = network_isolated_.load() && !policy.network_enabled;
    options.timeout = request.timeout;
    options.poll_interval = poll_interval_;
    options.max_output_bytes = policy.max_output_bytes;
    return options;
}

Result<ExecutionOutcome> ProcessBackend::execute(const ExecutionRequest& request) {
    if (should_drop_privileges(request.policy)) {
        if (auto owned = chown_tree(request.workdir, config_.sandbox_uid, config_.sandbox_gid);
            !owned) {
            return owned.error();
        }
    }

    auto result = run_supervised(spawn_options_for(request));
    if (!result) return result.error();

    ExecutionOutcome outcome;
    outcome.exit_status = result->exit_code;
    outcome.term_signal = result->term_signal;
    outcome.stdout_data = std::move(result->stdout_data);
    outcome.stderr_data = std::move(result->stderr_data);
    outcome.wall_duration = result->wall_duration;
    outcome.peak_memory_bytes = result->peak_rss_bytes;
    outcome.timed_out = result->timed_out;
    outcome.output_truncated = result->output_truncated;
    outcome.backend_used = BackendKind::Subprocess;
    return outcome;
}

}  // namespace code_sandbox
