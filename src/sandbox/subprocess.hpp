/**
 * @file subprocess.hpp
 * @brief Supervised child process: limits, deadline, bounded output capture.
 * @author Dimitris Kafetzis
 *
 * Shared by both isolation backends. The process backend runs the program
 * itself through it; the container backend runs the docker client through
 * it. In both cases the supervisor owns the wall-clock deadline and always
 * reaps the child.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/environment_filter.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace code_sandbox {

/**
 * @brief OS resource limits applied in the child before exec.
 */
struct RlimitSet {
    std::optional<uint64_t> cpu_seconds;
    std::optional<uint64_t> address_space_bytes;
    std::optional<uint64_t> file_size_bytes;
    std::optional<uint64_t> open_files;
    std::optional<uint64_t> processes;
    bool disable_core_dumps = true;
};

struct Credentials {
    uint32_t uid = 65534;
    uint32_t gid = 65534;
};

struct SpawnOptions {
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    EnvList env;
    RlimitSet limits;
    std::optional<Credentials> drop_to;        ///< Switch uid/gid before exec
    bool unshare_network = false;              ///< New network namespace; failure aborts the spawn
    bool no_new_privileges = true;
    std::chrono::milliseconds timeout{10'000};
    std::chrono::milliseconds poll_interval{50};
    uint64_t max_output_bytes = 1024 * 1024;   ///< Per stream; exceeding it kills the group
    std::function<void()> on_timeout;          ///< Extra teardown after the group is killed
};

struct ProcessResult {
    int exit_code = -1;                        ///< 128+signal when killed by a signal
    std::optional<int> term_signal;
    std::string stdout_data;
    std::string stderr_data;
    bool output_truncated = false;
    bool timed_out = false;
    Duration wall_duration{0};
    uint64_t peak_rss_bytes = 0;
};

/**
 * @brief Spawn `options.argv` in its own process group and supervise it.
 *
 * Returns an error (SetupFailure) only when the program could not be
 * started: pipe/fork failure, limit or credential setup failure, or exec
 * failure reported through a close-on-exec status pipe. Everything the
 * program itself does (non-zero exit, signals, timeouts) is reported in
 * ProcessResult.
 *
 * On deadline expiry the whole process group receives SIGKILL, then
 * `on_timeout` runs. The group is also killed after the main process exits
 * so that stray descendants cannot outlive the execution.
 */
Result<ProcessResult> run_supervised(const SpawnOptions& options);

}  // namespace code_sandbox
