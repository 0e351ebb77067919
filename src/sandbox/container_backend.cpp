/**
 * @file container_backend.cpp
 * @brief ContainerBackend implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/container_backend.hpp"

#include "sandbox/subprocess.hpp"
#include "sandbox/temp_workspace.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <unistd.h>

namespace code_sandbox {

namespace {

// The entry command enforces the program's deadline; the outer supervisor
// only covers container creation on top of it.
constexpr std::chrono::milliseconds kSupervisorMargin{2'000};
constexpr std::chrono::milliseconds kCleanupTimeout{15'000};
constexpr uint64_t kCliOutputCap = 64 * 1024;

std::string trim(std::string text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
    text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
    return text;
}

bool read_number(std::string_view text, size_t pos, size_t length, int& out) {
    if (pos + length > text.size()) return false;
    const char* first = text.data() + pos;
    const char* last = first + length;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

/// "YYYY-MM-DDTHH:MM:SS[.fraction]Z" as docker prints State timestamps.
std::optional<std::chrono::sys_time<std::chrono::nanoseconds>> parse_utc_timestamp(std::string_view text) {
    using namespace std::chrono;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (!read_number(text, 0, 4, y) || !read_number(text, 5, 2, mo) || !read_number(text, 8, 2, d)
        || !read_number(text, 11, 2, h) || !read_number(text, 14, 2, mi)
        || !read_number(text, 17, 2, sec)) {
        return std::nullopt;
    }
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t fraction_ns = 0;
    if (pos < text.size() && text[pos] == '.') {
        int64_t scale = 100'000'000;
        for (++pos; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
            fraction_ns += (text[pos] - '0') * scale;
            scale /= 10;
        }
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') return std::nullopt;

    const year_month_day date{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    // Nanosecond time points only span a few centuries around 1970; unset
    // docker timestamps print as year 1.
    if (!date.ok() || y < 1970 || y > 2200 || h > 23 || mi > 59 || sec > 60) return std::nullopt;
    return sys_days{date} + hours{h} + minutes{mi} + seconds{sec} + nanoseconds{fraction_ns};
}

/// Run a short docker CLI command on the host.
Result<ProcessResult> run_docker(const ContainerConfig& config,
                                 std::vector<std::string> args,
                                 std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds poll_interval) {
    SpawnOptions options;
    options.argv.reserve(args.size() + 1);
    options.argv.push_back(config.docker_binary);
    for (auto& arg : args) options.argv.push_back(std::move(arg));
    options.env = current_environment();
    options.timeout = timeout;
    options.poll_interval = poll_interval;
    options.max_output_bytes = kCliOutputCap;
    return run_supervised(options);
}

/**
 * @brief Removes the named container when it goes out of scope.
 */
class ContainerGuard {
public:
    ContainerGuard(const ContainerConfig& config, std::string name,
                   std::chrono::milliseconds poll_interval)
        : config_(config), name_(std::move(name)), poll_interval_(poll_interval) {}

    ~ContainerGuard() {
        if (removed_) return;
        // Unwinding: there is nobody left to report a failed removal to.
        auto removed = remove();
        (void)removed;
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    struct State {
        bool oom_killed = false;
        std::optional<Duration> run_time;
    };

    /// State of the stopped container; defaults when it cannot be read.
    [[nodiscard]] State inspect() const {
        State state;
        auto inspected = run_docker(
            config_,
            {"inspect", "--format", "{{.State.OOMKilled}} {{.State.StartedAt}} {{.State.FinishedAt}}", name_},
            kCleanupTimeout, poll_interval_);
        if (!inspected || inspected->exit_code != 0) return state;

        auto fields = trim(inspected->stdout_data);
        auto space = fields.find(' ');
        if (space == std::string::npos) return state;
        state.oom_killed = fields.substr(0, space) == "true";
        state.run_time = ContainerBackend::container_run_time(std::string_view{fields}.substr(space + 1));
        return state;
    }

    Result<void> remove() {
        removed_ = true;
        auto result = run_docker(config_, {"rm", "-f", name_}, kCleanupTimeout, poll_interval_);
        if (!result) return result.error();
        if (result->exit_code != 0 || result->timed_out) {
            return Error{"docker rm -f " + name_ + " failed: " + trim(result->stderr_data),
                         ErrorKind::SetupFailure};
        }
        return {};
    }

private:
    const ContainerConfig& config_;
    std::string name_;
    std::chrono::milliseconds poll_interval_;
    bool removed_ = false;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// ContainerBackend
// ─────────────────────────────────────────────

ContainerBackend::ContainerBackend(ContainerConfig config,
                                   std::chrono::milliseconds probe_timeout,
                                   std::chrono::milliseconds poll_interval)
    : config_(std::move(config))
    , probe_timeout_(probe_timeout)
    , poll_interval_(poll_interval) {}

Result<void> ContainerBackend::probe() {
    auto result = run_docker(config_, {"version", "--format", "{{.Server.Version}}"},
                             probe_timeout_, poll_interval_);
    if (!result) {
        return Error{"Container runtime not available: " + result.error().message,
                     ErrorKind::BackendUnavailable};
    }
    if (result->timed_out) {
        return Error{"Container runtime did not answer within "
                     + std::to_string(probe_timeout_.count()) + " ms",
                     ErrorKind::BackendUnavailable};
    }
    if (result->exit_code != 0) {
        return Error{"Container runtime not reachable: " + trim(result->stderr_data),
                     ErrorKind::BackendUnavailable};
    }
    return {};
}

EnvList ContainerBackend::allowed_environment(const ExecutionRequest& request) {
    EnvList env{{"HOME", "/tmp"}, {"TMPDIR", "/tmp"}, {"LANG", "C.UTF-8"}};
    merge_environment(env, request.extra_env);
    return env;
}

std::vector<std::string> ContainerBackend::build_run_args(const ContainerConfig& config,
                                                          const ExecutionRequest& request,
                                                          const std::string& container_name) {
    const auto& policy = request.policy;
    const auto memory = std::to_string(policy.memory_bytes);
    const auto file_size = std::to_string(policy.max_file_size_bytes);
    const auto fds = std::to_string(policy.max_file_descriptors);

    std::vector<std::string> args{"run", "--name", container_name};
    if (!policy.network_enabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    if (!policy.run_as_privileged) {
        args.insert(args.end(), {"--user", std::to_string(config.sandbox_uid) + ":"
                                               + std::to_string(config.sandbox_gid)});
    }
    args.insert(args.end(), {
        "--cpus", std::to_string(policy.cpu_cores),
        "--memory", memory,
        "--memory-swap", memory,
        "--pids-limit", std::to_string(policy.max_processes),
        "--ulimit", "nofile=" + fds + ":" + fds,
        "--ulimit", "fsize=" + file_size + ":" + file_size,
        "--ulimit", "core=0:0",
        "--read-only",
        "--tmpfs", "/tmp:rw,nosuid,nodev,size=" + std::to_string(config.tmpfs_size_mb) + "m,mode=1777",
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-v", request.workdir.string() + ":" + std::string{kMountPoint}
              + (request.writable_workdir ? ":rw" : ":ro"),
        "-w", std::string{kMountPoint}});

    for (const auto& [name, value] : allowed_environment(request)) {
        args.insert(args.end(), {"--env", name + "=" + value});
    }

    args.push_back(config.image_for(request.language));

    // Entry contract: <entry> --timeout S --cpu S --memory-kb KB -- argv...
    // A memory-kb of 0 leaves the address space unlimited (cgroup cap still applies).
    const uint64_t memory_kb = request.limit_address_space ? policy.memory_bytes / 1024 : 0;
    args.insert(args.end(), {
        config.entry_command,
        "--timeout", deadline_argument(request.timeout),
        "--cpu", std::to_string(policy.cpu_time_seconds),
        "--memory-kb", std::to_string(memory_kb),
        "--"});
    args.insert(args.end(), request.argv.begin(), request.argv.end());
    return args;
}

std::optional<Duration> ContainerBackend::container_run_time(std::string_view started_finished) {
    auto space = started_finished.find(' ');
    if (space == std::string_view::npos) return std::nullopt;
    auto started = parse_utc_timestamp(started_finished.substr(0, space));
    auto finished = parse_utc_timestamp(started_finished.substr(space + 1));
    if (!started || !finished || *finished < *started) return std::nullopt;
    return std::chrono::duration_cast<Duration>(*finished - *started);
}

std::string ContainerBackend::deadline_argument(std::chrono::milliseconds timeout) {
    const auto ms = std::max<int64_t>(timeout.count(), 1);
    auto fraction = std::to_string(ms % 1000);
    return std::to_string(ms / 1000) + "." + std::string(3 - fraction.size(), '0') + fraction;
}

std::string ContainerBackend::next_container_name() {
    return "code-sandbox-" + std::to_string(::getpid()) + "-"
           + std::to_string(sequence_.fetch_add(1) + 1);
}

Result<ExecutionOutcome> ContainerBackend::execute(const ExecutionRequest& request) {
    // The container user is not the engine's uid.
    auto shared = ::geteuid() == 0
        ? chown_tree(request.workdir, config_.sandbox_uid, config_.sandbox_gid)
        : open_tree_permissions(request.workdir, request.writable_workdir);
    if (!shared) return shared.error();

    const auto name = next_container_name();
    ContainerGuard guard{config_, name, poll_interval_};

    std::string kill_failure;
    SpawnOptions options;
    options.argv.push_back(config_.docker_binary);
    auto run_args = build_run_args(config_, request, name);
    options.argv.insert(options.argv.end(), run_args.begin(), run_args.end());
    options.env = current_environment();
    options.timeout = request.timeout + kSupervisorMargin;
    options.poll_interval = poll_interval_;
    options.max_output_bytes = request.policy.max_output_bytes;
    options.on_timeout = [&] {
        auto killed = run_docker(config_, {"kill", name}, kCleanupTimeout, poll_interval_);
        if (!killed) {
            kill_failure = killed.error().message;
        } else if (killed->exit_code != 0) {
            kill_failure = trim(killed->stderr_data);
        }
    };

    auto result = run_supervised(options);
    if (!result) return result.error();

    if (!result->timed_out && result->exit_code == kDockerRunFailure) {
        return Error{"docker run failed for image " + config_.image_for(request.language) + ": "
                     + trim(result->stderr_data),
                     ErrorKind::SetupFailure};
    }

    ExecutionOutcome outcome;
    outcome.exit_status = result->exit_code;
    outcome.stdout_data = std::move(result->stdout_data);
    outcome.stderr_data = std::move(result->stderr_data);
    const auto state = guard.inspect();
    // Program time as seen inside the container; creation and teardown excluded.
    outcome.wall_duration = state.run_time.value_or(result->wall_duration);
    outcome.timed_out = result->timed_out || result->exit_code == kEntryTimeoutExit;
    outcome.output_truncated = result->output_truncated;
    outcome.backend_used = BackendKind::Container;
    if (result->exit_code > 128 && result->exit_code < 128 + 65) {
        outcome.term_signal = result->exit_code - 128;
    }

    if (state.oom_killed) {
        outcome.failure = FailureKind::ResourceExceeded;
        outcome.diagnostic = "container killed: out of memory";
    }
    if (!kill_failure.empty()) {
        outcome.diagnostic += (outcome.diagnostic.empty() ? "" : "; ");
        outcome.diagnostic += "docker kill failed: " + kill_failure;
    }
    if (auto removed = guard.remove(); !removed) {
        outcome.diagnostic += (outcome.diagnostic.empty() ? "" : "; ");
        outcome.diagnostic += removed.error().message;
    }
    return outcome;
}

}  // namespace code_sandbox
