/**
 * @file subprocess.cpp
 * @brief run_supervised(): fork/exec with rlimits and a poll()-driven watchdog.
 * @author Dimitris Kafetzis
 *
 * Child setup order: process group, stdio, working directory, network
 * namespace, rlimits, no_new_privs, credentials, exec. Any failure before
 * exec is written to a close-on-exec status pipe as {stage, errno} and the
 * child exits with 127; a successful exec closes the pipe with no data.
 */

#include "sandbox/subprocess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace code_sandbox {

namespace {

// ─────────────────────────────────────────────
// Internal helpers
// ─────────────────────────────────────────────

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Result<Pipe> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{std::string{"pipe2 failed: "} + std::strerror(errno), ErrorKind::SetupFailure};
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

enum class ChildStage : int {
    ProcessGroup = 1,
    Stdio,
    WorkingDir,
    Network,
    Limits,
    NoNewPrivs,
    Credentials,
    Exec
};

const char* stage_name(int stage) {
    switch (static_cast<ChildStage>(stage)) {
        case ChildStage::ProcessGroup: return "setpgid";
        case ChildStage::Stdio:        return "stdio redirection";
        case ChildStage::WorkingDir:   return "chdir";
        case ChildStage::Network:      return "network namespace";
        case ChildStage::Limits:       return "setrlimit";
        case ChildStage::NoNewPrivs:   return "no_new_privs";
        case ChildStage::Credentials:  return "privilege drop";
        case ChildStage::Exec:         return "exec";
    }
    return "child setup";
}

struct ChildFailure {
    int stage;
    int error;
};

[[noreturn]] void child_fail(int status_fd, ChildStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;  // nothing left to report to if the status pipe is gone
    ::_exit(127);
}

bool apply_limit(int resource, uint64_t value) {
    struct rlimit lim {};
    lim.rlim_cur = static_cast<rlim_t>(value);
    lim.rlim_max = static_cast<rlim_t>(value);
    return ::setrlimit(resource, &lim) == 0;
}

bool apply_limits(const RlimitSet& limits) {
    if (limits.cpu_seconds) {
        // Soft limit delivers SIGXCPU; the hard limit one second later is SIGKILL.
        struct rlimit lim {};
        lim.rlim_cur = static_cast<rlim_t>(*limits.cpu_seconds);
        lim.rlim_max = static_cast<rlim_t>(*limits.cpu_seconds + 1);
        if (::setrlimit(RLIMIT_CPU, &lim) != 0) return false;
    }
    if (limits.address_space_bytes && !apply_limit(RLIMIT_AS, *limits.address_space_bytes))
        return false;
    if (limits.file_size_bytes && !apply_limit(RLIMIT_FSIZE, *limits.file_size_bytes))
        return false;
    if (limits.open_files && !apply_limit(RLIMIT_NOFILE, *limits.open_files))
        return false;
    if (limits.processes && !apply_limit(RLIMIT_NPROC, *limits.processes))
        return false;
    if (limits.disable_core_dumps && !apply_limit(RLIMIT_CORE, 0))
        return false;
    return true;
}

/**
 * @brief Kills and reaps the child on every exit path that did not reap it.
 */
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (reaped_) return;
        ::kill(-pid_, SIGKILL);
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    void kill_group() const noexcept {
        ::kill(-pid_, SIGKILL);
    }

    /// Blocking reap; fills status and rusage.
    bool reap(int& status, struct rusage& usage) {
        while (true) {
            pid_t r = ::wait4(pid_, &status, 0, &usage);
            if (r == pid_) {
                reaped_ = true;
                return true;
            }
            if (r < 0 && errno != EINTR) return false;
        }
    }

    /// True once the main process has exited; it stays a zombie until reap().
    [[nodiscard]] bool has_exited() const {
        siginfo_t info{};
        info.si_pid = 0;
        if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            return errno == ECHILD;
        }
        return info.si_pid == pid_;
    }

private:
    pid_t pid_;
    bool reaped_ = false;
};

struct StreamState {
    UniqueFd fd;
    std::string* sink;
    bool open = true;
};

/// Drain whatever is readable; returns false on EOF or hard error.
bool drain(StreamState& stream, uint64_t cap, bool& truncated) {
    std::array<char, 65536> buffer;
    ssize_t n = ::read(stream.fd.get(), buffer.data(), buffer.size());
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN;
    }
    if (n == 0) return false;

    auto room = cap > stream.sink->size() ? cap - stream.sink->size() : 0;
    auto take = std::min<uint64_t>(room, static_cast<uint64_t>(n));
    stream.sink->append(buffer.data(), static_cast<size_t>(take));
    if (take < static_cast<uint64_t>(n)) truncated = true;
    return true;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// run_supervised
// ─────────────────────────────────────────────

Result<ProcessResult> run_supervised(const SpawnOptions& options) {
    if (options.argv.empty()) {
        return Error{"Empty command line", ErrorKind::SetupFailure};
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    auto env_strings = to_envp_strings(options.env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) envp.push_back(entry.data());
    envp.push_back(nullptr);

    const std::string working_dir = options.working_dir.string();

    auto out_pipe = make_pipe();
    if (!out_pipe) return out_pipe.error();
    auto err_pipe = make_pipe();
    if (!err_pipe) return err_pipe.error();
    auto status_pipe = make_pipe();
    if (!status_pipe) return status_pipe.error();

    UniqueFd dev_null{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (!dev_null.valid()) {
        return Error{std::string{"open /dev/null failed: "} + std::strerror(errno),
                     ErrorKind::SetupFailure};
    }

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{std::string{"fork failed: "} + std::strerror(errno), ErrorKind::SetupFailure};
    }

    if (pid == 0) {
        // ── Child: async-signal-safe calls only ──
        const int status_fd = status_pipe->write_end.get();

        if (::setpgid(0, 0) != 0) child_fail(status_fd, ChildStage::ProcessGroup);

        if (::dup2(dev_null.get(), STDIN_FILENO) < 0
            || ::dup2(out_pipe->write_end.get(), STDOUT_FILENO) < 0
            || ::dup2(err_pipe->write_end.get(), STDERR_FILENO) < 0) {
            child_fail(status_fd, ChildStage::Stdio);
        }

        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            child_fail(status_fd, ChildStage::WorkingDir);
        }

        if (options.unshare_network && ::unshare(CLONE_NEWNET) != 0) {
            child_fail(status_fd, ChildStage::Network);
        }

        if (!apply_limits(options.limits)) child_fail(status_fd, ChildStage::Limits);

        if (options.no_new_privileges && ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
            child_fail(status_fd, ChildStage::NoNewPrivs);
        }

        if (options.drop_to) {
            if (::setgroups(0, nullptr) != 0
                || ::setgid(static_cast<gid_t>(options.drop_to->gid)) != 0
                || ::setuid(static_cast<uid_t>(options.drop_to->uid)) != 0) {
                child_fail(status_fd, ChildStage::Credentials);
            }
        }

        ::execvpe(argv[0], argv.data(), envp.data());
        child_fail(status_fd, ChildStage::Exec);
    }

    // ── Parent ───────────────────────────────
    ChildGuard child{pid};
    out_pipe->write_end.reset();
    err_pipe->write_end.reset();
    status_pipe->write_end.reset();
    dev_null.reset();

    ChildFailure failure{};
    ssize_t got;
    do {
        got = ::read(status_pipe->read_end.get(), &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        struct rusage usage {};
        child.reap(status, usage);
        return Error{"Cannot start '" + options.argv.front() + "': "
                     + stage_name(failure.stage) + " failed: " + std::strerror(failure.error),
                     ErrorKind::SetupFailure};
    }

    ProcessResult result;
    std::array<StreamState, 2> streams{
        StreamState{std::move(out_pipe->read_end), &result.stdout_data},
        StreamState{std::move(err_pipe->read_end), &result.stderr_data}};

    const auto deadline = start + options.timeout;
    const auto poll_interval = std::max(options.poll_interval, std::chrono::milliseconds{1});
    // Descendants that escaped the group may keep a pipe open; stop waiting
    // for EOF this long after the main process is gone.
    constexpr auto kDrainGrace = std::chrono::milliseconds{250};

    bool exited = false;
    std::optional<SteadyTime> drain_until;

    while (true) {
        if (!exited && child.has_exited()) {
            exited = true;
            child.kill_group();
            drain_until = std::chrono::steady_clock::now() + kDrainGrace;
        }

        const bool any_open = streams[0].open || streams[1].open;
        const auto now = std::chrono::steady_clock::now();

        if (exited && (!any_open || now >= *drain_until)) break;

        if (!exited && now >= deadline) {
            result.timed_out = true;
            child.kill_group();
            if (options.on_timeout) options.on_timeout();
            exited = true;
            drain_until = std::chrono::steady_clock::now() + kDrainGrace;
            continue;
        }

        auto limit = exited ? *drain_until : deadline;
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now);
        wait = std::clamp(wait, std::chrono::milliseconds{0}, poll_interval);

        if (!any_open) {
            ::poll(nullptr, 0, static_cast<int>(wait.count()));
            continue;
        }

        std::array<pollfd, 2> fds{};
        std::array<StreamState*, 2> owners{};
        nfds_t nfds = 0;
        for (auto& stream : streams) {
            if (!stream.open) continue;
            fds[nfds] = pollfd{stream.fd.get(), POLLIN, 0};
            owners[nfds] = &stream;
            ++nfds;
        }

        int ready = ::poll(fds.data(), nfds, static_cast<int>(wait.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return Error{std::string{"poll failed: "} + std::strerror(errno),
                         ErrorKind::SetupFailure};
        }
        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                if (!drain(*owners[i], options.max_output_bytes, result.output_truncated)) {
                    owners[i]->open = false;
                    owners[i]->fd.reset();
                }
            }
        }

        // Past the output cap nothing more is kept, so stop the producer now.
        if (result.output_truncated && !exited) {
            child.kill_group();
            exited = true;
            drain_until = std::chrono::steady_clock::now() + kDrainGrace;
        }
    }

    int status = 0;
    struct rusage usage {};
    if (!child.reap(status, usage)) {
        return Error{std::string{"wait4 failed: "} + std::strerror(errno),
                     ErrorKind::SetupFailure};
    }

    result.wall_duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start);
    result.peak_rss_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + WTERMSIG(status);
    }

    return result;
}

}  // namespace code_sandbox
