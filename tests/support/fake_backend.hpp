/**
 * @file fake_backend.hpp
 * @brief Scripted isolation backend and helpers shared by the test suites.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "sandbox/isolation_backend.hpp"
#include "telemetry/json_sink.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace code_sandbox::test_support {

/**
 * @brief Backend whose probe result and execution outcomes are scripted.
 *
 * Every request is recorded together with a snapshot of the workspace
 * files, since the workspace is removed as soon as the executor returns.
 */
class FakeBackend final : public IIsolationBackend {
public:
    using Handler = std::function<Result<ExecutionOutcome>(const ExecutionRequest&)>;

    struct Seen {
        ExecutionRequest request;
        std::vector<SourceFile> files;
    };

    explicit FakeBackend(BackendKind kind = BackendKind::Subprocess,
                         std::string name = "fake")
        : kind_(kind), name_(std::move(name)) {}

    Result<void> probe() override {
        ++probe_count_;
        if (!available_) return Error{name_ + " unavailable", ErrorKind::BackendUnavailable};
        return {};
    }

    Result<ExecutionOutcome> execute(const ExecutionRequest& request) override {
        {
            std::lock_guard lock(mutex_);
            seen_.push_back({request, snapshot(request.workdir)});
        }
        if (handler_) return handler_(request);
        ExecutionOutcome outcome;
        outcome.exit_status = 0;
        outcome.backend_used = kind_;
        return outcome;
    }

    [[nodiscard]] BackendKind kind() const noexcept override { return kind_; }
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    void set_available(bool available) { available_ = available; }
    void set_handler(Handler handler) { handler_ = std::move(handler); }

    [[nodiscard]] int probe_count() const noexcept { return probe_count_; }

    [[nodiscard]] std::vector<Seen> seen() const {
        std::lock_guard lock(mutex_);
        return seen_;
    }

    /// Outcome of a program that exited with `status` after `ms` milliseconds.
    static ExecutionOutcome exited(int status, int64_t ms = 5, std::string out = {},
                                   std::string err = {}) {
        ExecutionOutcome outcome;
        outcome.exit_status = status;
        outcome.wall_duration = std::chrono::milliseconds{ms};
        outcome.stdout_data = std::move(out);
        outcome.stderr_data = std::move(err);
        return outcome;
    }

private:
    static std::vector<SourceFile> snapshot(const std::filesystem::path& root) {
        std::vector<SourceFile> files;
        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file()) continue;
            std::ifstream in(it->path());
            std::ostringstream content;
            content << in.rdbuf();
            files.push_back({std::filesystem::relative(it->path(), root).string(), content.str()});
        }
        return files;
    }

    BackendKind kind_;
    std::string name_;
    bool available_ = true;
    int probe_count_ = 0;
    Handler handler_;
    std::vector<Seen> seen_;
    mutable std::mutex mutex_;
};

/// Logger that discards everything.
inline std::unique_ptr<Logger> quiet_logger() {
    return std::make_unique<Logger>(std::make_unique<NullSink>(), LogLevel::Error);
}

/// In-memory sink for asserting on emitted lines.
class CaptureSink final : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines)
        : lines_(std::move(lines)) {}

    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

/// True when `tool` resolves to an executable on PATH.
inline bool tool_available(std::string_view tool) {
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::stringstream dirs{path};
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        auto candidate = std::filesystem::path{dir} / tool;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)
            && ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace code_sandbox::test_support
