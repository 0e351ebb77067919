/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author Dimitris Kafetzis
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations)
 * and a thread-safe Logger front-end. Every line is a self-contained JSON
 * object, so untrusted text (compiler diagnostics, program stderr) is escaped
 * before it reaches a sink.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace code_sandbox {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// ILogSink (virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * The optional component tag is emitted as a "component" field so that
 * backend, executor and feedback lines can be filtered apart.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    std::string component = {});

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::string component_;
    mutable std::mutex mutex_;
};

}  // namespace code_sandbox
