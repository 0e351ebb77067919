/**
 * @file result.hpp
 * @brief Monadic error handling type for CodeSandbox.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Sandbox
 * infrastructure failures (backend probing, workspace setup, config I/O)
 * travel as Result errors tagged with an ErrorKind; failures of the code
 * under test travel as FailureKind values on outcomes instead.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <type_traits>
#include <utility>
#include <stdexcept>

namespace code_sandbox {

/**
 * @brief Coarse classification of infrastructure errors.
 */
enum class ErrorKind : uint8_t {
    Generic,
    BackendUnavailable,   ///< Isolation backend cannot initialize
    SetupFailure,         ///< Artifact, workspace or image preparation failed
    Config,               ///< Invalid configuration or manifest
    Io                    ///< Filesystem / report persistence failure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic:            return "generic";
        case ErrorKind::BackendUnavailable: return "backend_unavailable";
        case ErrorKind::SetupFailure:       return "setup_failure";
        case ErrorKind::Config:             return "config";
        case ErrorKind::Io:                 return "io";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct Error {
    std::string message;
    ErrorKind kind = ErrorKind::Generic;

    explicit Error(std::string msg, ErrorKind k = ErrorKind::Generic)
        : message(std::move(msg)), kind(k) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 *
 * Used when an operation can fail but has no return value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T>
Result<T> make_error(std::string message, ErrorKind kind = ErrorKind::Generic) {
    return Result<T>(Error{std::move(message), kind});
}

}  // namespace code_sandbox
