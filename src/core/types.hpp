/**
 * @file types.hpp
 * @brief Fundamental types used throughout CodeSandbox.
 * @author Dimitris Kafetzis
 *
 * Defines the closed language/discipline/backend enumerations, the
 * ResourceLimitPolicy, ExecutionUnit and ExecutionOutcome value types, and
 * the TestVerdict produced by discipline handlers.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using SubtaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Closed Enumerations
// ─────────────────────────────────────────────

enum class Language : uint8_t {
    Python,
    JavaScript,
    Java,
    CSharp
};

inline constexpr std::array<Language, 4> kAllLanguages{
    Language::Python, Language::JavaScript, Language::Java, Language::CSharp};

enum class Discipline : uint8_t {
    Basic,
    Unit,
    Integration,
    Performance,
    Coverage,
    Security
};

inline constexpr std::array<Discipline, 6> kAllDisciplines{
    Discipline::Basic, Discipline::Unit, Discipline::Integration,
    Discipline::Performance, Discipline::Coverage, Discipline::Security};

enum class BackendKind : uint8_t {
    Container,
    Subprocess
};

/**
 * @brief Why an execution (or a verdict) did not succeed.
 *
 * Carried as a value on outcomes and verdicts; expected failures are never
 * thrown.
 */
enum class FailureKind : uint8_t {
    None,
    BackendUnavailable,   ///< Isolation backend cannot initialize
    SetupFailure,         ///< Workspace/image/toolchain preparation failed
    CompileError,         ///< Language compile step failed
    RuntimeFailure,       ///< Non-zero exit, signal, assertion failure
    TimeoutExceeded,      ///< Wall-clock budget exceeded
    ResourceExceeded      ///< Memory/output/CPU/file-size cap hit
};

enum class VerdictStatus : uint8_t {
    Pending,
    Running,
    Passed,
    Failed,
    Error
};

enum class MetricKind : uint8_t {
    DurationMs,
    MemoryKb,
    CoveragePercent,
    FindingCount
};

enum class Severity : uint8_t {
    Low,
    Medium,
    High
};

[[nodiscard]] constexpr std::string_view to_string(Language language) noexcept {
    switch (language) {
        case Language::Python:     return "python";
        case Language::JavaScript: return "javascript";
        case Language::Java:       return "java";
        case Language::CSharp:     return "csharp";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(Discipline discipline) noexcept {
    switch (discipline) {
        case Discipline::Basic:       return "basic";
        case Discipline::Unit:        return "unit";
        case Discipline::Integration: return "integration";
        case Discipline::Performance: return "performance";
        case Discipline::Coverage:    return "coverage";
        case Discipline::Security:    return "security";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Container:  return "container";
        case BackendKind::Subprocess: return "subprocess";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None:               return "none";
        case FailureKind::BackendUnavailable: return "backend_unavailable";
        case FailureKind::SetupFailure:       return "setup_failure";
        case FailureKind::CompileError:       return "compile_error";
        case FailureKind::RuntimeFailure:     return "runtime_failure";
        case FailureKind::TimeoutExceeded:    return "timeout_exceeded";
        case FailureKind::ResourceExceeded:   return "resource_exceeded";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(VerdictStatus status) noexcept {
    switch (status) {
        case VerdictStatus::Pending: return "pending";
        case VerdictStatus::Running: return "running";
        case VerdictStatus::Passed:  return "passed";
        case VerdictStatus::Failed:  return "failed";
        case VerdictStatus::Error:   return "error";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::DurationMs:      return "duration_ms";
        case MetricKind::MemoryKb:        return "memory_kb";
        case MetricKind::CoveragePercent: return "coverage_pct";
        case MetricKind::FindingCount:    return "finding_count";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:    return "low";
        case Severity::Medium: return "medium";
        case Severity::High:   return "high";
    }
    return "unknown";
}

/// Parse helpers used at the config/manifest boundary only.
[[nodiscard]] std::optional<Language> parse_language(std::string_view text) noexcept;
[[nodiscard]] std::optional<Discipline> parse_discipline(std::string_view text) noexcept;
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text) noexcept;

/// Java and C# need a compile step before they can run.
[[nodiscard]] constexpr bool requires_compilation(Language language) noexcept {
    return language == Language::Java || language == Language::CSharp;
}

// ─────────────────────────────────────────────
// Resource Limit Policy
// ─────────────────────────────────────────────

/**
 * @brief Declarative limits applied to a single sandbox execution.
 *
 * Network access and privileged execution are off unless explicitly
 * requested.
 */
struct ResourceLimitPolicy {
    uint32_t cpu_time_seconds{10};
    uint64_t memory_bytes{500ULL * 1024 * 1024};
    uint32_t wall_timeout_seconds{10};
    uint32_t compile_timeout_seconds{10};
    uint64_t max_output_bytes{1024 * 1024};
    uint64_t max_file_size_bytes{10ULL * 1024 * 1024};
    uint32_t max_file_descriptors{64};
    uint32_t max_processes{64};
    uint32_t cpu_cores{1};
    bool network_enabled{false};
    bool run_as_privileged{false};

    /// Defaults for the same-host subprocess fallback.
    [[nodiscard]] static ResourceLimitPolicy subprocess_default() noexcept;

    /// Defaults for container isolation.
    [[nodiscard]] static ResourceLimitPolicy container_default() noexcept;

    /// Default for the given backend.
    [[nodiscard]] static ResourceLimitPolicy for_backend(BackendKind kind) noexcept;

    [[nodiscard]] std::chrono::seconds wall_timeout() const noexcept {
        return std::chrono::seconds{wall_timeout_seconds};
    }

    [[nodiscard]] std::chrono::seconds compile_timeout() const noexcept {
        return std::chrono::seconds{compile_timeout_seconds};
    }

    /// Empty string when the policy is usable, otherwise the first problem.
    [[nodiscard]] std::string validate() const;

    bool operator==(const ResourceLimitPolicy&) const = default;
};

// ─────────────────────────────────────────────
// Execution Unit
// ─────────────────────────────────────────────

struct SourceFile {
    std::string name;       ///< Relative file name inside the workspace
    std::string content;

    bool operator==(const SourceFile&) const = default;
};

/**
 * @brief A code artifact ready to be materialized in a sandbox.
 *
 * Created per artifact by a LanguageAdapter, immutable afterwards, consumed
 * by exactly one SandboxExecutor invocation.
 */
class ExecutionUnit {
public:
    ExecutionUnit(Language language,
                  std::string entry_file,
                  std::string source,
                  std::vector<SourceFile> companions = {},
                  std::optional<std::filesystem::path> compiled_artifact = std::nullopt)
        : language_(language)
        , entry_file_(std::move(entry_file))
        , source_(std::move(source))
        , companions_(std::move(companions))
        , compiled_artifact_(std::move(compiled_artifact)) {}

    [[nodiscard]] Language language() const noexcept { return language_; }
    [[nodiscard]] const std::string& entry_file() const noexcept { return entry_file_; }
    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] const std::vector<SourceFile>& companions() const noexcept { return companions_; }
    [[nodiscard]] const std::optional<std::filesystem::path>& compiled_artifact() const noexcept {
        return compiled_artifact_;
    }

private:
    Language language_;
    std::string entry_file_;
    std::string source_;
    std::vector<SourceFile> companions_;
    std::optional<std::filesystem::path> compiled_artifact_;
};

// ─────────────────────────────────────────────
// Execution Outcome
// ─────────────────────────────────────────────

/**
 * @brief Everything observed about one sandbox execution.
 */
struct ExecutionOutcome {
    int exit_status{-1};
    std::optional<int> term_signal;
    std::string stdout_data;
    std::string stderr_data;
    Duration wall_duration{0};
    uint64_t peak_memory_bytes{0};          ///< Best effort, 0 when unknown
    bool timed_out{false};
    bool output_truncated{false};
    BackendKind backend_used{BackendKind::Subprocess};
    FailureKind failure{FailureKind::None};
    std::string diagnostic;                 ///< Supervisor-side detail

    [[nodiscard]] bool succeeded() const noexcept {
        return failure == FailureKind::None && exit_status == 0 && !timed_out;
    }

    [[nodiscard]] double duration_ms() const noexcept {
        return static_cast<double>(wall_duration.count()) / 1000.0;
    }
};

// ─────────────────────────────────────────────
// Test Verdict
// ─────────────────────────────────────────────

struct PrimaryMetric {
    MetricKind kind{MetricKind::DurationMs};
    double value{0.0};
};

struct SecurityFinding {
    std::string pattern;        ///< e.g. "eval usage"
    Severity severity{Severity::Medium};
    uint32_t line{0};
    uint32_t column{0};
    std::string excerpt;
};

/**
 * @brief Structured result of applying one discipline to one artifact.
 */
struct TestVerdict {
    SubtaskId subtask_id;
    Discipline discipline{Discipline::Basic};
    VerdictStatus status{VerdictStatus::Pending};
    FailureKind failure{FailureKind::None};
    std::optional<PrimaryMetric> metric;
    std::string message;
    std::vector<SecurityFinding> findings;
    std::shared_ptr<const ExecutionOutcome> outcome;

    [[nodiscard]] bool passed() const noexcept { return status == VerdictStatus::Passed; }
    [[nodiscard]] bool is_error() const noexcept { return status == VerdictStatus::Error; }
};

}  // namespace code_sandbox
