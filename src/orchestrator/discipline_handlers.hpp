/**
 * @file discipline_handlers.hpp
 * @brief The six test disciplines as a closed variant of handlers.
 * @author Dimitris Kafetzis
 *
 * Every handler performs at most one sandbox execution, never retries, and
 * maps execution failures through the same common rules before applying
 * its own interpretation of a successful run.
 */

#pragma once

#include "core/concepts.hpp"
#include "orchestrator/submission.hpp"
#include "sandbox/sandbox_executor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace code_sandbox {

// ─────────────────────────────────────────────
// Common rules
// ─────────────────────────────────────────────

[[nodiscard]] TestVerdict make_verdict(const Submission& submission,
                                       VerdictStatus status,
                                       FailureKind failure,
                                       std::string message,
                                       std::shared_ptr<const ExecutionOutcome> outcome = nullptr);

/// Human-readable reason an execution did not succeed.
[[nodiscard]] std::string describe_failure(const ExecutionOutcome& outcome);

/**
 * @brief Terminal verdict for an execution that did not succeed.
 *
 * CompileError, SetupFailure and BackendUnavailable give Error; a timeout,
 * ResourceExceeded or RuntimeFailure gives Failed. Returns nullopt when the
 * run succeeded and the handler should interpret it.
 */
[[nodiscard]] std::optional<TestVerdict> apply_common_rules(
    const Submission& submission, const std::shared_ptr<const ExecutionOutcome>& outcome);

// ─────────────────────────────────────────────
// Handlers
// ─────────────────────────────────────────────

/// Passed iff the artifact exits 0 within its timeout.
class BasicHandler {
public:
    explicit BasicHandler(EvaluationSettings settings) : settings_(std::move(settings)) {}
    static constexpr Discipline discipline() noexcept { return Discipline::Basic; }
    [[nodiscard]] TestVerdict evaluate(const Submission& submission, SandboxExecutor& executor) const;

private:
    EvaluationSettings settings_;
};

/**
 * @brief Provided tests, or a synthesized harness, run against the artifact.
 *
 * Python and JavaScript get a generated harness when no tests are given;
 * Java and C# run the provided test driver as the entry point with the
 * artifact compiled beside it, or else the artifact's own main.
 */
class UnitHandler {
public:
    explicit UnitHandler(EvaluationSettings settings) : settings_(std::move(settings)) {}
    static constexpr Discipline discipline() noexcept { return Discipline::Unit; }
    [[nodiscard]] TestVerdict evaluate(const Submission& submission, SandboxExecutor& executor) const;

    /// The execution unit the handler would run.
    [[nodiscard]] ExecutionUnit build_unit(const Submission& submission,
                                           const SandboxExecutor& executor) const;

private:
    EvaluationSettings settings_;
};

/// Artifact composed with its companions and an optional scenario driver.
class IntegrationHandler {
public:
    explicit IntegrationHandler(EvaluationSettings settings) : settings_(std::move(settings)) {}
    static constexpr Discipline discipline() noexcept { return Discipline::Integration; }
    [[nodiscard]] TestVerdict evaluate(const Submission& submission, SandboxExecutor& executor) const;

    [[nodiscard]] ExecutionUnit build_unit(const Submission& submission,
                                           const SandboxExecutor& executor) const;

private:
    EvaluationSettings settings_;
};

/// One timed run; thresholds are optional.
class PerformanceHandler {
public:
    explicit PerformanceHandler(EvaluationSettings settings) : settings_(std::move(settings)) {}
    static constexpr Discipline discipline() noexcept { return Discipline::Performance; }
    [[nodiscard]] TestVerdict evaluate(const Submission& submission, SandboxExecutor& executor) const;

private:
    EvaluationSettings settings_;
};

/// Python line coverage against `min_coverage_percent`.
class CoverageHandler {
public:
    explicit CoverageHandler(EvaluationSettings settings) : settings_(std::move(settings)) {}
    static constexpr Discipline discipline() noexcept { return Discipline::Coverage; }
    [[nodiscard]] TestVerdict evaluate(const Submission& submission, SandboxExecutor& executor) const;

private:
    EvaluationSettings settings_;
};

/// Static pattern scan, then the standard execution.
class SecurityHandler {
public:
    explicit SecurityHandler(EvaluationSettings settings) : settings_(std::move(settings)) {}
    static constexpr Discipline discipline() noexcept { return Discipline::Security; }
    [[nodiscard]] TestVerdict evaluate(const Submission& submission, SandboxExecutor& executor) const;

private:
    EvaluationSettings settings_;
};

static_assert(DisciplineHandlerLike<BasicHandler>);
static_assert(DisciplineHandlerLike<UnitHandler>);
static_assert(DisciplineHandlerLike<IntegrationHandler>);
static_assert(DisciplineHandlerLike<PerformanceHandler>);
static_assert(DisciplineHandlerLike<CoverageHandler>);
static_assert(DisciplineHandlerLike<SecurityHandler>);

using DisciplineHandler = std::variant<BasicHandler, UnitHandler, IntegrationHandler,
                                       PerformanceHandler, CoverageHandler, SecurityHandler>;

[[nodiscard]] DisciplineHandler make_handler(Discipline discipline, const EvaluationSettings& settings);

}  // namespace code_sandbox
