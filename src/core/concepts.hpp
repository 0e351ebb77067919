/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for CodeSandbox's closed variant sets.
 * @author Dimitris Kafetzis
 *
 * Language adapters and discipline handlers are closed sets held in
 * std::variant and dispatched with std::visit. These concepts pin down the
 * shape every alternative must have; each set is checked with static_assert
 * next to its definition.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

// Forward declarations
struct CommandTemplate;
struct Submission;
class SandboxExecutor;

// ─────────────────────────────────────────────
// LanguageAdapterLike
// ─────────────────────────────────────────────

/**
 * @concept LanguageAdapterLike
 * @brief Per-language recipe: files, optional compile step, run command.
 */
template <typename T>
concept LanguageAdapterLike = requires(
    const T adapter,
    std::string source,
    std::vector<SourceFile> companions,
    const ExecutionUnit& unit,
    const ResourceLimitPolicy& policy
) {
    { T::language() } -> std::same_as<Language>;
    { adapter.prepare(source, companions) } -> std::same_as<ExecutionUnit>;
    { adapter.layout(unit) } -> std::same_as<std::vector<SourceFile>>;
    { adapter.compile_command(unit, policy) } -> std::same_as<std::optional<CommandTemplate>>;
    { adapter.invocation_for(unit, policy) } -> std::same_as<CommandTemplate>;
};

// ─────────────────────────────────────────────
// DisciplineHandlerLike
// ─────────────────────────────────────────────

/**
 * @concept DisciplineHandlerLike
 * @brief Turns one submission into one verdict using the executor.
 */
template <typename T>
concept DisciplineHandlerLike = requires(
    const T handler,
    const Submission& submission,
    SandboxExecutor& executor
) {
    { T::discipline() } -> std::same_as<Discipline>;
    { handler.evaluate(submission, executor) } -> std::same_as<TestVerdict>;
};

}  // namespace code_sandbox
