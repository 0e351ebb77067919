/**
 * @file submission.hpp
 * @brief What a developer hands to the engine for one subtask.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace code_sandbox {

/**
 * @brief One artifact to be evaluated under one discipline.
 */
struct Submission {
    SubtaskId id;
    std::string description;
    Language language{Language::Python};
    Discipline discipline{Discipline::Basic};
    std::string code;
    std::optional<std::string> test_code;       ///< Unit: replaces the synthesized harness
    std::optional<std::string> scenario_code;   ///< Integration: driver run after composition
    std::vector<SourceFile> companions;         ///< Other subtasks' artifacts (name = subtask id)
    std::optional<ResourceLimitPolicy> policy;  ///< Unset = backend default from config
    std::optional<std::chrono::milliseconds> timeout;  ///< Unset = policy wall timeout
};

/**
 * @brief Engine-wide inputs every discipline handler needs.
 */
struct EvaluationSettings {
    ResourceLimitPolicy default_policy;
    DisciplineConfig disciplines;

    [[nodiscard]] ResourceLimitPolicy policy_for(const Submission& submission) const {
        return submission.policy.value_or(default_policy);
    }

    [[nodiscard]] std::chrono::milliseconds timeout_for(const Submission& submission) const {
        if (submission.timeout) return *submission.timeout;
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            policy_for(submission).wall_timeout());
    }
};

}  // namespace code_sandbox
