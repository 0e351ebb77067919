/**
 * @file developer_client.hpp
 * @brief Seam to the code-generating collaborator.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace code_sandbox {

/**
 * @brief What the engine tells the developer after a failed attempt.
 */
struct RevisionRequest {
    SubtaskId subtask_id;
    std::string failure_message;
    Discipline discipline{Discipline::Basic};
    Language language{Language::Python};
    std::string prior_code;
    FailureKind failure{FailureKind::None};
    uint32_t attempt{1};           ///< Attempt that just failed (1-based)
};

/**
 * @brief Abstract interface for the developer collaborator.
 *
 * Returning nullopt declines the revision, which ends the retry loop.
 */
class IDeveloperClient {
public:
    virtual ~IDeveloperClient() = default;
    virtual std::optional<std::string> revise(const RevisionRequest& request) = 0;
};

/**
 * @brief Developer that never revises; used when no generator is attached.
 */
class DecliningDeveloper final : public IDeveloperClient {
public:
    std::optional<std::string> revise(const RevisionRequest&) override { return std::nullopt; }
};

}  // namespace code_sandbox
