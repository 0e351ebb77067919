/**
 * @file feedback_controller.hpp
 * @brief Bounded evaluate → revise → re-evaluate loop per subtask.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "feedback/developer_client.hpp"
#include "orchestrator/submission.hpp"
#include "orchestrator/test_orchestrator.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace code_sandbox {

class MetricsCollector;

/**
 * @brief Per-subtask retry bookkeeping.
 *
 * Created on the first failure, discarded when the subtask passes or its
 * attempts are exhausted.
 */
struct RetryState {
    SubtaskId subtask_id;
    uint32_t attempt_count{0};
    std::string last_failure_message;
};

struct AttemptRecord {
    uint32_t attempt{1};
    VerdictStatus status{VerdictStatus::Pending};
    FailureKind failure{FailureKind::None};
    std::string message;
};

/**
 * @brief One report row: the final verdict plus how it was reached.
 */
struct FinalResult {
    TestVerdict verdict;
    Language language{Language::Python};
    uint32_t attempts{0};
    bool retries_exhausted{false};
    bool revision_declined{false};
    std::vector<AttemptRecord> history;
};

class FeedbackController {
public:
    /// Total attempts are 1 + max_retries.
    FeedbackController(ITestEvaluator& evaluator,
                       IDeveloperClient& developer,
                       Logger& logger,
                       uint32_t max_retries = 2,
                       MetricsCollector* metrics = nullptr);

    /**
     * @brief Evaluate, and on Failed or Error ask for a revision and retry.
     *
     * Stops on Passed, when the developer declines, or after the last
     * allowed attempt. A final failure message ends with the attempt count.
     */
    FinalResult attempt(const Submission& submission);

    [[nodiscard]] uint32_t max_attempts() const noexcept { return max_retries_ + 1; }

    /// Live retry state of a subtask, if it has one.
    [[nodiscard]] std::optional<RetryState> retry_state(const SubtaskId& id) const;

private:
    /// Returns the subtask's failure count so far.
    uint32_t record_failure(const SubtaskId& id, const std::string& message);
    void discard(const SubtaskId& id);

    ITestEvaluator& evaluator_;
    IDeveloperClient& developer_;
    Logger& logger_;
    uint32_t max_retries_;
    MetricsCollector* metrics_;

    std::unordered_map<SubtaskId, RetryState> retry_states_;
    mutable std::mutex retry_mutex_;
};

}  // namespace code_sandbox
