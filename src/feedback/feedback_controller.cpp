/**
 * @file feedback_controller.cpp
 * @brief FeedbackController implementation.
 * @author Dimitris Kafetzis
 */

#include "feedback/feedback_controller.hpp"

#include "telemetry/metrics_collector.hpp"

#include <exception>

namespace code_sandbox {

namespace {

std::string final_suffix(uint32_t attempts) {
    return " (final after " + std::to_string(attempts)
           + (attempts == 1 ? " attempt)" : " attempts)");
}

}  // anonymous namespace

FeedbackController::FeedbackController(ITestEvaluator& evaluator,
                                       IDeveloperClient& developer,
                                       Logger& logger,
                                       uint32_t max_retries,
                                       MetricsCollector* metrics)
    : evaluator_(evaluator)
    , developer_(developer)
    , logger_(logger)
    , max_retries_(max_retries)
    , metrics_(metrics) {}

FinalResult FeedbackController::attempt(const Submission& submission) {
    Submission current = submission;
    FinalResult result;
    result.language = submission.language;

    for (uint32_t attempt = 1;; ++attempt) {
        TestVerdict verdict = evaluator_.evaluate(current);
        result.attempts = attempt;
        result.history.push_back({attempt, verdict.status, verdict.failure, verdict.message});
        if (metrics_) metrics_->record_verdict(verdict, attempt);

        if (verdict.passed()) {
            discard(submission.id);
            result.verdict = std::move(verdict);
            return result;
        }

        const uint32_t failures = record_failure(submission.id, verdict.message);

        if (attempt >= max_attempts()) {
            logger_.warn("Subtask " + submission.id + ": giving up after "
                         + std::to_string(failures) + " failed attempt(s)");
            verdict.message += final_suffix(attempt);
            result.retries_exhausted = true;
            result.verdict = std::move(verdict);
            discard(submission.id);
            return result;
        }

        RevisionRequest request;
        request.subtask_id = submission.id;
        request.failure_message = verdict.message;
        request.discipline = submission.discipline;
        request.language = submission.language;
        request.prior_code = current.code;
        request.failure = verdict.failure;
        request.attempt = attempt;

        std::optional<std::string> revised;
        try {
            revised = developer_.revise(request);
        } catch (const std::exception& e) {
            logger_.error("Subtask " + submission.id + ": developer failed to revise: " + e.what());
        }

        if (!revised) {
            logger_.info("Subtask " + submission.id + ": revision declined after attempt "
                         + std::to_string(attempt));
            verdict.message += final_suffix(attempt);
            result.revision_declined = true;
            result.verdict = std::move(verdict);
            discard(submission.id);
            return result;
        }

        if (metrics_) metrics_->record_retry(submission.id, attempt + 1, verdict.failure);
        current.code = std::move(*revised);
    }
}

std::optional<RetryState> FeedbackController::retry_state(const SubtaskId& id) const {
    std::lock_guard lock(retry_mutex_);
    auto it = retry_states_.find(id);
    if (it == retry_states_.end()) return std::nullopt;
    return it->second;
}

uint32_t FeedbackController::record_failure(const SubtaskId& id, const std::string& message) {
    std::lock_guard lock(retry_mutex_);
    auto it = retry_states_.try_emplace(id, RetryState{id, 0, {}}).first;
    it->second.attempt_count += 1;
    it->second.last_failure_message = message;
    return it->second.attempt_count;
}

void FeedbackController::discard(const SubtaskId& id) {
    std::lock_guard lock(retry_mutex_);
    retry_states_.erase(id);
}

}  // namespace code_sandbox
