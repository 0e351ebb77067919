/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include "telemetry/json_escape.hpp"

#include <sstream>

namespace code_sandbox {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_backend_selection(BackendKind kind, bool degraded,
                                                std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"backend_selected")"
        << R"(,"backend":")" << to_string(kind) << "\""
        << R"(,"degraded":)" << (degraded ? "true" : "false")
        << R"(,"reason":)" << json_quote(reason)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_execution(Language language, const ExecutionOutcome& outcome) {
    std::ostringstream oss;
    oss << R"({"event":"execution")"
        << R"(,"language":")" << to_string(language) << "\""
        << R"(,"backend":")" << to_string(outcome.backend_used) << "\""
        << R"(,"exit":)" << outcome.exit_status
        << R"(,"failure":")" << to_string(outcome.failure) << "\""
        << R"(,"timed_out":)" << (outcome.timed_out ? "true" : "false")
        << R"(,"truncated":)" << (outcome.output_truncated ? "true" : "false")
        << R"(,"duration_us":)" << outcome.wall_duration.count()
        << R"(,"peak_mem_kb":)" << (outcome.peak_memory_bytes / 1024)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_verdict(const TestVerdict& verdict, uint32_t attempt) {
    std::ostringstream oss;
    oss << R"({"event":"verdict")"
        << R"(,"subtask":)" << json_quote(verdict.subtask_id)
        << R"(,"discipline":")" << to_string(verdict.discipline) << "\""
        << R"(,"status":")" << to_string(verdict.status) << "\""
        << R"(,"failure":")" << to_string(verdict.failure) << "\""
        << R"(,"attempt":)" << attempt;
    if (verdict.metric) {
        oss << R"(,")" << to_string(verdict.metric->kind) << R"(":)" << verdict.metric->value;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_retry(const SubtaskId& id, uint32_t attempt, FailureKind failure) {
    std::ostringstream oss;
    oss << R"({"event":"retry")"
        << R"(,"subtask":)" << json_quote(id)
        << R"(,"attempt":)" << attempt
        << R"(,"after":")" << to_string(failure) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":)" << json_quote(event)
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace code_sandbox
