/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>

namespace code_sandbox {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_backend_selection(BackendKind kind, bool degraded, std::string_view reason);
    void record_execution(Language language, const ExecutionOutcome& outcome);
    void record_verdict(const TestVerdict& verdict, uint32_t attempt);
    void record_retry(const SubtaskId& id, uint32_t attempt, FailureKind failure);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace code_sandbox
