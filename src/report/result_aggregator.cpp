/**
 * @file result_aggregator.cpp
 * @brief ResultAggregator implementation.
 * @author Dimitris Kafetzis
 */

#include "report/result_aggregator.hpp"

#include "telemetry/json_escape.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace code_sandbox {

namespace {

namespace fs = std::filesystem;

void write_result(std::ostringstream& oss, const FinalResult& row) {
    const auto& v = row.verdict;
    oss << "    {"
        << R"("id":)" << json_quote(v.subtask_id)
        << R"(,"discipline":")" << to_string(v.discipline) << "\""
        << R"(,"language":")" << to_string(row.language) << "\""
        << R"(,"status":")" << to_string(v.status) << "\""
        << R"(,"passed":)" << (v.passed() ? "true" : "false")
        << R"(,"failure":")" << to_string(v.failure) << "\"";

    if (v.metric) {
        oss << R"(,"metric":{"name":")" << to_string(v.metric->kind) << R"(","value":)"
            << v.metric->value << "}";
    } else {
        oss << R"(,"metric":null)";
    }

    oss << R"(,"message":)" << json_quote(v.message)
        << R"(,"attempts":)" << row.attempts
        << R"(,"retries_exhausted":)" << (row.retries_exhausted ? "true" : "false")
        << R"(,"revision_declined":)" << (row.revision_declined ? "true" : "false");

    if (v.outcome) {
        oss << R"(,"backend":")" << to_string(v.outcome->backend_used) << "\""
            << R"(,"exit_status":)" << v.outcome->exit_status
            << R"(,"timed_out":)" << (v.outcome->timed_out ? "true" : "false")
            << R"(,"duration_ms":)" << v.outcome->duration_ms();
    }

    oss << R"(,"findings":[)";
    for (size_t i = 0; i < v.findings.size(); ++i) {
        const auto& f = v.findings[i];
        if (i) oss << ",";
        oss << R"({"pattern":)" << json_quote(f.pattern)
            << R"(,"severity":")" << to_string(f.severity) << "\""
            << R"(,"line":)" << f.line
            << R"(,"column":)" << f.column
            << R"(,"excerpt":)" << json_quote(f.excerpt) << "}";
    }
    oss << "]";

    oss << R"(,"history":[)";
    for (size_t i = 0; i < row.history.size(); ++i) {
        const auto& h = row.history[i];
        if (i) oss << ",";
        oss << R"({"attempt":)" << h.attempt
            << R"(,"status":")" << to_string(h.status) << "\""
            << R"(,"failure":")" << to_string(h.failure) << "\""
            << R"(,"message":)" << json_quote(h.message) << "}";
    }
    oss << "]}";
}

RunSummary summarize(const std::vector<FinalResult>& rows) {
    RunSummary summary;
    for (const auto& row : rows) {
        ++summary.total;
        summary.attempts += row.attempts;
        switch (row.verdict.status) {
            case VerdictStatus::Passed: ++summary.passed; break;
            case VerdictStatus::Error:  ++summary.errors; break;
            default:                    ++summary.failed; break;
        }
    }
    return summary;
}

}  // anonymous namespace

ResultAggregator::Slot ResultAggregator::reserve(const SubtaskId& id) {
    std::lock_guard lock(mutex_);
    entries_.push_back(Entry{id, std::nullopt});
    return entries_.size() - 1;
}

Result<void> ResultAggregator::record(Slot slot, FinalResult result) {
    std::lock_guard lock(mutex_);
    if (slot >= entries_.size()) {
        return Error{"Unknown report slot " + std::to_string(slot)};
    }
    auto& entry = entries_[slot];
    if (entry.result) {
        return Error{"Report slot for " + entry.id + " already recorded"};
    }
    entry.result = std::move(result);
    return {};
}

std::vector<FinalResult> ResultAggregator::results() const {
    std::lock_guard lock(mutex_);
    std::vector<FinalResult> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (entry.result) out.push_back(*entry.result);
    }
    return out;
}

RunSummary ResultAggregator::summary() const {
    return summarize(results());
}

std::string ResultAggregator::to_json() const {
    const auto rows = results();
    const auto totals = summarize(rows);

    std::ostringstream oss;
    oss << "{\n"
        << R"(  "summary":{"total":)" << totals.total
        << R"(,"passed":)" << totals.passed
        << R"(,"failed":)" << totals.failed
        << R"(,"errors":)" << totals.errors
        << R"(,"attempts":)" << totals.attempts << "},\n"
        << R"(  "results":[)" << (rows.empty() ? "" : "\n");
    for (size_t i = 0; i < rows.size(); ++i) {
        write_result(oss, rows[i]);
        oss << (i + 1 < rows.size() ? ",\n" : "\n");
    }
    oss << (rows.empty() ? "" : "  ") << "]\n}\n";
    return oss.str();
}

Result<void> ResultAggregator::write_json(const fs::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{"Cannot create " + path.parent_path().string() + ": " + ec.message(),
                         ErrorKind::Io};
        }
    }

    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        out << to_json();
        out.flush();
        if (!out) {
            return Error{"Failed to write " + temp.string(), ErrorKind::Io};
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Error{"Cannot move report into place at " + path.string(), ErrorKind::Io};
    }
    return {};
}

}  // namespace code_sandbox
