/**
 * @file result_aggregator.hpp
 * @brief Submission-ordered collection of final results and the JSON report.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "feedback/feedback_controller.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace code_sandbox {

struct RunSummary {
    size_t total = 0;
    size_t passed = 0;
    size_t failed = 0;
    size_t errors = 0;
    uint64_t attempts = 0;

    [[nodiscard]] bool all_passed() const noexcept { return total > 0 && passed == total; }
};

/**
 * @brief Slots are reserved in submission order and filled from any thread.
 */
class ResultAggregator {
public:
    using Slot = size_t;

    /// Reserve the next position in the report.
    Slot reserve(const SubtaskId& id);

    /// Fill a reserved slot; each slot accepts exactly one result.
    Result<void> record(Slot slot, FinalResult result);

    /// Recorded results in submission order.
    [[nodiscard]] std::vector<FinalResult> results() const;

    [[nodiscard]] RunSummary summary() const;

    /// Whole report as a JSON document.
    [[nodiscard]] std::string to_json() const;

    /// Write the report atomically (temp file in the same directory, then rename).
    Result<void> write_json(const std::filesystem::path& path) const;

private:
    struct Entry {
        SubtaskId id;
        std::optional<FinalResult> result;
    };

    std::vector<Entry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace code_sandbox
