/**
 * @file coverage_probe.hpp
 * @brief Line-coverage instrumentation for Python artifacts.
 * @author Dimitris Kafetzis
 *
 * The artifact is written as target.py next to a wrapper that computes its
 * executable lines from the compiled code objects, runs it as __main__
 * under sys.settrace, and prints one marker line with the counts.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace code_sandbox {

inline constexpr std::string_view kCoverageMarker = "__SANDBOX_COVERAGE__";
inline constexpr std::string_view kCoverageTargetFile = "target.py";

struct CoverageCounts {
    uint32_t covered = 0;
    uint32_t total = 0;

    /// covered/total as a percentage; an artifact with no executable lines counts as fully covered.
    [[nodiscard]] double percent() const noexcept {
        if (total == 0) return 100.0;
        return 100.0 * static_cast<double>(covered) / static_cast<double>(total);
    }
};

/// Wrapper module source (the entry file of a coverage run).
[[nodiscard]] std::string python_coverage_wrapper();

/// Last marker line in `stdout_data`, if the wrapper got that far.
[[nodiscard]] std::optional<CoverageCounts> parse_coverage_marker(std::string_view stdout_data);

}  // namespace code_sandbox
