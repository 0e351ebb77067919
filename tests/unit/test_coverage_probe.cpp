/**
 * @file test_coverage_probe.cpp
 * @brief Unit tests for the Python coverage wrapper and its marker.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/coverage_probe.hpp"

#include <gtest/gtest.h>

using namespace code_sandbox;

TEST(CoverageProbeTest, PercentOfExecutableLines) {
    CoverageCounts counts{40, 42};
    EXPECT_NEAR(counts.percent(), 95.238, 0.01);
    EXPECT_DOUBLE_EQ((CoverageCounts{0, 0}).percent(), 100.0);
    EXPECT_DOUBLE_EQ((CoverageCounts{0, 8}).percent(), 0.0);
}

TEST(CoverageProbeTest, ParsesMarkerAmidProgramOutput) {
    const std::string out = "hello\n__SANDBOX_COVERAGE__ 7 10\n";
    auto counts = parse_coverage_marker(out);
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->covered, 7u);
    EXPECT_EQ(counts->total, 10u);
}

TEST(CoverageProbeTest, LastMarkerWins) {
    const std::string out =
        "__SANDBOX_COVERAGE__ 999 999\n"
        "artifact printed a fake marker above\n"
        "__SANDBOX_COVERAGE__ 3 4\n";
    auto counts = parse_coverage_marker(out);
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->covered, 3u);
    EXPECT_EQ(counts->total, 4u);
}

TEST(CoverageProbeTest, MissingOrMalformedMarker) {
    EXPECT_FALSE(parse_coverage_marker("no marker here\n").has_value());
    EXPECT_FALSE(parse_coverage_marker("__SANDBOX_COVERAGE__ x y\n").has_value());
    EXPECT_FALSE(parse_coverage_marker("__SANDBOX_COVERAGE__ 5 3\n").has_value());
    EXPECT_FALSE(parse_coverage_marker("__SANDBOX_COVERAGE__ -1 3\n").has_value());
}

TEST(CoverageProbeTest, WrapperRunsTargetAndPrintsMarker) {
    auto wrapper = python_coverage_wrapper();
    EXPECT_NE(wrapper.find(kCoverageMarker), std::string::npos);
    EXPECT_NE(wrapper.find(kCoverageTargetFile), std::string::npos);
    EXPECT_NE(wrapper.find("settrace"), std::string::npos);
}
