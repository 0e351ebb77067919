/**
 * @file unit_harness.hpp
 * @brief Test harness synthesis and test-output parsing for the unit discipline.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

/// Module name the artifact is importable under in Python harnesses.
inline constexpr std::string_view kPythonSolutionModule = "solution";

/// Top-level `def name(` functions, in order, excluding private names.
[[nodiscard]] std::vector<std::string> python_top_level_functions(std::string_view source);

/// Top-level `function name(` and `const|let|var name = (...) =>` definitions.
[[nodiscard]] std::vector<std::string> javascript_top_level_functions(std::string_view source);

/**
 * @brief unittest module exercising the artifact imported as `solution`.
 *
 * One smoke case per public top-level function plus the known-arithmetic
 * probe when the artifact defines `add`.
 */
[[nodiscard]] std::string synthesize_python_harness(std::string_view code);

/// Provided Python tests, with the artifact star-imported and a runner appended if missing.
[[nodiscard]] std::string wrap_python_tests(std::string_view test_code);

/**
 * @brief Artifact followed by a node:assert harness that prints TAP.
 */
[[nodiscard]] std::string synthesize_javascript_harness(std::string_view code);

/**
 * @brief Names of failed cases / assertions found in test output.
 *
 * Recognizes unittest `FAIL:` / `ERROR:` headers, TAP `not ok` lines,
 * and assertion or uncaught exception lines from the JVM and the CLR.
 */
[[nodiscard]] std::vector<std::string> parse_test_failures(std::string_view output);

}  // namespace code_sandbox
