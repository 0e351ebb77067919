/**
 * @file unit_harness.cpp
 * @brief Harness templates and failure extraction.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/unit_harness.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace code_sandbox {

namespace {

constexpr size_t kMaxReportedFailures = 10;

/// Regexes only see this much of a line; std::regex recursion grows with match length.
constexpr size_t kMaxInspectedLine = 1024;

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::string_view trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> collect_names(std::string_view source, const std::vector<std::regex>& patterns) {
    std::vector<std::string> names;
    for (auto raw : split_lines(source)) {
        auto line = raw.substr(0, kMaxInspectedLine);
        for (const auto& pattern : patterns) {
            std::match_results<std::string_view::const_iterator> match;
            if (std::regex_search(line.begin(), line.end(), match, pattern)) {
                auto name = match[1].str();
                if (std::find(names.begin(), names.end(), name) == names.end()) {
                    names.push_back(std::move(name));
                }
                break;
            }
        }
    }
    return names;
}

/// Single-quoted literal safe for both Python and JavaScript.
std::string quoted(std::string_view text) {
    std::string out{"'"};
    for (char c : text) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Function discovery
// ─────────────────────────────────────────────

std::vector<std::string> python_top_level_functions(std::string_view source) {
    static const std::vector<std::regex> patterns{
        std::regex{R"(^(?:async\s+)?def\s+([A-Za-z]\w*)\s*\()"}};
    return collect_names(source, patterns);
}

std::vector<std::string> javascript_top_level_functions(std::string_view source) {
    static const std::vector<std::regex> patterns{
        std::regex{R"(^(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*\()"},
        std::regex{R"(^(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s+)?(?:function\b|\([^)]*\)\s*=>|[A-Za-z_$][\w$]*\s*=>))"}};
    return collect_names(source, patterns);
}

// ─────────────────────────────────────────────
// Python
// ─────────────────────────────────────────────

std::string synthesize_python_harness(std::string_view code) {
    const auto functions = python_top_level_functions(code);

    std::ostringstream oss;
    oss << "import unittest\n\n"
        << "import " << kPythonSolutionModule << "\n\n\n"
        << "class GeneratedSmokeTests(unittest.TestCase):\n";

    if (functions.empty()) {
        oss << "    def test_module_imports(self):\n"
            << "        self.assertIsNotNone(" << kPythonSolutionModule << ")\n";
    }
    for (const auto& name : functions) {
        oss << "    def test_defines_" << name << "(self):\n"
            << "        self.assertTrue(callable(getattr(" << kPythonSolutionModule << ", "
            << quoted(name) << ", None)), " << quoted(name + " is not callable") << ")\n\n";
    }
    if (std::find(functions.begin(), functions.end(), "add") != functions.end()) {
        oss << "    def test_add_known_arithmetic(self):\n"
            << "        self.assertEqual(" << kPythonSolutionModule << ".add(1, 2), 3)\n";
    }

    oss << "\n\nif __name__ == '__main__':\n"
        << "    unittest.main(verbosity=2)\n";
    return oss.str();
}

std::string wrap_python_tests(std::string_view test_code) {
    std::ostringstream oss;
    oss << "from " << kPythonSolutionModule << " import *  # noqa: F401,F403\n\n"
        << test_code << "\n";
    if (test_code.find("unittest.main") == std::string_view::npos
        && test_code.find("unittest") != std::string_view::npos) {
        oss << "\n\nif __name__ == '__main__':\n"
            << "    import unittest as _sandbox_unittest\n"
            << "    _sandbox_unittest.main(verbosity=2)\n";
    }
    return oss.str();
}

// ─────────────────────────────────────────────
// JavaScript
// ─────────────────────────────────────────────

std::string synthesize_javascript_harness(std::string_view code) {
    const auto functions = javascript_top_level_functions(code);

    std::ostringstream oss;
    oss << code << "\n\n;(() => {\n"
        << "  const __sandboxAssert = require('node:assert');\n"
        << "  let __sandboxCount = 0;\n"
        << "  let __sandboxFailed = 0;\n"
        << "  const __sandboxCase = (name, fn) => {\n"
        << "    __sandboxCount += 1;\n"
        << "    try {\n"
        << "      fn();\n"
        << "      console.log(`ok ${__sandboxCount} - ${name}`);\n"
        << "    } catch (err) {\n"
        << "      __sandboxFailed += 1;\n"
        << "      console.log(`not ok ${__sandboxCount} - ${name}`);\n"
        << "      console.log(`  # ${String((err && err.message) || err).split('\\n')[0]}`);\n"
        << "    }\n"
        << "  };\n";

    if (functions.empty()) {
        oss << "  __sandboxCase('artifact loads', () => {});\n";
    }
    for (const auto& name : functions) {
        oss << "  __sandboxCase(" << quoted("defines " + name) << ", () => "
            << "__sandboxAssert.strictEqual(typeof " << name << ", 'function'));\n";
    }
    if (std::find(functions.begin(), functions.end(), "add") != functions.end()) {
        oss << "  __sandboxCase('add(1, 2) === 3', () => __sandboxAssert.strictEqual(add(1, 2), 3));\n";
    }

    oss << "  console.log(`1..${__sandboxCount}`);\n"
        << "  if (__sandboxFailed > 0) process.exitCode = 1;\n"
        << "})();\n";
    return oss.str();
}

// ─────────────────────────────────────────────
// Output parsing
// ─────────────────────────────────────────────

std::vector<std::string> parse_test_failures(std::string_view output) {
    static const std::regex tap_failure{R"(^not ok\s+\d*\s*-?\s*(.*)$)"};

    std::vector<std::string> failures;
    auto add = [&](std::string entry) {
        if (entry.empty() || failures.size() >= kMaxReportedFailures) return;
        if (std::find(failures.begin(), failures.end(), entry) == failures.end()) {
            failures.push_back(std::move(entry));
        }
    };

    for (auto raw : split_lines(output)) {
        auto line = trim(raw).substr(0, kMaxInspectedLine);
        if (line.starts_with("FAIL: ") || line.starts_with("ERROR: ")) {
            add(std::string{line});
            continue;
        }
        std::match_results<std::string_view::const_iterator> match;
        if (std::regex_search(line.begin(), line.end(), match, tap_failure)) {
            add("not ok: " + match[1].str());
            continue;
        }
        if (line.find("AssertionError") != std::string_view::npos
            || line.starts_with("Exception in thread")
            || line.starts_with("Unhandled exception")) {
            add(std::string{line});
        }
    }
    return failures;
}

}  // namespace code_sandbox
