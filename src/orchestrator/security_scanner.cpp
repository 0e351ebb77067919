/**
 * @file security_scanner.cpp
 * @brief Rule tables and scanning loop.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/security_scanner.hpp"

#include <algorithm>
#include <optional>

namespace code_sandbox {

namespace {

constexpr size_t kMaxExcerpt = 120;

// std::regex recurses per consumed character, so long lines are searched in
// bounded windows. Matches spanning more than the overlap are not reported.
constexpr size_t kSearchWindow = 2048;
constexpr size_t kWindowOverlap = 256;

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

SecurityRule rule(std::string name, Severity severity, const char* pattern,
                  std::regex::flag_type flags = std::regex::ECMAScript) {
    return SecurityRule{std::move(name), severity, std::regex{pattern, flags}};
}

const std::vector<SecurityRule>& python_rules() {
    static const std::vector<SecurityRule> rules{
        rule("eval usage", Severity::High, R"(\beval\s*\()"),
        rule("exec usage", Severity::High, R"(\bexec\s*\()"),
        rule("shell execution", Severity::High,
             R"(\bos\.(?:system|popen)\s*\(|\bsubprocess\.\w+\s*\([^)]*shell\s*=\s*True)"),
        rule("unsafe deserialization", Severity::High,
             R"(\b(?:pickle|cPickle|marshal|dill)\.loads?\s*\(|\byaml\.load\s*\((?![^)]*SafeLoader))"),
        rule("hardcoded credentials", Severity::Medium,
             R"(\b\w*(?:password|passwd|secret|api_?key|token)\w*\s*=\s*["'][^"']{3,}["'])", kIcase),
        rule("sql concatenation", Severity::Medium,
             R"(\.execute(?:many)?\s*\(\s*(?:f["']|["'][^"']*["']\s*(?:\+|%|\.format\b)))"),
        rule("dynamic import", Severity::Low, R"(\b__import__\s*\()"),
    };
    return rules;
}

const std::vector<SecurityRule>& javascript_rules() {
    static const std::vector<SecurityRule> rules{
        rule("eval usage", Severity::High, R"(\beval\s*\()"),
        rule("function constructor", Severity::High, R"(\bnew\s+Function\s*\()"),
        rule("shell execution", Severity::High,
             R"(require\s*\(\s*['"](?:node:)?child_process['"]\s*\)|\b(?:execSync|spawnSync|execFileSync)\s*\()"),
        rule("hardcoded credentials", Severity::Medium,
             R"(\b\w*(?:password|passwd|secret|api_?key|token)\w*\s*[:=]\s*["'`][^"'`]{3,}["'`])", kIcase),
        rule("sql concatenation", Severity::Medium,
             R"(\.(?:query|execute)\s*\(\s*(?:`[^`]*\$\{|["'][^"']*["']\s*\+))"),
        rule("unsafe deserialization", Severity::Medium, R"(\bunserialize\s*\()"),
    };
    return rules;
}

const std::vector<SecurityRule>& java_rules() {
    static const std::vector<SecurityRule> rules{
        rule("shell execution", Severity::High,
             R"(Runtime\.getRuntime\(\)\.exec\s*\(|\bnew\s+ProcessBuilder\s*\()"),
        rule("unsafe deserialization", Severity::High,
             R"(\bnew\s+ObjectInputStream\s*\(|\.readObject\s*\(\s*\))"),
        rule("eval usage", Severity::High, R"(\bScriptEngine\w*\b.*\.eval\s*\(|\bengine\.eval\s*\()"),
        rule("hardcoded credentials", Severity::Medium,
             R"(\b\w*(?:password|passwd|secret|api_?key|token)\w*\s*=\s*"[^"]{3,}")", kIcase),
        rule("sql concatenation", Severity::Medium,
             R"(\b(?:executeQuery|executeUpdate|execute|prepareStatement|addBatch)\s*\(\s*"[^"]*"\s*\+)"),
    };
    return rules;
}

const std::vector<SecurityRule>& csharp_rules() {
    static const std::vector<SecurityRule> rules{
        rule("shell execution", Severity::High, R"(\bProcess\.Start\s*\()"),
        rule("unsafe deserialization", Severity::High,
             R"(\bBinaryFormatter\b|\bNetDataContractSerializer\b|\bLosFormatter\b)"),
        rule("eval usage", Severity::High, R"(\bCSharpScript\.(?:EvaluateAsync|RunAsync)\s*\()"),
        rule("hardcoded credentials", Severity::Medium,
             R"(\b\w*(?:password|passwd|secret|api_?key|token)\w*\s*=\s*"[^"]{3,}")", kIcase),
        rule("sql concatenation", Severity::Medium,
             R"(\bnew\s+SqlCommand\s*\(\s*(?:\$"|"[^"]*"\s*\+)|\bCommandText\s*=\s*(?:\$"|"[^"]*"\s*\+))"),
    };
    return rules;
}

const std::vector<SecurityRule>& rules_for(Language language) {
    switch (language) {
        case Language::Python:     return python_rules();
        case Language::JavaScript: return javascript_rules();
        case Language::Java:       return java_rules();
        case Language::CSharp:     return csharp_rules();
    }
    return python_rules();
}

bool is_comment_line(std::string_view line, Language language) {
    auto first = line.find_first_not_of(" \t");
    if (first == std::string_view::npos) return true;
    auto body = line.substr(first);
    if (language == Language::Python) return body.starts_with("#");
    return body.starts_with("//") || body.starts_with("*") || body.starts_with("/*");
}

/// Offset of the leftmost match of `expression` in `line`.
std::optional<size_t> find_in_line(std::string_view line, const std::regex& expression) {
    size_t offset = 0;
    while (true) {
        const size_t length = std::min(kSearchWindow, line.size() - offset);
        const auto first = line.begin() + static_cast<std::ptrdiff_t>(offset);
        const auto last = first + static_cast<std::ptrdiff_t>(length);
        // Word boundaries at a window start look at the preceding character.
        const auto flags = offset > 0 ? std::regex_constants::match_prev_avail
                                      : std::regex_constants::match_default;
        std::match_results<std::string_view::const_iterator> match;
        if (std::regex_search(first, last, match, expression, flags)) {
            return offset + static_cast<size_t>(match.position(0));
        }
        if (offset + length >= line.size()) return std::nullopt;
        offset += kSearchWindow - kWindowOverlap;
    }
}

std::string excerpt_of(std::string_view line) {
    auto first = line.find_first_not_of(" \t");
    auto last = line.find_last_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    auto trimmed = line.substr(first, last - first + 1);
    return std::string{trimmed.substr(0, kMaxExcerpt)};
}

}  // anonymous namespace

SecurityScanner::SecurityScanner(Language language)
    : language_(language)
    , rules_(&rules_for(language)) {}

std::vector<SecurityFinding> SecurityScanner::scan(std::string_view source) const {
    std::vector<SecurityFinding> findings;
    uint32_t line_number = 0;
    size_t start = 0;

    while (start <= source.size()) {
        auto end = source.find('\n', start);
        if (end == std::string_view::npos) end = source.size();
        auto line = source.substr(start, end - start);
        ++line_number;

        if (!is_comment_line(line, language_)) {
            for (const auto& r : *rules_) {
                if (auto column = find_in_line(line, r.expression)) {
                    findings.push_back(SecurityFinding{
                        r.pattern_name,
                        r.severity,
                        line_number,
                        static_cast<uint32_t>(*column) + 1,
                        excerpt_of(line)});
                }
            }
        }

        if (end == source.size()) break;
        start = end + 1;
    }
    return findings;
}

size_t SecurityScanner::count_at_or_above(const std::vector<SecurityFinding>& findings,
                                          Severity floor) noexcept {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(),
        [floor](const SecurityFinding& f) { return f.severity >= floor; }));
}

}  // namespace code_sandbox
