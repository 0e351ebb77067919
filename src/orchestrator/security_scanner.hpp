/**
 * @file security_scanner.hpp
 * @brief Static pattern scan for dangerous constructs, per language.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace code_sandbox {

struct SecurityRule {
    std::string pattern_name;
    Severity severity{Severity::Medium};
    std::regex expression;
};

/**
 * @brief Line-oriented scanner over a fixed rule table.
 *
 * Whole-line comments are skipped. Each match yields one finding with a
 * 1-based line and column; a line may produce several findings.
 */
class SecurityScanner {
public:
    explicit SecurityScanner(Language language);

    [[nodiscard]] std::vector<SecurityFinding> scan(std::string_view source) const;

    [[nodiscard]] Language language() const noexcept { return language_; }
    [[nodiscard]] const std::vector<SecurityRule>& rules() const noexcept { return *rules_; }

    /// Findings whose severity is at least `floor`.
    [[nodiscard]] static size_t count_at_or_above(const std::vector<SecurityFinding>& findings,
                                                  Severity floor) noexcept;

private:
    Language language_;
    const std::vector<SecurityRule>* rules_;
};

}  // namespace code_sandbox
