/**
 * @file types.cpp
 * @brief Enum parsing and ResourceLimitPolicy defaults.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

namespace code_sandbox {

std::optional<Language> parse_language(std::string_view text) noexcept {
    if (text == "python" || text == "py") return Language::Python;
    if (text == "javascript" || text == "js" || text == "node") return Language::JavaScript;
    if (text == "java") return Language::Java;
    if (text == "csharp" || text == "c#" || text == "cs") return Language::CSharp;
    return std::nullopt;
}

std::optional<Discipline> parse_discipline(std::string_view text) noexcept {
    for (auto discipline : kAllDisciplines) {
        if (to_string(discipline) == text) return discipline;
    }
    return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view text) noexcept {
    if (text == "low") return Severity::Low;
    if (text == "medium") return Severity::Medium;
    if (text == "high") return Severity::High;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// ResourceLimitPolicy
// ─────────────────────────────────────────────

ResourceLimitPolicy ResourceLimitPolicy::subprocess_default() noexcept {
    return ResourceLimitPolicy{};
}

ResourceLimitPolicy ResourceLimitPolicy::container_default() noexcept {
    ResourceLimitPolicy policy;
    policy.cpu_time_seconds = 30;
    policy.memory_bytes = 512ULL * 1024 * 1024;
    policy.wall_timeout_seconds = 30;
    policy.compile_timeout_seconds = 30;
    policy.cpu_cores = 1;
    return policy;
}

ResourceLimitPolicy ResourceLimitPolicy::for_backend(BackendKind kind) noexcept {
    return kind == BackendKind::Container ? container_default() : subprocess_default();
}

std::string ResourceLimitPolicy::validate() const {
    if (wall_timeout_seconds == 0) return "wall_timeout_seconds must be positive";
    if (compile_timeout_seconds == 0) return "compile_timeout_seconds must be positive";
    if (cpu_time_seconds == 0) return "cpu_time_seconds must be positive";
    if (memory_bytes < 16ULL * 1024 * 1024) return "memory_bytes must be at least 16 MiB";
    if (max_output_bytes == 0) return "max_output_bytes must be positive";
    if (max_file_descriptors < 8) return "max_file_descriptors must be at least 8";
    if (max_processes == 0) return "max_processes must be positive";
    if (cpu_cores == 0) return "cpu_cores must be positive";
    return {};
}

}  // namespace code_sandbox
