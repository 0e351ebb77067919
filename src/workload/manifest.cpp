/**
 * @file manifest.cpp
 * @brief Manifest loading with toml++.
 * @author Dimitris Kafetzis
 */

#include "workload/manifest.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

namespace code_sandbox {

namespace {

namespace fs = std::filesystem;

Result<std::string> read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{"Cannot read " + path.string(), ErrorKind::Io};
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

/**
 * @brief Inline `key` wins over `file_key`; neither present gives nullopt.
 */
Result<std::optional<std::string>> text_field(const toml::table& subtask,
                                              std::string_view key,
                                              std::string_view file_key,
                                              const fs::path& base_dir) {
    if (auto inline_text = subtask[key].value<std::string>()) {
        return std::optional<std::string>{std::move(*inline_text)};
    }
    if (auto file = subtask[file_key].value<std::string>()) {
        fs::path path{*file};
        if (path.is_relative()) path = base_dir / path;
        auto text = read_text(path);
        if (!text) return text.error();
        return std::optional<std::string>{std::move(*text)};
    }
    return std::optional<std::string>{};
}

struct ParsedSubtask {
    Submission submission;
    std::vector<SubtaskId> companion_ids;
};

Result<ParsedSubtask> parse_subtask(const toml::table& tbl, size_t index,
                                    const fs::path& base_dir) {
    ParsedSubtask parsed;
    auto& s = parsed.submission;
    const std::string where = "subtask #" + std::to_string(index + 1);

    auto id = tbl["id"].value<std::string>();
    if (!id || id->empty()) {
        return Error{where + ": missing id", ErrorKind::Config};
    }
    s.id = *id;
    s.description = tbl["description"].value_or(std::string{});

    auto language_name = tbl["language"].value_or(std::string{});
    auto language = parse_language(language_name);
    if (!language) {
        return Error{"Subtask " + s.id + ": unknown language '" + language_name + "'",
                     ErrorKind::Config};
    }
    s.language = *language;

    auto discipline_name = tbl["discipline"].value_or(std::string{"basic"});
    auto discipline = parse_discipline(discipline_name);
    if (!discipline) {
        return Error{"Subtask " + s.id + ": unknown discipline '" + discipline_name + "'",
                     ErrorKind::Config};
    }
    s.discipline = *discipline;

    auto source = text_field(tbl, "source", "source_file", base_dir);
    if (!source) return source.error();
    if (!*source) {
        return Error{"Subtask " + s.id + ": needs source or source_file", ErrorKind::Config};
    }
    s.code = std::move(**source);

    auto tests = text_field(tbl, "test_code", "test_file", base_dir);
    if (!tests) return tests.error();
    s.test_code = std::move(*tests);

    auto scenario = text_field(tbl, "scenario", "scenario_file", base_dir);
    if (!scenario) return scenario.error();
    s.scenario_code = std::move(*scenario);

    if (auto seconds = tbl["timeout_seconds"].value<int64_t>()) {
        if (*seconds <= 0) {
            return Error{"Subtask " + s.id + ": timeout_seconds must be positive",
                         ErrorKind::Config};
        }
        s.timeout = std::chrono::seconds{*seconds};
    }

    if (auto companions = tbl["companions"].as_array()) {
        for (const auto& node : *companions) {
            auto companion = node.value<std::string>();
            if (!companion) {
                return Error{"Subtask " + s.id + ": companions must be subtask ids",
                             ErrorKind::Config};
            }
            parsed.companion_ids.push_back(*companion);
        }
    }
    return parsed;
}

}  // anonymous namespace

Result<std::vector<Submission>> parse_manifest(std::string_view text,
                                               const fs::path& base_dir) {
    std::vector<ParsedSubtask> parsed;
    try {
        auto tbl = toml::parse(text);
        auto subtasks = tbl["subtask"].as_array();
        if (!subtasks || subtasks->empty()) {
            return Error{"Manifest has no [[subtask]] entries", ErrorKind::Config};
        }
        for (size_t i = 0; i < subtasks->size(); ++i) {
            auto entry = subtasks->get(i)->as_table();
            if (!entry) {
                return Error{"subtask #" + std::to_string(i + 1) + " is not a table",
                             ErrorKind::Config};
            }
            auto subtask = parse_subtask(*entry, i, base_dir);
            if (!subtask) return subtask.error();
            parsed.push_back(std::move(*subtask));
        }
    } catch (const toml::parse_error& err) {
        return Error{std::string{"Manifest parse error: "} + std::string{err.description()},
                     ErrorKind::Config};
    }

    std::unordered_map<SubtaskId, size_t> by_id;
    for (size_t i = 0; i < parsed.size(); ++i) {
        if (!by_id.emplace(parsed[i].submission.id, i).second) {
            return Error{"Duplicate subtask id: " + parsed[i].submission.id, ErrorKind::Config};
        }
    }

    // Companions carry the other subtasks' original code.
    std::vector<Submission> submissions;
    submissions.reserve(parsed.size());
    for (auto& entry : parsed) {
        auto& s = entry.submission;
        for (const auto& companion_id : entry.companion_ids) {
            auto it = by_id.find(companion_id);
            if (it == by_id.end()) {
                return Error{"Subtask " + s.id + ": unknown companion '" + companion_id + "'",
                             ErrorKind::Config};
            }
            if (companion_id == s.id) {
                return Error{"Subtask " + s.id + " lists itself as a companion", ErrorKind::Config};
            }
            s.companions.push_back(SourceFile{companion_id, parsed[it->second].submission.code});
        }
    }
    for (auto& entry : parsed) submissions.push_back(std::move(entry.submission));
    return submissions;
}

Result<std::vector<Submission>> load_manifest(const fs::path& path) {
    if (!fs::exists(path)) {
        return Error{"Manifest not found: " + path.string(), ErrorKind::Config};
    }
    auto text = read_text(path);
    if (!text) return text.error();
    return parse_manifest(*text, path.parent_path());
}

}  // namespace code_sandbox
