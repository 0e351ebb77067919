/**
 * @file manifest.hpp
 * @brief Task manifest: the batch of subtasks a run evaluates.
 * @author Dimitris Kafetzis
 *
 * A manifest is a TOML file of `[[subtask]]` tables:
 *
 * @code
 * [[subtask]]
 * id = "adder"
 * language = "python"
 * discipline = "unit"
 * source = "def add(a, b):\n    return a + b\n"
 * @endcode
 *
 * Source, test and scenario text may be inline or read from a file relative
 * to the manifest's directory.
 */

#pragma once

#include "core/result.hpp"
#include "orchestrator/submission.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace code_sandbox {

/**
 * @brief Load and validate a manifest file.
 *
 * Rejects unknown languages or disciplines, missing or duplicate ids,
 * subtasks with no source, and companions naming unknown subtasks.
 */
Result<std::vector<Submission>> load_manifest(const std::filesystem::path& path);

/// Parse manifest text; relative file references resolve against `base_dir`.
Result<std::vector<Submission>> parse_manifest(std::string_view text,
                                               const std::filesystem::path& base_dir);

}  // namespace code_sandbox
