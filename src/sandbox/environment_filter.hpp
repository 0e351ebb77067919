/**
 * @file environment_filter.hpp
 * @brief Environment sanitization for sandboxed processes.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace code_sandbox {

using EnvVar = std::pair<std::string, std::string>;
using EnvList = std::vector<EnvVar>;

/**
 * @brief True when the variable name looks like it carries a credential.
 *
 * Matches (case-insensitive) substrings such as KEY, SECRET, TOKEN,
 * PASSWORD, CREDENTIAL, AUTH, and well-known provider prefixes.
 */
[[nodiscard]] bool is_credential_variable(std::string_view name);

/// Snapshot of the current process environment.
[[nodiscard]] EnvList current_environment();

/// Remove credential-bearing variables (subprocess backend).
[[nodiscard]] EnvList strip_credentials(const EnvList& env);

/**
 * @brief Replace or append `overrides` in `env`; later entries win.
 */
void merge_environment(EnvList& env, const EnvList& overrides);

/// "NAME=value" strings in the form execve expects.
[[nodiscard]] std::vector<std::string> to_envp_strings(const EnvList& env);

}  // namespace code_sandbox
