/**
 * @file environment_filter.cpp
 * @brief Credential stripping and environment merging.
 * @author Dimitris Kafetzis
 */

#include "sandbox/environment_filter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>

extern char** environ;

namespace code_sandbox {

namespace {

constexpr std::array<std::string_view, 11> kSensitiveFragments{
    "KEY", "SECRET", "TOKEN", "PASSWORD", "PASSWD", "CREDENTIAL",
    "AUTH", "PRIVATE", "SESSION", "COOKIE", "CERT"};

constexpr std::array<std::string_view, 12> kSensitivePrefixes{
    "AWS_", "AZURE_", "GCP_", "GOOGLE_", "OPENAI_", "ANTHROPIC_",
    "GITHUB_", "GITLAB_", "DOCKER_", "HF_", "SSH_", "NPM_"};

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

}  // anonymous namespace

bool is_credential_variable(std::string_view name) {
    const std::string normalized = upper(name);
    for (auto prefix : kSensitivePrefixes) {
        if (std::string_view{normalized}.starts_with(prefix)) return true;
    }
    for (auto fragment : kSensitiveFragments) {
        if (normalized.find(fragment) != std::string::npos) return true;
    }
    return false;
}

EnvList current_environment() {
    EnvList env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view item{*entry};
        auto eq = item.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        env.emplace_back(std::string{item.substr(0, eq)}, std::string{item.substr(eq + 1)});
    }
    return env;
}

EnvList strip_credentials(const EnvList& env) {
    EnvList out;
    out.reserve(env.size());
    std::copy_if(env.begin(), env.end(), std::back_inserter(out),
                 [](const EnvVar& var) { return !is_credential_variable(var.first); });
    return out;
}

void merge_environment(EnvList& env, const EnvList& overrides) {
    for (const auto& [name, value] : overrides) {
        auto it = std::find_if(env.begin(), env.end(),
                               [&](const EnvVar& var) { return var.first == name; });
        if (it != env.end()) {
            it->second = value;
        } else {
            env.emplace_back(name, value);
        }
    }
}

std::vector<std::string> to_envp_strings(const EnvList& env) {
    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [name, value] : env) {
        out.push_back(name + "=" + value);
    }
    return out;
}

}  // namespace code_sandbox
