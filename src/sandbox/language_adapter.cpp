/**
 * @file language_adapter.cpp
 * @brief Language adapter implementations.
 * @author Dimitris Kafetzis
 */

#include "sandbox/language_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace code_sandbox {

namespace {

constexpr uint64_t kMiB = 1024 * 1024;
constexpr uint64_t kMinHeapMb = 32;

/// Identifier or single punctuation character, with its offset in the source.
struct Token {
    std::string_view text;
    size_t offset;
};

bool is_identifier_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

/// Skip a quoted literal starting at `i`; returns the index past its closing quote.
size_t skip_literal(std::string_view source, size_t i) {
    const char quote = source[i];
    for (++i; i < source.size(); ++i) {
        if (source[i] == '\\') {
            ++i;
        } else if (source[i] == quote || source[i] == '\n') {
            return i + 1;
        }
    }
    return source.size();
}

/// Single linear pass over Java/C# source. Comments and literals are dropped.
std::vector<Token> tokenize(std::string_view source) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < source.size()) {
        const char c = source[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (source.compare(i, 2, "//") == 0) {
            auto end = source.find('\n', i);
            i = end == std::string_view::npos ? source.size() : end;
        } else if (source.compare(i, 2, "/*") == 0) {
            auto end = source.find("*/", i + 2);
            i = end == std::string_view::npos ? source.size() : end + 2;
        } else if (c == '"' || c == '\'') {
            i = skip_literal(source, i);
        } else if (is_identifier_char(c)) {
            size_t start = i;
            while (i < source.size() && is_identifier_char(source[i])) ++i;
            tokens.push_back({source.substr(start, i - start), start});
        } else {
            tokens.push_back({source.substr(i, 1), i});
            ++i;
        }
    }
    return tokens;
}

bool is_identifier(std::string_view text) noexcept {
    return !text.empty() && !std::isdigit(static_cast<unsigned char>(text.front()))
           && is_identifier_char(text.front());
}

bool token_is(const std::vector<Token>& tokens, size_t i, std::string_view text) noexcept {
    return i < tokens.size() && tokens[i].text == text;
}

/// Name of the last `class Name` declared before token `limit`.
std::optional<std::string> enclosing_class(const std::vector<Token>& tokens, size_t limit) {
    std::optional<std::string> found;
    for (size_t i = 0; i + 1 < limit && i + 1 < tokens.size(); ++i) {
        if (tokens[i].text == "class" && !(i > 0 && tokens[i - 1].text == ".")
            && is_identifier(tokens[i + 1].text)) {
            found = std::string{tokens[i + 1].text};
        }
    }
    return found;
}

std::string strip_suffix(std::string name, std::string_view suffix) {
    if (name.size() >= suffix.size()
        && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name.erase(name.size() - suffix.size());
    }
    return name;
}

std::vector<SourceFile> entry_and_companions(const ExecutionUnit& unit) {
    std::vector<SourceFile> files;
    files.reserve(unit.companions().size() + 2);
    files.push_back({unit.entry_file(), unit.source()});
    files.insert(files.end(), unit.companions().begin(), unit.companions().end());
    return files;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Source inspection
// ─────────────────────────────────────────────

std::optional<std::string> find_java_public_class(std::string_view source) {
    const auto tokens = tokenize(source);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].text != "public") continue;
        size_t j = i + 1;
        while (token_is(tokens, j, "final") || token_is(tokens, j, "abstract")
               || token_is(tokens, j, "static")) {
            ++j;
        }
        if (token_is(tokens, j, "class") && j + 1 < tokens.size() && is_identifier(tokens[j + 1].text)) {
            return std::string{tokens[j + 1].text};
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_java_main_class(std::string_view source) {
    const auto tokens = tokenize(source);
    for (size_t i = 0; i + 3 < tokens.size(); ++i) {
        if (tokens[i].text == "static" && tokens[i + 1].text == "void"
            && tokens[i + 2].text == "main" && tokens[i + 3].text == "(") {
            return enclosing_class(tokens, i);
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_csharp_main_class(std::string_view source) {
    const auto tokens = tokenize(source);

    // static [async] (void | int | Task | Task<int>) Main (
    std::optional<size_t> main_at;
    for (size_t i = 0; i < tokens.size() && !main_at; ++i) {
        if (tokens[i].text != "static") continue;
        size_t j = i + 1;
        if (token_is(tokens, j, "async")) ++j;
        if (token_is(tokens, j, "void") || token_is(tokens, j, "int")) {
            ++j;
        } else if (token_is(tokens, j, "Task")) {
            ++j;
            if (token_is(tokens, j, "<")) {
                if (!token_is(tokens, j + 1, "int") || !token_is(tokens, j + 2, ">")) continue;
                j += 3;
            }
        } else {
            continue;
        }
        if (token_is(tokens, j, "Main") && token_is(tokens, j + 1, "(")) main_at = i;
    }
    if (!main_at) return std::nullopt;

    auto class_name = enclosing_class(tokens, *main_at);
    if (!class_name) return std::nullopt;

    for (size_t i = 0; i + 1 < *main_at; ++i) {
        if (tokens[i].text != "namespace" || !is_identifier(tokens[i + 1].text)) continue;
        std::string qualified{tokens[i + 1].text};
        for (size_t j = i + 2; j + 1 < *main_at && tokens[j].text == "."
                               && is_identifier(tokens[j + 1].text); j += 2) {
            qualified += "." + std::string{tokens[j + 1].text};
        }
        return qualified + "." + *class_name;
    }
    return class_name;
}

uint64_t managed_heap_mb(const ResourceLimitPolicy& policy) noexcept {
    return std::max(policy.memory_bytes * 3 / 4 / kMiB, kMinHeapMb);
}

// ─────────────────────────────────────────────
// Python
// ─────────────────────────────────────────────

ExecutionUnit PythonAdapter::prepare(std::string source, std::vector<SourceFile> companions) const {
    return ExecutionUnit{Language::Python, "main.py", std::move(source), std::move(companions)};
}

std::vector<SourceFile> PythonAdapter::layout(const ExecutionUnit& unit) const {
    return entry_and_companions(unit);
}

std::optional<CommandTemplate> PythonAdapter::compile_command(const ExecutionUnit&,
                                                              const ResourceLimitPolicy&) const {
    return std::nullopt;
}

CommandTemplate PythonAdapter::invocation_for(const ExecutionUnit& unit,
                                              const ResourceLimitPolicy&) const {
    // -u: keep output that precedes a kill; -B: no .pyc in a read-only mount;
    // -E -s: ignore PYTHON* variables and the user site directory.
    return CommandTemplate{{toolchain_.python, "-u", "-B", "-E", "-s", unit.entry_file()}, {}, true};
}

// ─────────────────────────────────────────────
// JavaScript
// ─────────────────────────────────────────────

ExecutionUnit JavaScriptAdapter::prepare(std::string source,
                                         std::vector<SourceFile> companions) const {
    return ExecutionUnit{Language::JavaScript, "main.js", std::move(source), std::move(companions)};
}

std::vector<SourceFile> JavaScriptAdapter::layout(const ExecutionUnit& unit) const {
    return entry_and_companions(unit);
}

std::optional<CommandTemplate> JavaScriptAdapter::compile_command(const ExecutionUnit&,
                                                                  const ResourceLimitPolicy&) const {
    return std::nullopt;
}

CommandTemplate JavaScriptAdapter::invocation_for(const ExecutionUnit& unit,
                                                  const ResourceLimitPolicy& policy) const {
    // V8 reserves far more address space than it uses; cap the heap instead.
    return CommandTemplate{
        {toolchain_.node,
         "--max-old-space-size=" + std::to_string(managed_heap_mb(policy)),
         unit.entry_file()},
        {{"NODE_OPTIONS", ""}},
        false};
}

// ─────────────────────────────────────────────
// Java
// ─────────────────────────────────────────────

ExecutionUnit JavaAdapter::prepare(std::string source, std::vector<SourceFile> companions) const {
    auto class_name = find_java_public_class(source);
    if (!class_name) class_name = find_java_main_class(source);
    std::string entry = class_name.value_or("Main") + ".java";
    return ExecutionUnit{Language::Java, std::move(entry), std::move(source), std::move(companions)};
}

std::vector<SourceFile> JavaAdapter::layout(const ExecutionUnit& unit) const {
    return entry_and_companions(unit);
}

std::optional<CommandTemplate> JavaAdapter::compile_command(const ExecutionUnit& unit,
                                                            const ResourceLimitPolicy& policy) const {
    CommandTemplate command;
    command.argv = {toolchain_.javac,
                    "-J-Xmx" + std::to_string(managed_heap_mb(policy)) + "m",
                    "-J-XX:+UseSerialGC",
                    "-encoding", "UTF-8",
                    "-d", "."};
    for (const auto& file : layout(unit)) {
        command.argv.push_back(file.name);
    }
    command.limit_address_space = false;
    return command;
}

CommandTemplate JavaAdapter::invocation_for(const ExecutionUnit& unit,
                                            const ResourceLimitPolicy& policy) const {
    auto main_class = find_java_main_class(unit.source())
                          .value_or(strip_suffix(unit.entry_file(), ".java"));
    return CommandTemplate{
        {toolchain_.java,
         "-Xmx" + std::to_string(managed_heap_mb(policy)) + "m",
         "-XX:+UseSerialGC",
         "-XX:-UsePerfData",
         "-cp", ".",
         std::move(main_class)},
        {{"JAVA_TOOL_OPTIONS", ""}},
        false};
}

// ─────────────────────────────────────────────
// C#
// ─────────────────────────────────────────────

namespace {

const EnvList& dotnet_environment() {
    static const EnvList env{
        {"DOTNET_CLI_TELEMETRY_OPTOUT", "1"},
        {"DOTNET_NOLOGO", "1"},
        {"DOTNET_SKIP_FIRST_TIME_EXPERIENCE", "1"},
        {"MSBUILDDISABLENODEREUSE", "1"}};
    return env;
}

}  // anonymous namespace

ExecutionUnit CSharpAdapter::prepare(std::string source, std::vector<SourceFile> companions) const {
    return ExecutionUnit{Language::CSharp, "Program.cs", std::move(source), std::move(companions)};
}

std::string CSharpAdapter::project_file(const ExecutionUnit& unit) const {
    std::ostringstream oss;
    oss << "<Project Sdk=\"Microsoft.NET.Sdk\">\n"
        << "  <PropertyGroup>\n"
        << "    <OutputType>Exe</OutputType>\n"
        << "    <TargetFramework>" << toolchain_.csharp_target_framework << "</TargetFramework>\n"
        << "    <ImplicitUsings>enable</ImplicitUsings>\n"
        << "    <Nullable>disable</Nullable>\n"
        << "    <AssemblyName>Program</AssemblyName>\n"
        << "    <UseAppHost>false</UseAppHost>\n"
        << "    <UseSharedCompilation>false</UseSharedCompilation>\n";
    // Several files may declare Main (artifact plus test driver); the entry file wins.
    if (auto startup = find_csharp_main_class(unit.source())) {
        oss << "    <StartupObject>" << *startup << "</StartupObject>\n";
    }
    oss << "  </PropertyGroup>\n"
        << "</Project>\n";
    return oss.str();
}

std::vector<SourceFile> CSharpAdapter::layout(const ExecutionUnit& unit) const {
    auto files = entry_and_companions(unit);
    files.push_back({std::string{kProjectFile}, project_file(unit)});
    return files;
}

std::optional<CommandTemplate> CSharpAdapter::compile_command(const ExecutionUnit&,
                                                              const ResourceLimitPolicy&) const {
    CommandTemplate command;
    command.argv = {toolchain_.dotnet, "build", std::string{kProjectFile},
                    "-c", "Release",
                    "-o", std::string{kOutputDir},
                    "--nologo", "-v", "quiet"};
    command.extra_env = dotnet_environment();
    command.limit_address_space = false;
    return command;
}

CommandTemplate CSharpAdapter::invocation_for(const ExecutionUnit&,
                                              const ResourceLimitPolicy& policy) const {
    std::ostringstream heap;
    heap << "0x" << std::hex << managed_heap_mb(policy) * kMiB;

    CommandTemplate command;
    command.argv = {toolchain_.dotnet, std::string{kOutputDir} + "/Program.dll"};
    command.extra_env = dotnet_environment();
    command.extra_env.emplace_back("DOTNET_GCHeapHardLimit", heap.str());
    command.limit_address_space = false;
    return command;
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

LanguageAdapter make_adapter(Language language, const ToolchainConfig& toolchain) {
    switch (language) {
        case Language::Python:     return PythonAdapter{toolchain};
        case Language::JavaScript: return JavaScriptAdapter{toolchain};
        case Language::Java:       return JavaAdapter{toolchain};
        case Language::CSharp:     return CSharpAdapter{toolchain};
    }
    return PythonAdapter{toolchain};
}

}  // namespace code_sandbox
