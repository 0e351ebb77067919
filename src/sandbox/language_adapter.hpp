/**
 * @file language_adapter.hpp
 * @brief Per-language file layout, compile step and invocation.
 * @author Dimitris Kafetzis
 *
 * The four adapters form a closed set held in LanguageAdapter (a variant)
 * and built by make_adapter(). Commands are relative to the workspace root
 * so the same recipe works on the host and inside a container.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "sandbox/isolation_backend.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace code_sandbox {

// ─────────────────────────────────────────────
// Source inspection helpers
// ─────────────────────────────────────────────

/// Name of the first `public class`, if any.
[[nodiscard]] std::optional<std::string> find_java_public_class(std::string_view source);

/// Class declaring `static void main(String[] ...)`, if any.
[[nodiscard]] std::optional<std::string> find_java_main_class(std::string_view source);

/// Fully-qualified class declaring a static Main, if any.
[[nodiscard]] std::optional<std::string> find_csharp_main_class(std::string_view source);

// ─────────────────────────────────────────────
// Adapters
// ─────────────────────────────────────────────

class PythonAdapter {
public:
    explicit PythonAdapter(ToolchainConfig toolchain) : toolchain_(std::move(toolchain)) {}

    static constexpr Language language() noexcept { return Language::Python; }

    [[nodiscard]] ExecutionUnit prepare(std::string source, std::vector<SourceFile> companions) const;
    [[nodiscard]] std::vector<SourceFile> layout(const ExecutionUnit& unit) const;
    [[nodiscard]] std::optional<CommandTemplate> compile_command(const ExecutionUnit& unit,
                                                                 const ResourceLimitPolicy& policy) const;
    [[nodiscard]] CommandTemplate invocation_for(const ExecutionUnit& unit,
                                                 const ResourceLimitPolicy& policy) const;

private:
    ToolchainConfig toolchain_;
};

class JavaScriptAdapter {
public:
    explicit JavaScriptAdapter(ToolchainConfig toolchain) : toolchain_(std::move(toolchain)) {}

    static constexpr Language language() noexcept { return Language::JavaScript; }

    [[nodiscard]] ExecutionUnit prepare(std::string source, std::vector<SourceFile> companions) const;
    [[nodiscard]] std::vector<SourceFile> layout(const ExecutionUnit& unit) const;
    [[nodiscard]] std::optional<CommandTemplate> compile_command(const ExecutionUnit& unit,
                                                                 const ResourceLimitPolicy& policy) const;
    [[nodiscard]] CommandTemplate invocation_for(const ExecutionUnit& unit,
                                                 const ResourceLimitPolicy& policy) const;

private:
    ToolchainConfig toolchain_;
};

/**
 * @brief javac into the workspace, then `java -cp . <MainClass>`.
 *
 * The entry file is named after its public class, since javac rejects any
 * other name. The class to run is the one declaring main().
 */
class JavaAdapter {
public:
    explicit JavaAdapter(ToolchainConfig toolchain) : toolchain_(std::move(toolchain)) {}

    static constexpr Language language() noexcept { return Language::Java; }

    [[nodiscard]] ExecutionUnit prepare(std::string source, std::vector<SourceFile> companions) const;
    [[nodiscard]] std::vector<SourceFile> layout(const ExecutionUnit& unit) const;
    [[nodiscard]] std::optional<CommandTemplate> compile_command(const ExecutionUnit& unit,
                                                                 const ResourceLimitPolicy& policy) const;
    [[nodiscard]] CommandTemplate invocation_for(const ExecutionUnit& unit,
                                                 const ResourceLimitPolicy& policy) const;

private:
    ToolchainConfig toolchain_;
};

/**
 * @brief `dotnet build` of a generated project, then `dotnet out/Program.dll`.
 */
class CSharpAdapter {
public:
    static constexpr std::string_view kProjectFile = "Program.csproj";
    static constexpr std::string_view kOutputDir = "out";

    explicit CSharpAdapter(ToolchainConfig toolchain) : toolchain_(std::move(toolchain)) {}

    static constexpr Language language() noexcept { return Language::CSharp; }

    [[nodiscard]] ExecutionUnit prepare(std::string source, std::vector<SourceFile> companions) const;
    [[nodiscard]] std::vector<SourceFile> layout(const ExecutionUnit& unit) const;
    [[nodiscard]] std::optional<CommandTemplate> compile_command(const ExecutionUnit& unit,
                                                                 const ResourceLimitPolicy& policy) const;
    [[nodiscard]] CommandTemplate invocation_for(const ExecutionUnit& unit,
                                                 const ResourceLimitPolicy& policy) const;

    /// Project file contents for the configured target framework.
    [[nodiscard]] std::string project_file(const ExecutionUnit& unit) const;

private:
    ToolchainConfig toolchain_;
};

static_assert(LanguageAdapterLike<PythonAdapter>);
static_assert(LanguageAdapterLike<JavaScriptAdapter>);
static_assert(LanguageAdapterLike<JavaAdapter>);
static_assert(LanguageAdapterLike<CSharpAdapter>);

using LanguageAdapter = std::variant<PythonAdapter, JavaScriptAdapter, JavaAdapter, CSharpAdapter>;

/// Adapter for a language, configured with the host/image toolchain names.
[[nodiscard]] LanguageAdapter make_adapter(Language language, const ToolchainConfig& toolchain);

/// Heap cap handed to managed runtimes in place of RLIMIT_AS.
[[nodiscard]] uint64_t managed_heap_mb(const ResourceLimitPolicy& policy) noexcept;

}  // namespace code_sandbox
