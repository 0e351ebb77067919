/**
 * @file test_language_adapter.cpp
 * @brief Unit tests for the per-language adapters.
 * @author Dimitris Kafetzis
 */

#include "sandbox/language_adapter.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace code_sandbox;

namespace {

bool contains(const std::vector<std::string>& argv, std::string_view item) {
    return std::find(argv.begin(), argv.end(), item) != argv.end();
}

ExecutionUnit prepare(const LanguageAdapter& adapter, std::string source,
                      std::vector<SourceFile> companions = {}) {
    return std::visit([&](const auto& a) { return a.prepare(std::move(source), std::move(companions)); },
                      adapter);
}

const std::string kJavaProgram =
    "import java.util.*;\n"
    "public class Calculator {\n"
    "    public static void main(String[] args) { System.out.println(1); }\n"
    "}\n";

}  // namespace

// ─────────────────────────────────────────────
// Source inspection
// ─────────────────────────────────────────────

TEST(SourceInspectionTest, FindsJavaPublicClass) {
    EXPECT_EQ(find_java_public_class(kJavaProgram), "Calculator");
    EXPECT_EQ(find_java_public_class("public final class Box {}"), "Box");
    EXPECT_FALSE(find_java_public_class("class Hidden {}").has_value());
}

TEST(SourceInspectionTest, FindsJavaMainClass) {
    const std::string source =
        "class Helper { int x; }\n"
        "class Runner {\n"
        "  public static void main(String[] a) {}\n"
        "}\n";
    EXPECT_EQ(find_java_main_class(source), "Runner");
    EXPECT_FALSE(find_java_main_class("class Helper {}").has_value());
}

TEST(SourceInspectionTest, FindsCSharpMainWithNamespace) {
    const std::string source =
        "namespace Demo.App {\n"
        "  class Program {\n"
        "    static async Task<int> Main(string[] args) { return 0; }\n"
        "  }\n"
        "}\n";
    EXPECT_EQ(find_csharp_main_class(source), "Demo.App.Program");
    EXPECT_EQ(find_csharp_main_class("class Tests { static void Main() {} }"), "Tests");
    EXPECT_FALSE(find_csharp_main_class("class Lib { void Run() {} }").has_value());
}

TEST(SourceInspectionTest, ClassDiscoveryHandlesVeryLongLines) {
    const std::string java =
        "public class Data {\n"
        "  static String blob = \"" + std::string(100000, 'q') + "\";\n"
        "  public static void main(String[] a) {}\n"
        "}\n";
    EXPECT_EQ(find_java_public_class(java), "Data");
    EXPECT_EQ(find_java_main_class(java), "Data");

    const std::string csharp =
        "class Program { static string s = \"" + std::string(100000, 'q') + "\";\n"
        "  static void Main() {} }\n";
    EXPECT_EQ(find_csharp_main_class(csharp), "Program");
}

TEST(SourceInspectionTest, CommentsAndLiteralsDoNotDeclareClasses) {
    const std::string source =
        "// public class Decoy\n"
        "/* class Other { static void main(String[] a) {} } */\n"
        "class Real {\n"
        "  String s = \"class Fake\";\n"
        "  public static void main(String[] a) {}\n"
        "}\n";
    EXPECT_FALSE(find_java_public_class(source).has_value());
    EXPECT_EQ(find_java_main_class(source), "Real");
}

TEST(SourceInspectionTest, ManagedHeapIsThreeQuartersWithFloor) {
    ResourceLimitPolicy policy;
    policy.memory_bytes = 512ULL * 1024 * 1024;
    EXPECT_EQ(managed_heap_mb(policy), 384u);
    policy.memory_bytes = 16ULL * 1024 * 1024;
    EXPECT_EQ(managed_heap_mb(policy), 32u);
}

// ─────────────────────────────────────────────
// Adapters
// ─────────────────────────────────────────────

TEST(LanguageAdapterTest, FactoryMatchesLanguage) {
    ToolchainConfig toolchain;
    for (auto language : {Language::Python, Language::JavaScript, Language::Java, Language::CSharp}) {
        auto adapter = make_adapter(language, toolchain);
        auto reported = std::visit([](const auto& a) { return a.language(); }, adapter);
        EXPECT_EQ(reported, language);
    }
}

TEST(LanguageAdapterTest, PythonRunsEntryWithoutCompileStep) {
    ToolchainConfig toolchain;
    toolchain.python = "python3.12";
    PythonAdapter adapter{toolchain};
    ResourceLimitPolicy policy;

    auto unit = adapter.prepare("print(1)", {{"solution.py", "x = 1"}});
    EXPECT_EQ(unit.entry_file(), "main.py");
    EXPECT_FALSE(adapter.compile_command(unit, policy).has_value());

    auto files = adapter.layout(unit);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "main.py");
    EXPECT_EQ(files[1].name, "solution.py");

    auto run = adapter.invocation_for(unit, policy);
    EXPECT_EQ(run.argv.front(), "python3.12");
    EXPECT_EQ(run.argv.back(), "main.py");
    EXPECT_TRUE(contains(run.argv, "-B"));
    EXPECT_TRUE(run.limit_address_space);
}

TEST(LanguageAdapterTest, JavaScriptCapsHeapInsteadOfAddressSpace) {
    JavaScriptAdapter adapter{ToolchainConfig{}};
    ResourceLimitPolicy policy;
    policy.memory_bytes = 256ULL * 1024 * 1024;

    auto unit = adapter.prepare("console.log(1)", {});
    EXPECT_EQ(unit.entry_file(), "main.js");

    auto run = adapter.invocation_for(unit, policy);
    EXPECT_TRUE(contains(run.argv, "--max-old-space-size=192"));
    EXPECT_FALSE(run.limit_address_space);
}

TEST(LanguageAdapterTest, JavaEntryNamedAfterPublicClass) {
    JavaAdapter adapter{ToolchainConfig{}};
    ResourceLimitPolicy policy;

    auto unit = adapter.prepare(kJavaProgram, {{"Adder.java", "class Adder {}"}});
    EXPECT_EQ(unit.entry_file(), "Calculator.java");

    auto compile = adapter.compile_command(unit, policy);
    ASSERT_TRUE(compile.has_value());
    EXPECT_EQ(compile->argv.front(), "javac");
    EXPECT_TRUE(contains(compile->argv, "Calculator.java"));
    EXPECT_TRUE(contains(compile->argv, "Adder.java"));
    EXPECT_TRUE(contains(compile->argv, "-d"));
    EXPECT_FALSE(compile->limit_address_space);

    auto run = adapter.invocation_for(unit, policy);
    EXPECT_EQ(run.argv.front(), "java");
    EXPECT_EQ(run.argv.back(), "Calculator");
    EXPECT_FALSE(run.limit_address_space);
}

TEST(LanguageAdapterTest, JavaWithoutPublicClassFallsBack) {
    JavaAdapter adapter{ToolchainConfig{}};
    auto with_main = adapter.prepare("class Runner { static void main(String[] a) {} }", {});
    EXPECT_EQ(with_main.entry_file(), "Runner.java");

    auto bare = adapter.prepare("interface Shape {}", {});
    EXPECT_EQ(bare.entry_file(), "Main.java");
}

TEST(LanguageAdapterTest, CSharpGeneratesProjectWithStartupObject) {
    ToolchainConfig toolchain;
    toolchain.csharp_target_framework = "net7.0";
    CSharpAdapter adapter{toolchain};
    ResourceLimitPolicy policy;

    auto unit = adapter.prepare("class Tests { static void Main() {} }",
                                {{"Adder.cs", "class Adder { static void Main() {} }"}});
    EXPECT_EQ(unit.entry_file(), "Program.cs");

    auto files = adapter.layout(unit);
    auto project = std::find_if(files.begin(), files.end(),
                                [](const SourceFile& f) { return f.name == "Program.csproj"; });
    ASSERT_NE(project, files.end());
    EXPECT_NE(project->content.find("<TargetFramework>net7.0</TargetFramework>"), std::string::npos);
    EXPECT_NE(project->content.find("<StartupObject>Tests</StartupObject>"), std::string::npos);

    auto compile = adapter.compile_command(unit, policy);
    ASSERT_TRUE(compile.has_value());
    EXPECT_TRUE(contains(compile->argv, "build"));

    auto run = adapter.invocation_for(unit, policy);
    EXPECT_EQ(run.argv.back(), "out/Program.dll");
    EXPECT_FALSE(run.limit_address_space);
    auto heap = std::find_if(run.extra_env.begin(), run.extra_env.end(),
                             [](const EnvVar& v) { return v.first == "DOTNET_GCHeapHardLimit"; });
    EXPECT_NE(heap, run.extra_env.end());
}

TEST(LanguageAdapterTest, VisitPreparesThroughVariant) {
    auto adapter = make_adapter(Language::Java, ToolchainConfig{});
    auto unit = prepare(adapter, kJavaProgram);
    EXPECT_EQ(unit.language(), Language::Java);
    EXPECT_EQ(unit.source(), kJavaProgram);
}
