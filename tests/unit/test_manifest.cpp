/**
 * @file test_manifest.cpp
 * @brief Unit tests for task manifest parsing.
 * @author Dimitris Kafetzis
 */

#include "workload/manifest.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace code_sandbox;

class ManifestTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path()
                    / ("cs_test_manifest_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream ofs(temp_dir_ / name);
        ofs << content;
    }
};

TEST_F(ManifestTest, ParsesInlineSubtasks) {
    auto submissions = parse_manifest(R"toml(
        [[subtask]]
        id = "adder"
        description = "Add two numbers"
        language = "python"
        discipline = "unit"
        source = "def add(a, b):\n    return a + b\n"
        timeout_seconds = 4

        [[subtask]]
        id = "greeter"
        language = "javascript"
        source = "console.log('hi')"
    )toml", temp_dir_);

    ASSERT_TRUE(submissions.has_value()) << submissions.error().message;
    ASSERT_EQ(submissions->size(), 2u);

    const auto& adder = (*submissions)[0];
    EXPECT_EQ(adder.id, "adder");
    EXPECT_EQ(adder.description, "Add two numbers");
    EXPECT_EQ(adder.language, Language::Python);
    EXPECT_EQ(adder.discipline, Discipline::Unit);
    EXPECT_EQ(adder.code, "def add(a, b):\n    return a + b\n");
    ASSERT_TRUE(adder.timeout.has_value());
    EXPECT_EQ(*adder.timeout, std::chrono::milliseconds{4000});
    EXPECT_FALSE(adder.test_code.has_value());

    const auto& greeter = (*submissions)[1];
    EXPECT_EQ(greeter.discipline, Discipline::Basic);
    EXPECT_FALSE(greeter.timeout.has_value());
}

TEST_F(ManifestTest, FilesResolveAgainstManifestDirectory) {
    write("adder.py", "def add(a, b):\n    return a + b\n");
    write("test_adder.py", "import unittest\n");
    write("manifest.toml", R"(
        [[subtask]]
        id = "adder"
        language = "python"
        discipline = "unit"
        source_file = "adder.py"
        test_file = "test_adder.py"
    )");

    auto submissions = load_manifest(temp_dir_ / "manifest.toml");
    ASSERT_TRUE(submissions.has_value()) << submissions.error().message;
    ASSERT_EQ(submissions->size(), 1u);
    EXPECT_EQ((*submissions)[0].code, "def add(a, b):\n    return a + b\n");
    EXPECT_EQ((*submissions)[0].test_code, "import unittest\n");
}

TEST_F(ManifestTest, CompanionsCarryOtherSubtaskCode) {
    auto submissions = parse_manifest(R"toml(
        [[subtask]]
        id = "adder"
        language = "python"
        source = "def add(a, b): return a + b"

        [[subtask]]
        id = "calculator"
        language = "python"
        discipline = "integration"
        source = "def twice(x): return add(x, x)"
        scenario = "assert twice(2) == 4"
        companions = ["adder"]
    )toml", temp_dir_);

    ASSERT_TRUE(submissions.has_value()) << submissions.error().message;
    const auto& calculator = (*submissions)[1];
    ASSERT_EQ(calculator.companions.size(), 1u);
    EXPECT_EQ(calculator.companions[0].name, "adder");
    EXPECT_EQ(calculator.companions[0].content, "def add(a, b): return a + b");
    EXPECT_EQ(calculator.scenario_code, "assert twice(2) == 4");
}

TEST_F(ManifestTest, RejectsInvalidEntries) {
    struct Case {
        const char* what;
        const char* toml;
        const char* needle;
    };
    const Case cases[] = {
        {"no subtasks", "title = \"x\"\n", "no [[subtask]]"},
        {"missing id", "[[subtask]]\nlanguage = \"python\"\nsource = \"x\"\n", "missing id"},
        {"unknown language", "[[subtask]]\nid = \"a\"\nlanguage = \"cobol\"\nsource = \"x\"\n",
         "unknown language"},
        {"unknown discipline",
         "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\ndiscipline = \"fuzz\"\nsource = \"x\"\n",
         "unknown discipline"},
        {"missing source", "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\n", "needs source"},
        {"bad timeout",
         "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\nsource = \"x\"\ntimeout_seconds = 0\n",
         "timeout_seconds"},
        {"duplicate id",
         "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\nsource = \"x\"\n"
         "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\nsource = \"y\"\n",
         "Duplicate subtask id"},
        {"unknown companion",
         "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\nsource = \"x\"\ncompanions = [\"b\"]\n",
         "unknown companion"},
        {"self companion",
         "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\nsource = \"x\"\ncompanions = [\"a\"]\n",
         "itself"},
        {"syntax", "[[subtask]\nid = ", "parse error"},
    };

    for (const auto& c : cases) {
        auto result = parse_manifest(c.toml, temp_dir_);
        ASSERT_FALSE(result.has_value()) << c.what;
        EXPECT_EQ(result.error().kind, ErrorKind::Config) << c.what;
        EXPECT_NE(result.error().message.find(c.needle), std::string::npos)
            << c.what << ": " << result.error().message;
    }
}

TEST_F(ManifestTest, MissingFilesAreReported) {
    auto missing_manifest = load_manifest(temp_dir_ / "absent.toml");
    ASSERT_FALSE(missing_manifest.has_value());
    EXPECT_EQ(missing_manifest.error().kind, ErrorKind::Config);

    auto missing_source = parse_manifest(
        "[[subtask]]\nid = \"a\"\nlanguage = \"python\"\nsource_file = \"nope.py\"\n", temp_dir_);
    ASSERT_FALSE(missing_source.has_value());
    EXPECT_EQ(missing_source.error().kind, ErrorKind::Io);
}
