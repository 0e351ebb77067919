/**
 * @file test_temp_workspace.cpp
 * @brief Unit tests for the per-execution workspace.
 * @author Dimitris Kafetzis
 */

#include "sandbox/temp_workspace.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <unistd.h>

using namespace code_sandbox;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

}  // namespace

TEST(TempWorkspaceTest, CreatedPrivateAndRemovedOnDestruction) {
    fs::path created;
    {
        auto ws = TempWorkspace::create({}, "cs-test");
        ASSERT_TRUE(ws.has_value()) << ws.error().message;
        created = ws->path();
        EXPECT_TRUE(fs::is_directory(created));
        EXPECT_EQ(fs::status(created).permissions() & fs::perms::all, fs::perms::owner_all);
        EXPECT_NE(created.filename().string().find("cs-test-"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(created));
}

TEST(TempWorkspaceTest, WritesNestedFiles) {
    auto ws = TempWorkspace::create({});
    ASSERT_TRUE(ws.has_value());

    std::vector<SourceFile> files{{"main.py", "print(1)\n"}, {"pkg/util.py", "X = 2\n"}};
    ASSERT_TRUE(ws->write(files));
    EXPECT_EQ(read_file(ws->path() / "main.py"), "print(1)\n");
    EXPECT_EQ(read_file(ws->path() / "pkg" / "util.py"), "X = 2\n");
}

TEST(TempWorkspaceTest, RejectsEscapingNames) {
    auto ws = TempWorkspace::create({});
    ASSERT_TRUE(ws.has_value());

    std::vector<SourceFile> upward{{"../evil.py", "x"}};
    auto r = ws->write(upward);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::SetupFailure);

    std::vector<SourceFile> absolute{{"/tmp/evil.py", "x"}};
    EXPECT_FALSE(ws->write(absolute));
}

TEST(TempWorkspaceTest, MoveKeepsSingleOwner) {
    auto ws = TempWorkspace::create({});
    ASSERT_TRUE(ws.has_value());
    const auto path = ws->path();

    {
        TempWorkspace moved = std::move(*ws);
        EXPECT_EQ(moved.path().string(), path.string());
        EXPECT_TRUE(ws->path().empty());
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(TempWorkspaceTest, CustomRootIsCreated) {
    auto root = fs::temp_directory_path() / ("cs-root-" + std::to_string(::getpid()));
    fs::remove_all(root);
    {
        auto ws = TempWorkspace::create(root);
        ASSERT_TRUE(ws.has_value());
        EXPECT_EQ(ws->path().parent_path().string(), root.string());
    }
    fs::remove_all(root);
}

TEST(TempWorkspaceTest, OpenPermissionsForForeignReader) {
    auto ws = TempWorkspace::create({});
    ASSERT_TRUE(ws.has_value());
    std::vector<SourceFile> files{{"Main.java", "class Main {}"}};
    ASSERT_TRUE(ws->write(files));

    ASSERT_TRUE(open_tree_permissions(ws->path(), false));
    auto dir = fs::status(ws->path()).permissions();
    auto file = fs::status(ws->path() / "Main.java").permissions();
    EXPECT_NE(dir & fs::perms::others_exec, fs::perms::none);
    EXPECT_EQ(dir & fs::perms::others_write, fs::perms::none);
    EXPECT_NE(file & fs::perms::others_read, fs::perms::none);
    EXPECT_EQ(file & fs::perms::others_write, fs::perms::none);
}
