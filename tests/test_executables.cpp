/*
 * PATH index tests - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <autofix/util/executables.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

using namespace autofix;
namespace fs = std::filesystem;

static std::string make_tmp_dir() {
    std::string tmpl = (fs::temp_directory_path() / "autofix_exec_XXXXXX").string();
    char* d = mkdtemp(tmpl.data());
    return d ? std::string(d) : std::string();
}

static void make_file(const std::string& path, bool exec) {
    std::ofstream(path) << "#!/bin/sh\nexit 0\n";
    chmod(path.c_str(), exec ? 0755 : 0644);
}

class PathFixture : public ::testing::Test {
protected:
    void SetUp() override {
        const char* p = std::getenv("PATH");
        m_saved = p ? p : "";
        m_a = make_tmp_dir(); m_b = make_tmp_dir();
        ASSERT_FALSE(m_a.empty()); ASSERT_FALSE(m_b.empty());
        make_file(m_a + "/gitk", true);
        make_file(m_a + "/notes.txt", false);
        make_file(m_a + "/autofix", true);
        make_file(m_b + "/gitk", true);
        make_file(m_b + "/grep", true);
        fs::create_directory(m_b + "/subdir");
        setenv("PATH", (m_a + ":" + m_b).c_str(), 1);
    }
    void TearDown() override {
        setenv("PATH", m_saved.c_str(), 1);
        std::error_code ec;
        fs::remove_all(m_a, ec); fs::remove_all(m_b, ec);
    }
    std::string m_saved, m_a, m_b;
};

TEST_F(PathFixture, ResolveUsesFirstPathEntry) {
    auto r = resolve_executable("gitk");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, m_a + "/gitk");
    EXPECT_FALSE(resolve_executable("notes.txt").has_value());
    EXPECT_FALSE(resolve_executable("subdir").has_value());
    EXPECT_TRUE(program_exists("grep"));
    EXPECT_FALSE(program_exists("definitely-not-here"));
}

TEST_F(PathFixture, ResolveExplicitPath) {
    EXPECT_EQ(resolve_executable(m_b + "/grep").value(), m_b + "/grep");
    EXPECT_FALSE(resolve_executable(m_a + "/notes.txt").has_value());
}

TEST_F(PathFixture, ScanIsSortedUniqueAndSkipsSelf) {
    auto all = get_all_executables();
    EXPECT_EQ(all, (std::vector<std::string>{"gitk", "grep"}));
}

TEST_F(PathFixture, ExcludedPrefixesSkipDirectories) {
    auto some = get_all_executables({m_b});
    EXPECT_EQ(some, (std::vector<std::string>{"gitk"}));
    // cache follows the prefix list
    EXPECT_EQ(get_all_executables().size(), 2u);
}

TEST_F(PathFixture, CacheFollowsPath) {
    EXPECT_EQ(get_all_executables().size(), 2u);
    setenv("PATH", m_a.c_str(), 1);
    EXPECT_EQ(get_all_executables(), (std::vector<std::string>{"gitk"}));
}

TEST(ReplaceArgument, TrailingMiddleLeading) {
    EXPECT_EQ(replace_argument("git psuh", "psuh", "push"), "git push");
    EXPECT_EQ(replace_argument("git brnch -a", "brnch", "branch"), "git branch -a");
    EXPECT_EQ(replace_argument("gti status", "gti", "git"), "git status");
}

TEST(ReplaceArgument, WholeWordsOnly) {
    EXPECT_EQ(replace_argument("git pushy", "push", "pull"), "git pushy");
    EXPECT_EQ(replace_argument("echo a a", "a", "b"), "echo a b");
}

TEST(ReplaceArgument, AllOccurrences) {
    EXPECT_EQ(replace_argument_all("cp a  a b", "a", "x"), "cp x x b");
}
