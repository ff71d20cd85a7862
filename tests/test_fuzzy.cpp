/*
 * Fuzzy matcher tests - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <autofix/util/fuzzy.hpp>

using namespace autofix;

TEST(FuzzySimilarity, IdenticalIsOne) {
    for (std::string s : {"", "a", "git", "checkout", "docker-compose"})
        EXPECT_DOUBLE_EQ(similarity(s, s), 1.0) << s;
}

TEST(FuzzySimilarity, KnownValues) {
    EXPECT_NEAR(jaro("MARTHA", "MARHTA"), 0.9444, 1e-4);
    EXPECT_NEAR(similarity("MARTHA", "MARHTA"), 0.9611, 1e-4);
    EXPECT_NEAR(similarity("DIXON", "DICKSONX"), 0.8133, 1e-4);
    EXPECT_DOUBLE_EQ(similarity("abc", ""), 0.0);
    EXPECT_DOUBLE_EQ(similarity("abc", "xyz"), 0.0);
}

TEST(FuzzySimilarity, ScoresCodePointsNotBytes) {
    // c a f \u00e9 vs c a f e: three of four characters match, prefix of three
    EXPECT_NEAR(similarity("caf\xc3\xa9", "cafe"), 0.8833, 1e-3);
    EXPECT_NEAR(jaro("caf\xc3\xa9", "cafe"), 0.8333, 1e-3);
    EXPECT_DOUBLE_EQ(similarity("\xc3\xa9t\xc3\xa9", "\xc3\xa9t\xc3\xa9"), 1.0);
    // stray continuation byte is scored as a unit of its own
    EXPECT_GT(similarity("ab\x80", "ab"), 0.0);
}

TEST(FuzzySimilarity, Symmetric) {
    EXPECT_DOUBLE_EQ(similarity("gti", "git"), similarity("git", "gti"));
}

TEST(FuzzyCloseMatches, RespectsLimitAndCutoff) {
    std::vector<std::string> options = {"status", "stash", "stage", "show", "switch", "tag"};
    auto m = get_close_matches("stats", options, 2, 0.6);
    ASSERT_LE(m.size(), 2u);
    ASSERT_FALSE(m.empty());
    EXPECT_EQ(m.front(), "status");
    for (auto &s : m) EXPECT_GE(similarity("stats", s), 0.6);
}

TEST(FuzzyCloseMatches, SortedByDescendingScore) {
    std::vector<std::string> options = {"branch", "brunch", "bench", "ranch", "breach"};
    auto m = get_close_matches("brnch", options, 5, 0.0);
    ASSERT_EQ(m.size(), options.size());
    for (std::size_t i = 1; i < m.size(); ++i)
        EXPECT_GE(similarity("brnch", m[i-1]), similarity("brnch", m[i]));
}

TEST(FuzzyCloseMatches, TiesKeepInputOrder) {
    auto m = get_close_matches("ab", {"xb", "ax", "yb"}, 3, 0.0);
    // all three score the same; input order is kept
    EXPECT_EQ(m, (std::vector<std::string>{"xb", "ax", "yb"}));
}

TEST(FuzzyCloseMatches, EmptyInputs) {
    EXPECT_TRUE(get_close_matches("git", {}).empty());
    EXPECT_TRUE(get_close_matches("git", {"git"}, 0).empty());
}

TEST(FuzzyClosest, FallbackToFirst) {
    std::vector<std::string> options = {"origin", "upstream"};
    EXPECT_EQ(get_closest("upstrem", options).value(), "upstream");
    EXPECT_EQ(get_closest("zzz", options, 0.6, true).value(), "origin");
    EXPECT_FALSE(get_closest("zzz", options, 0.6, false).has_value());
    EXPECT_FALSE(get_closest("zzz", {}, 0.6, true).has_value());
}
