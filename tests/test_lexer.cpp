/*
 * Lexer tests - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <autofix/lex/lexer.hpp>
#include <autofix/lex/tokens.hpp>

using namespace autofix;

TEST(LexerBasic, QuotedWords) {
    std::string line = "git commit -m 'hello world'";
    Lexer lx(line);
    auto ts = lx.run();
    // Expect: git, commit, -m, hello world, EOF
    std::vector<TokenKind> kinds;
    for (auto &t : ts) kinds.push_back(t.kind);
    ASSERT_EQ(kinds.size(), 5u);
    EXPECT_EQ(kinds[0], TokenKind::Word);
    EXPECT_EQ(ts[3].lexeme, "hello world");
    EXPECT_EQ(kinds.back(), TokenKind::Eof);
}

TEST(LexerBasic, DoubleQuoteEscapes) {
    auto words = shell_split(R"(echo "a \"b\" \$HOME" c\ d)");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 3u);
    EXPECT_EQ((*words)[1], "a \"b\" $HOME");
    EXPECT_EQ((*words)[2], "c d");
}

TEST(LexerBasic, AdjacentQuotesJoin) {
    auto words = shell_split("echo 'a'\"b\"c");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 2u);
    EXPECT_EQ((*words)[1], "abc");
}

TEST(LexerBasic, EmptyQuotedWordIsKept) {
    auto words = shell_split("printf '' x");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 3u);
    EXPECT_EQ((*words)[1], "");
}

TEST(LexerComments, HashAtWordStart) {
    auto words = shell_split("ls -l # list files");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(words->size(), 2u);
    auto inside = shell_split("echo a#b");
    ASSERT_TRUE(inside.has_value());
    EXPECT_EQ((*inside)[1], "a#b");
}

TEST(LexerErrors, UnbalancedQuote) {
    Lexer lx("echo 'oops");
    auto ts = lx.run();
    ASSERT_FALSE(ts.empty());
    EXPECT_EQ(ts.back().kind, TokenKind::Invalid);
    EXPECT_FALSE(shell_split("echo \"oops").has_value());
    EXPECT_FALSE(shell_split("echo oops\\").has_value());
}

TEST(LexerFallback, WhitespaceSplit) {
    auto w = whitespace_split("  echo 'a   b  ");
    ASSERT_EQ(w.size(), 3u);
    EXPECT_EQ(w[1], "'a");
    EXPECT_EQ(w[2], "b");
}

TEST(LexerQuote, QuoteRoundTripsThroughSplit) {
    for (std::string w : {"plain", "two words", "it's", "", "$HOME", "a\"b"}) {
        auto words = shell_split("cmd " + shell_quote(w));
        ASSERT_TRUE(words.has_value()) << w;
        ASSERT_EQ(words->size(), 2u) << w;
        EXPECT_EQ((*words)[1], w);
    }
    EXPECT_EQ(shell_quote("src/main.cpp"), "src/main.cpp");
    EXPECT_EQ(shell_quote("two words"), "'two words'");
}
