/*
 * AutoFix Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Defines token kinds and the Token structure produced by the word lexer.
 *   Only words matter for correction rules; shell operators are kept as plain
 *   words, exactly as a POSIX word splitter reports them.
 *
 * License (MIT): (see full text in lexer.hpp header)
 */
#pragma once
#include <string>
#include <cstddef>
#include <vector>

namespace autofix {

enum class TokenKind {
    Word,
    Eof,
    Invalid   // unterminated quote or trailing escape
};

struct Token {
    TokenKind kind;
    std::string lexeme;
    std::size_t pos;
};

using TokenStream = std::vector<Token>;

} // namespace autofix
