/*
 * AutoFix Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a command line into words following POSIX shell quoting rules:
 *   single quotes are literal, double quotes honour backslash before " \ $ `
 *   and newline, an unquoted backslash escapes the next character and an
 *   unquoted '#' at the start of a word begins a comment. Unbalanced quoting
 *   yields an Invalid token so callers can fall back to plain splitting.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include "autofix/lex/tokens.hpp"

namespace autofix {

struct LexerOptions {
    bool enable_comments = true; // unquoted '#' at word start ends the line
};

class Lexer {
public:
    Lexer(std::string input, LexerOptions opts = {});
    TokenStream run();
private:
    Token next();
    char peek() const;
    char get();
    bool eof() const;
    void skip_space();
    void skip_comment();
    Token lex_word();

    std::string m_input;
    LexerOptions m_opts;
    std::size_t m_pos = 0; // current index
};

// Shell-split a line. nullopt when quoting is unbalanced.
std::optional<std::vector<std::string>> shell_split(const std::string& line);

// Plain whitespace split (fallback when shell_split fails).
std::vector<std::string> whitespace_split(const std::string& line);

// Quote a single word so that shell_split returns it unchanged.
std::string shell_quote(const std::string& word);

} // namespace autofix
