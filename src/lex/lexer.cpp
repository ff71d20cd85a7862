/*
 * Word lexer implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <cctype>
#include <sstream>
#include <autofix/lex/lexer.hpp>

namespace autofix {

Lexer::Lexer(std::string input, LexerOptions opts) : m_input(std::move(input)), m_opts(opts) {}

char Lexer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_space() { while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) get(); }

void Lexer::skip_comment() { while (!eof() && peek() != '\n') get(); }

Token Lexer::lex_word() {
    std::size_t start = m_pos; std::string out;
    bool in_single=false, in_double=false, quoted=false;
    while (!eof()) {
        char c = peek();
        if (!in_single && !in_double) {
            if (std::isspace(static_cast<unsigned char>(c))) break;
            if (c=='\'') { in_single=true; quoted=true; get(); continue; }
            if (c=='"') { in_double=true; quoted=true; get(); continue; }
            if (c=='\\') {
                get();
                if (eof()) return {TokenKind::Invalid, out, start};
                char n = get();
                if (n != '\n') out.push_back(n); // backslash-newline is a continuation
                continue;
            }
            out.push_back(get());
        } else if (in_single) {
            get(); if (c=='\'') { in_single=false; continue; } out.push_back(c);
        } else {
            get(); if (c=='"') { in_double=false; continue; }
            if (c=='\\' && !eof()) {
                char n = peek();
                if (n=='"'||n=='\\'||n=='$'||n=='`') { out.push_back(n); get(); continue; }
                if (n=='\n') { get(); continue; }
            }
            out.push_back(c);
        }
    }
    if (in_single || in_double) return {TokenKind::Invalid, out, start};
    if (out.empty() && !quoted) return next(); // lone continuation
    return {TokenKind::Word, out, start};
}

Token Lexer::next() {
    skip_space(); if (eof()) return {TokenKind::Eof, "", m_pos};
    if (m_opts.enable_comments && peek()=='#') { skip_comment(); return next(); }
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts;
    while (true) {
        Token t = next(); ts.push_back(t);
        if (t.kind==TokenKind::Eof || t.kind==TokenKind::Invalid) break;
    }
    return ts;
}

std::optional<std::vector<std::string>> shell_split(const std::string& line) {
    Lexer lx(line);
    std::vector<std::string> words;
    for (auto &t : lx.run()) {
        if (t.kind == TokenKind::Invalid) return std::nullopt;
        if (t.kind == TokenKind::Word) words.push_back(t.lexeme);
    }
    return words;
}

std::vector<std::string> whitespace_split(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream iss(line); std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";
    bool safe = true;
    for (char c : word) {
        if (std::isalnum(static_cast<unsigned char>(c))) continue;
        if (c=='_'||c=='-'||c=='.'||c=='/'||c==':'||c==','||c=='@'||c=='%'||c=='+'||c=='=') continue;
        safe = false; break;
    }
    if (safe) return word;
    std::string out = "'";
    for (char c : word) { if (c=='\'') out += "'\"'\"'"; else out.push_back(c); }
    out += "'";
    return out;
}

} // namespace autofix
