/*
 * Git support helpers - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/rules/git_support.hpp>
#include <autofix/lex/lexer.hpp>
#include <autofix/util/executables.hpp>
#include <autofix/util/fuzzy.hpp>
#include <autofix/util/log.hpp>
#include <regex>
#include <sstream>

namespace autofix {

bool is_git_command(const Command& cmd) {
    return is_app(cmd, {"git", "hub"});
}

static std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

Command expand_git_alias(const Command& cmd) {
    auto &out = cmd.output();
    if (out.find("trace: alias expansion:") == std::string::npos) return cmd;
    static const std::regex trace_re(R"(trace: alias expansion: ([^ ]*) => ([^\n]*))");
    std::smatch m;
    if (!std::regex_search(out, m, trace_re)) return cmd;
    std::string alias = m[1].str();
    if (alias.empty()) return cmd;
    std::string expansion;
    for (auto &w : whitespace_split(m[2].str())) {
        auto b = w.find_first_not_of('\'');
        auto e = w.find_last_not_of('\'');
        if (b == std::string::npos) continue;
        if (!expansion.empty()) expansion += ' ';
        expansion += w.substr(b, e - b + 1);
    }
    std::regex alias_re("\\b" + regex_escape(alias) + "\\b");
    std::smatch at;
    if (!std::regex_search(cmd.script(), at, alias_re)) return cmd;
    // Spliced by hand: the expansion may contain "$1" or "$&" and must stay literal.
    auto script = at.prefix().str() + expansion + at.suffix().str();
    log::debug("git alias " + alias + " expanded: " + script);
    return cmd.with_script(script);
}

std::vector<std::string> get_all_matched_commands(const std::string& output,
                                                  const std::vector<std::string>& separators) {
    std::vector<std::string> result;
    bool yielding = false;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        bool sep = false;
        for (auto &s : separators) if (line.find(s) != std::string::npos) { sep = true; break; }
        if (sep) { yielding = true; continue; }
        auto t = trim(line);
        if (yielding && !t.empty()) result.push_back(t);
    }
    return result;
}

std::vector<std::string> replace_command(const std::string& script, const std::string& broken,
                                         const std::vector<std::string>& matched) {
    std::vector<std::string> out;
    for (auto &m : get_close_matches(broken, matched, kDefaultCloseMatches, 0.1))
        out.push_back(replace_argument(script, broken, trim(m)));
    return out;
}

} // namespace autofix
