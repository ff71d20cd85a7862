/*
 * git rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/rules/git.hpp>
#include <autofix/rules/git_support.hpp>
#include <autofix/lex/lexer.hpp>
#include <autofix/util/executables.hpp>
#include <algorithm>
#include <regex>

namespace autofix::rules {

static bool contains(const std::string& s, const char* needle) { return s.find(needle) != std::string::npos; }

static std::string join(const std::vector<std::string>& words) {
    std::string out;
    for (auto &w : words) { if (!out.empty()) out += ' '; out += w; }
    return out;
}

bool GitNotCommand::is_match(const Command& cmd) const {
    auto &out = cmd.output();
    return contains(out, " is not a git command. See 'git --help'.")
        && (contains(out, "The most similar command") || contains(out, "Did you mean"));
}

std::vector<std::string> GitNotCommand::get_new_command(const Command& cmd) const {
    static const std::regex broken_re(R"(git: '([^']*)' is not a git command)");
    std::smatch m;
    if (!std::regex_search(cmd.output(), m, broken_re) || m[1].length() == 0) return {};
    auto matched = get_all_matched_commands(cmd.output(), {"The most similar command", "Did you mean"});
    return replace_command(cmd.script(), m[1].str(), matched);
}

bool GitPush::is_match(const Command& cmd) const {
    return contains(cmd.script(), "push") && contains(cmd.output(), "git push --set-upstream");
}

std::vector<std::string> GitPush::get_new_command(const Command& cmd) const {
    auto words = whitespace_split(cmd.script());
    auto up = std::find_if(words.begin(), words.end(), [](const std::string& w){ return w == "--set-upstream" || w == "-u"; });
    if (up != words.end()) {
        // Drop the flag and the remote given with it; git's suggestion names both.
        auto idx = up - words.begin();
        words.erase(up);
        if (static_cast<std::size_t>(idx) < words.size()) words.erase(words.begin() + idx);
    } else {
        auto push = std::find(words.begin(), words.end(), "push");
        if (push != words.end()) {
            auto first = static_cast<std::size_t>(push - words.begin()) + 1;
            std::vector<std::string> kept(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(first));
            for (std::size_t i = first; i < words.size(); ++i)
                if (!words[i].empty() && words[i][0] == '-') kept.push_back(words[i]);
            words = std::move(kept);
        }
    }
    static const std::regex suggestion_re(R"(git push (.*))");
    auto &out = cmd.output();
    std::string args;
    bool found = false;
    for (std::sregex_iterator it(out.begin(), out.end(), suggestion_re), end; it != end; ++it) {
        args = (*it)[1].str();
        found = true;
    }
    if (!found) return {};
    auto b = args.find_first_not_of(" \t\r");
    auto e = args.find_last_not_of(" \t\r");
    args = (b == std::string::npos) ? std::string() : args.substr(b, e - b + 1);
    return {replace_argument(join(words), "push", "push " + args)};
}

bool GitBranchDelete::is_match(const Command& cmd) const {
    return contains(cmd.script(), "branch -d") && contains(cmd.output(), "If you are sure you want to delete it");
}

std::vector<std::string> GitBranchDelete::get_new_command(const Command& cmd) const {
    return {replace_argument(cmd.script(), "-d", "-D")};
}

static const std::regex& single_dash_re() {
    static const std::regex re(R"( -([a-z]{2,}))");
    return re;
}

bool GitTwoDashes::is_match(const Command& cmd) const {
    return std::regex_search(cmd.script(), single_dash_re())
        && (contains(cmd.output(), "error: unknown switch") || contains(cmd.output(), "error: did you mean"));
}

std::vector<std::string> GitTwoDashes::get_new_command(const Command& cmd) const {
    return {std::regex_replace(cmd.script(), single_dash_re(), " --$1")};
}

} // namespace autofix::rules
