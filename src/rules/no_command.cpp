/*
 * Unknown command rule - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/rules/no_command.hpp>
#include <autofix/util/executables.hpp>
#include <autofix/util/fuzzy.hpp>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace autofix::rules {

static const char* kNotFoundPatterns[] = {
    "command not found", "not found", "not recognized", "unknown command",
    "couldn't find", "could not find", "not an operable program", "is not operable",
};

static const char* kShells[] = {"bash", "zsh", "fish", "sh", "dash", "ksh", "tcsh", "powershell", "pwsh", "cmd"};

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> extract_missing_command(const std::string& output) {
    static const std::regex patterns[] = {
        std::regex(R"(^(?:[^:\s]+: )?([^:\s]+): command not found)"),
        std::regex(R"(command not found: ([^\s]+))"),
        std::regex(R"(Unknown command[:\s]+([^\s]+))"),
        std::regex(R"('([^']+)' is not recognized)"),
        std::regex(R"(^[^:\s]+: [0-9]+: ([^:\s]+): not found)"),
        std::regex(R"(^([^:\s]+):.*(not found|not recognized))"),
    };
    for (auto &re : patterns) {
        std::istringstream iss(output);
        std::string line;
        while (std::getline(iss, line)) {
            std::smatch m;
            if (!std::regex_search(line, m, re)) continue;
            auto name = m[1].str();
            if (std::find(std::begin(kShells), std::end(kShells), name) != std::end(kShells)) continue;
            return name;
        }
    }
    return std::nullopt;
}

NoCommand::NoCommand(std::vector<std::string> excluded_prefixes)
    : m_excluded(std::move(excluded_prefixes)) {}

bool NoCommand::is_match(const Command& cmd) const {
    auto out = lower(cmd.output());
    for (auto p : kNotFoundPatterns) if (out.find(p) != std::string::npos) return true;
    return false;
}

std::vector<std::string> NoCommand::get_new_command(const Command& cmd) const {
    auto &parts = cmd.parts();
    if (parts.empty()) return {};
    // The reported name may sit behind a wrapper ("env X=1 gti"); replace that word.
    std::size_t at = 0;
    if (auto reported = extract_missing_command(cmd.output())) {
        auto it = std::find(parts.begin(), parts.end(), *reported);
        if (it != parts.end()) at = static_cast<std::size_t>(it - parts.begin());
    }
    // Only the offending word changes; operators and expansions stay as typed.
    auto &script = cmd.script();
    auto &typo = parts[at];
    auto lead = script.find_first_not_of(" \t");
    bool leading = at == 0 && lead != std::string::npos && script.compare(lead, typo.size(), typo) == 0;
    std::vector<std::string> out;
    for (auto &m : get_close_matches(typo, get_all_executables(m_excluded))) {
        if (leading) out.push_back(m + script.substr(lead + typo.size()));
        else out.push_back(replace_argument(script, typo, m));
    }
    return out;
}

} // namespace autofix::rules
