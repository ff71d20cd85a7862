/*
 * cd rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/rules/cd.hpp>
#include <autofix/lex/lexer.hpp>
#include <autofix/util/fuzzy.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace autofix::rules {

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool missing_directory(const std::string& output) {
    auto out = lower(output);
    for (auto p : {"no such file or directory", "not a directory", "does not exist",
                   "cannot find path", "the system cannot find the path"})
        if (out.find(p) != std::string::npos) return true;
    return false;
}

static bool is_cd(const Command& cmd) {
    auto &parts = cmd.parts();
    return !parts.empty() && parts.front() == "cd";
}

bool CdParent::is_match(const Command& cmd) const {
    auto script = trim(cmd.script());
    return script.rfind("cd.", 0) == 0;
}

std::vector<std::string> CdParent::get_new_command(const Command& cmd) const {
    auto script = trim(cmd.script());
    return {"cd " + trim(script.substr(2))};
}

bool CdMkdir::is_match(const Command& cmd) const {
    return is_cd(cmd) && missing_directory(cmd.output());
}

std::vector<std::string> CdMkdir::get_new_command(const Command& cmd) const {
    auto &parts = cmd.parts();
    if (parts.size() < 2) return {};
    std::string dir;
    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (!dir.empty()) dir += ' ';
        dir += parts[i];
    }
    auto q = shell_quote(dir);
    return {"mkdir -p " + q + " && cd " + q};
}

static std::vector<std::string> subdirectories(const fs::path& parent) {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code dec;
        if (it->is_directory(dec)) out.push_back(it->path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool CdCorrection::is_match(const Command& cmd) const {
    return is_cd(cmd) && cmd.parts().size() > 1 && missing_directory(cmd.output());
}

std::vector<std::string> CdCorrection::get_new_command(const Command& cmd) const {
    fs::path target(cmd.parts()[1]);
    auto parent = target.parent_path();
    auto typo = target.filename().string();
    if (typo.empty()) return {};
    std::error_code ec;
    if (!parent.empty() && !fs::is_directory(parent, ec)) return {};
    auto dirs = subdirectories(parent.empty() ? fs::path(".") : parent);
    std::vector<std::string> out;
    for (auto &m : get_close_matches(typo, dirs)) {
        auto fixed = parent.empty() ? fs::path(m) : parent / m;
        out.push_back("cd " + shell_quote(fixed.string()));
    }
    return out;
}

} // namespace autofix::rules
