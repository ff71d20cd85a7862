/*
 * PATH resolution and executable index implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/util/executables.hpp>
#include <autofix/util/log.hpp>
#include <autofix/lex/lexer.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace autofix {
namespace fs = std::filesystem;

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    if ((st.st_mode & S_IXUSR) || (st.st_mode & S_IXGRP) || (st.st_mode & S_IXOTH)) return true;
    return false;
}

static std::vector<std::string> split_path(const std::string& paths) {
    std::vector<std::string> parts;
    size_t start=0;
    while (true) {
        size_t colon = paths.find(':', start);
        if (colon == std::string::npos) { parts.push_back(paths.substr(start)); break; }
        parts.push_back(paths.substr(start, colon-start));
        start = colon+1;
    }
    return parts;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd; else return std::nullopt;
    }
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return std::nullopt;
    for (auto &d : split_path(pathEnv)) {
        if (d.empty()) continue;
        std::string full = d + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

bool program_exists(const std::string& cmd) { return resolve_executable(cmd).has_value(); }

static bool is_self(const std::string& name) {
    return name=="autofix" || name=="thefuck" || name=="fuck" || name=="oops";
}

std::vector<std::string> scan_executables(const std::string& path_env,
                                          const std::vector<std::string>& excluded_prefixes) {
    std::vector<std::string> execs;
    for (auto &dir : split_path(path_env)) {
        if (dir.empty()) continue;
        bool excluded = std::any_of(excluded_prefixes.begin(), excluded_prefixes.end(),
            [&](const std::string& pre){ return !pre.empty() && dir.rfind(pre, 0) == 0; });
        if (excluded) { log::debug("skipping excluded PATH entry " + dir); continue; }
        std::error_code ec; fs::directory_iterator it(dir, ec), end;
        while (!ec && it!=end) {
            std::error_code sec;
            if (it->is_regular_file(sec) && !sec) {
                auto p = it->path();
                if (access(p.c_str(), X_OK)==0) {
                    auto name = p.filename().string();
                    if (!is_self(name)) execs.push_back(name);
                }
            }
            it.increment(ec);
        }
    }
    std::sort(execs.begin(), execs.end());
    execs.erase(std::unique(execs.begin(), execs.end()), execs.end());
    return execs;
}

std::vector<std::string> get_all_executables(const std::vector<std::string>& excluded_prefixes) {
    static std::mutex mu;
    static std::string cached_path_value;
    static std::vector<std::string> cached_prefixes;
    static std::vector<std::string> cached_execs;
    static bool scanned = false;

    const char* env = std::getenv("PATH");
    std::string path_val = env ? env : "";
    std::lock_guard<std::mutex> lock(mu);
    if (!scanned || path_val != cached_path_value || excluded_prefixes != cached_prefixes) {
        cached_path_value = path_val;
        cached_prefixes = excluded_prefixes;
        cached_execs = scan_executables(path_val, excluded_prefixes);
        scanned = true;
        log::debug("indexed " + std::to_string(cached_execs.size()) + " executables from PATH");
    }
    return cached_execs;
}

std::string replace_argument(const std::string& script, const std::string& from, const std::string& to) {
    if (from.empty()) return script;
    const std::string tail = " " + from;
    if (script.size() >= tail.size() && script.compare(script.size()-tail.size(), tail.size(), tail) == 0) {
        return script.substr(0, script.size()-tail.size()) + " " + to;
    }
    const std::string mid = " " + from + " ";
    auto pos = script.find(mid);
    if (pos != std::string::npos) {
        std::string out = script;
        out.replace(pos, mid.size(), " " + to + " ");
        return out;
    }
    const std::string head = from + " ";
    if (script.rfind(head, 0) == 0) return to + " " + script.substr(head.size());
    return script;
}

std::string replace_argument_all(const std::string& script, const std::string& from, const std::string& to) {
    std::string out;
    for (auto &w : whitespace_split(script)) {
        if (!out.empty()) out += ' ';
        out += (w == from) ? to : w;
    }
    return out;
}

} // namespace autofix
