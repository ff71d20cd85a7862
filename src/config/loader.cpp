/*
 * Settings loader - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/config/loader.hpp>
#include <autofix/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace autofix {

static std::string getenv_or(const char* k, const std::string& def = "") { const char* v = std::getenv(k); return v ? std::string(v) : def; }

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

std::string settings_path() {
    auto explicit_path = getenv_or("AUTOFIX_CONFIG");
    if (!explicit_path.empty()) return explicit_path;
    auto xdg = getenv_or("XDG_CONFIG_HOME");
    if (!xdg.empty()) return xdg + "/autofix/settings";
    auto home = getenv_or("HOME");
    if (home.empty()) return {};
    return home + "/.config/autofix/settings";
}

std::vector<std::string> parse_colon_separated(const std::string& value) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto colon = value.find(':', start);
        auto item = trim(value.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
        if (!item.empty()) out.push_back(item);
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return out;
}

std::optional<int> parse_int(const std::string& value) {
    auto v = trim(value);
    if (v.empty()) return std::nullopt;
    std::size_t i = (v[0] == '-' || v[0] == '+') ? 1 : 0;
    if (i == v.size()) return std::nullopt;
    for (std::size_t k = i; k < v.size(); ++k) if (!std::isdigit(static_cast<unsigned char>(v[k]))) return std::nullopt;
    try { return std::stoi(v); } catch (const std::out_of_range&) { return std::nullopt; }
}

std::optional<bool> parse_bool(const std::string& value) {
    auto v = lower(trim(value));
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no") return false;
    return std::nullopt;
}

std::map<std::string, int> parse_priority(const std::string& value) {
    std::map<std::string, int> out;
    for (auto &entry : parse_colon_separated(value)) {
        auto eq = entry.find('=');
        std::optional<int> num;
        if (eq != std::string::npos) num = parse_int(entry.substr(eq + 1));
        auto name = eq == std::string::npos ? std::string() : trim(entry.substr(0, eq));
        if (name.empty() || !num) { log::warn("ignoring malformed priority entry: " + entry); continue; }
        out[name] = *num;
    }
    return out;
}

static bool set_bool(bool& field, const std::string& key, const std::string& value) {
    auto b = parse_bool(value);
    if (!b) { log::warn("invalid boolean for " + key + ": " + value); return false; }
    field = *b; return true;
}

static bool set_seconds(int& field, const std::string& key, const std::string& value) {
    auto n = parse_int(value);
    if (!n || *n < 0) { log::warn("invalid number of seconds for " + key + ": " + value); return false; }
    field = *n; return true;
}

bool apply_setting(Settings& s, const std::string& key, const std::string& value) {
    if (key == "rules") { s.rules = parse_colon_separated(value); return true; }
    if (key == "exclude_rules") { s.exclude_rules = parse_colon_separated(value); return true; }
    if (key == "priority") { for (auto &[k, v] : parse_priority(value)) s.priority[k] = v; return true; }
    if (key == "slow_commands") { s.slow_commands = parse_colon_separated(value); return true; }
    if (key == "excluded_search_path_prefixes") { s.excluded_search_path_prefixes = parse_colon_separated(value); return true; }
    if (key == "require_confirmation") return set_bool(s.require_confirmation, key, value);
    if (key == "no_colors") return set_bool(s.no_colors, key, value);
    if (key == "debug") return set_bool(s.debug, key, value);
    if (key == "wait_command") return set_seconds(s.wait_command, key, value);
    if (key == "wait_slow_command") return set_seconds(s.wait_slow_command, key, value);
    if (key == "num_close_matches") {
        auto n = parse_int(value);
        if (!n || *n < 0) { log::warn("invalid num_close_matches: " + value); return false; }
        s.num_close_matches = static_cast<std::size_t>(*n); return true;
    }
    if (key.rfind("env.", 0) == 0 && key.size() > 4) { s.env[key.substr(4)] = value; return true; }
    log::warn("unknown setting: " + key);
    return false;
}

Settings load_from_file(const std::string& path) {
    Settings s;
    if (path.empty()) return s;
    std::ifstream in(path);
    if (!in) { log::debug("no settings file at " + path); return s; }
    std::string line; int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        auto t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos) { log::warn(path + ":" + std::to_string(lineno) + ": expected key=value"); continue; }
        if (!apply_setting(s, trim(t.substr(0, eq)), trim(t.substr(eq + 1))))
            log::debug(path + ":" + std::to_string(lineno) + ": line ignored");
    }
    return s;
}

Settings load_from_env(Settings base) {
    static const std::pair<const char*, const char*> vars[] = {
        {"AUTOFIX_RULES", "rules"},
        {"AUTOFIX_EXCLUDE_RULES", "exclude_rules"},
        {"AUTOFIX_PRIORITY", "priority"},
        {"AUTOFIX_REQUIRE_CONFIRMATION", "require_confirmation"},
        {"AUTOFIX_WAIT_COMMAND", "wait_command"},
        {"AUTOFIX_WAIT_SLOW_COMMAND", "wait_slow_command"},
        {"AUTOFIX_NO_COLORS", "no_colors"},
        {"AUTOFIX_NUM_CLOSE_MATCHES", "num_close_matches"},
        {"AUTOFIX_SLOW_COMMANDS", "slow_commands"},
        {"AUTOFIX_EXCLUDED_SEARCH_PATH_PREFIXES", "excluded_search_path_prefixes"},
        {"AUTOFIX_DEBUG", "debug"},
    };
    for (auto &[var, key] : vars) {
        const char* v = std::getenv(var);
        if (v && !apply_setting(base, key, v)) log::debug(std::string(var) + " ignored");
    }
    return base;
}

Settings load_settings(const CliOverrides& cli) {
    auto s = load_from_env(load_from_file(settings_path()));
    if (cli.yes) s.require_confirmation = false;
    if (cli.debug) s.debug = true;
    return s;
}

} // namespace autofix
