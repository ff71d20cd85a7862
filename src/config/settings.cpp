/*
 * Settings implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/config/settings.hpp>
#include <algorithm>
#include <sstream>

namespace autofix {

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

bool Settings::all_rules_enabled() const { return contains(rules, kAllRules); }
bool Settings::is_listed(const std::string& rule_name) const { return contains(rules, rule_name); }
bool Settings::is_excluded(const std::string& rule_name) const { return contains(exclude_rules, rule_name); }

bool Settings::is_rule_enabled(const std::string& rule_name) const {
    if (is_excluded(rule_name)) return false;
    return all_rules_enabled() || is_listed(rule_name);
}

int Settings::get_rule_priority(const std::string& rule_name, int default_priority) const {
    auto it = priority.find(rule_name);
    return it == priority.end() ? default_priority : it->second;
}

bool Settings::is_slow_command(const std::string& script) const {
    std::istringstream iss(script); std::string first; iss >> first;
    if (first.empty()) return false;
    for (auto &slow : slow_commands) {
        if (slow.empty()) continue;
        if (first == slow) return true;
        if (first.size() > slow.size() && first.compare(first.size()-slow.size(), slow.size(), slow) == 0) return true;
    }
    return false;
}

int Settings::get_wait_time(const std::string& script) const {
    return is_slow_command(script) ? wait_slow_command : wait_command;
}

void Settings::merge(const Settings& other) {
    const Settings defaults;
    if (other.rules != defaults.rules) rules = other.rules;
    if (other.exclude_rules != defaults.exclude_rules) exclude_rules = other.exclude_rules;
    for (auto &[k, v] : other.priority) priority[k] = v;
    if (other.num_close_matches != defaults.num_close_matches) num_close_matches = other.num_close_matches;
    if (other.require_confirmation != defaults.require_confirmation) require_confirmation = other.require_confirmation;
    if (other.wait_command != defaults.wait_command) wait_command = other.wait_command;
    if (other.wait_slow_command != defaults.wait_slow_command) wait_slow_command = other.wait_slow_command;
    if (other.no_colors != defaults.no_colors) no_colors = other.no_colors;
    if (other.slow_commands != defaults.slow_commands) slow_commands = other.slow_commands;
    if (other.excluded_search_path_prefixes != defaults.excluded_search_path_prefixes)
        excluded_search_path_prefixes = other.excluded_search_path_prefixes;
    for (auto &[k, v] : other.env) env[k] = v;
    if (other.debug != defaults.debug) debug = other.debug;
}

} // namespace autofix
