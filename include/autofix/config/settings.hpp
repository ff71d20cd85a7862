/*
 * AutoFix Settings
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Configuration snapshot consumed read-only by one correction pass. Values
 *   are layered by the loader: defaults, settings file, environment, CLI.
 *
 * License (MIT): (see full text in lex/lexer.hpp header)
 */
#pragma once
#include <map>
#include <string>
#include <vector>

namespace autofix {

inline constexpr const char* kAllRules = "ALL";

struct Settings {
    std::vector<std::string> rules{kAllRules};    // allow-list, or "ALL"
    std::vector<std::string> exclude_rules;       // always wins over rules
    std::map<std::string, int> priority;          // per-rule override
    std::size_t num_close_matches = 3;            // 0 = unlimited
    bool require_confirmation = true;
    int wait_command = 3;                         // seconds
    int wait_slow_command = 15;                   // seconds
    bool no_colors = false;
    std::vector<std::string> slow_commands{"lein", "react-native", "gradle", "./gradlew", "vagrant"};
    std::vector<std::string> excluded_search_path_prefixes;
    std::map<std::string, std::string> env;       // extra env for corrected commands
    bool debug = false;

    bool all_rules_enabled() const;
    bool is_listed(const std::string& rule_name) const;
    bool is_excluded(const std::string& rule_name) const;

    // Excluded -> false; otherwise "ALL" or explicitly listed.
    bool is_rule_enabled(const std::string& rule_name) const;
    int get_rule_priority(const std::string& rule_name, int default_priority) const;

    // First word of script equals, or ends with, a slow command.
    bool is_slow_command(const std::string& script) const;
    int get_wait_time(const std::string& script) const;

    // Take every field of other that differs from the defaults; maps are extended.
    void merge(const Settings& other);
};

} // namespace autofix
