/*
 * Settings loader - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "autofix/config/settings.hpp"

namespace autofix {

struct CliOverrides {
    bool yes = false;      // run the first correction without asking
    bool debug = false;
};

// $AUTOFIX_CONFIG, else $XDG_CONFIG_HOME/autofix/settings, else
// $HOME/.config/autofix/settings. Empty when no location can be derived.
std::string settings_path();

// "a:b::c" -> {"a","b","c"}; entries are trimmed, empty ones dropped.
std::vector<std::string> parse_colon_separated(const std::string& value);
// "rule=num:rule=num"; malformed entries are skipped with a warning.
std::map<std::string, int> parse_priority(const std::string& value);
std::optional<bool> parse_bool(const std::string& value);
std::optional<int> parse_int(const std::string& value);

// Apply one key=value to s. Returns false (after logging a warning) when the
// key is unknown or the value does not parse; s is left unchanged then.
bool apply_setting(Settings& s, const std::string& key, const std::string& value);

// Missing file is not an error.
Settings load_from_file(const std::string& path);
// Environment variables applied on top of base.
Settings load_from_env(Settings base = {});

// defaults <- file <- environment <- cli
Settings load_settings(const CliOverrides& cli = {});

} // namespace autofix
