/*
 * PATH resolution and executable index - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace autofix {

// Resolve command name to absolute path using PATH env if necessary.
// If cmd contains '/' it is returned only when it is an executable file.
std::optional<std::string> resolve_executable(const std::string& cmd);

bool program_exists(const std::string& cmd);

// Names of every executable regular file in the ':'-separated directory list,
// sorted and unique. Directories starting with an excluded prefix are skipped,
// as are autofix's own entry points.
std::vector<std::string> scan_executables(const std::string& path_env,
                                          const std::vector<std::string>& excluded_prefixes = {});

// scan_executables over the current PATH, cached until PATH or the excluded
// prefixes change.
std::vector<std::string> get_all_executables(const std::vector<std::string>& excluded_prefixes = {});

// Replace one whole-word argument: a trailing " from" first, then the first
// " from ", then a leading "from ". Unchanged when from is not a word of script.
std::string replace_argument(const std::string& script, const std::string& from, const std::string& to);

// Replace every whitespace-separated word equal to from (output re-joined with single spaces).
std::string replace_argument_all(const std::string& script, const std::string& from, const std::string& to);

} // namespace autofix
