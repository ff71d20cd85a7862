/*
 * Diagnostics output - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace autofix::log {

enum class Level { Debug, Warn, Error, Off };

// Process-wide threshold; messages below it are dropped. Default: Warn.
void set_level(Level lvl);
Level level();
bool enabled(Level lvl);

// Written to stderr as "[autofix] <level>: <msg>".
void debug(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace autofix::log
