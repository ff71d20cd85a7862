/*
 * Diagnostics output implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/util/log.hpp>
#include <atomic>
#include <iostream>

namespace autofix::log {

static std::atomic<int> g_level{static_cast<int>(Level::Warn)};

void set_level(Level lvl) { g_level = static_cast<int>(lvl); }
Level level() { return static_cast<Level>(g_level.load()); }
bool enabled(Level lvl) { return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load(); }

static void emit(Level lvl, const char* tag, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::cerr << "[autofix] " << tag << ": " << msg << '\n';
}

void debug(const std::string& msg) { emit(Level::Debug, "debug", msg); }
void warn(const std::string& msg) { emit(Level::Warn, "warn", msg); }
void error(const std::string& msg) { emit(Level::Error, "error", msg); }

} // namespace autofix::log
