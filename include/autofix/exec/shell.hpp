/*
 * Shell execution - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <map>
#include <string>

namespace autofix {

struct Settings;

struct RunResult {
    int exit_code = 0;      // 128+signal when the child was killed
    std::string error;      // set when the child could not be started
    bool ok() const { return error.empty() && exit_code == 0; }
};

struct CaptureResult {
    std::string output;     // stderr then stdout
    int exit_code = 0;
    bool timed_out = false;
    std::string error;
    bool ok() const { return error.empty() && !timed_out && exit_code == 0; }
};

// $AUTOFIX_SHELL when set and non-empty, else /bin/sh.
std::string shell_path();

// Run script through "<shell> -c" with inherited stdio. Extra env entries
// are set in the child only.
RunResult run_shell(const std::string& script, const std::map<std::string, std::string>& env = {});

// Run script with stdout/stderr captured; the child is killed after timeout.
CaptureResult capture_output(const std::string& script, std::chrono::milliseconds timeout,
                             const std::map<std::string, std::string>& env = {});
// Timeout taken from settings.get_wait_time(script).
CaptureResult capture_output(const std::string& script, const Settings& settings);

} // namespace autofix
