/*
 * Unknown command rule - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "autofix/core/rule.hpp"

namespace autofix::rules {

// Name the shell complained about, e.g. "bash: gti: command not found" -> "gti".
// Shell names themselves are never returned.
std::optional<std::string> extract_missing_command(const std::string& output);

// "command not found": suggest the closest executables on PATH, keeping the
// arguments.
class NoCommand : public Rule {
public:
    explicit NoCommand(std::vector<std::string> excluded_prefixes = {});

    std::string name() const override { return "no_command"; }
    int priority() const override { return 500; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;

private:
    std::vector<std::string> m_excluded;
};

} // namespace autofix::rules
