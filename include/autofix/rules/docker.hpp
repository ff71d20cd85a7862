/*
 * docker rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include "autofix/core/rule.hpp"

namespace autofix::rules {

const std::vector<std::string>& docker_commands();

// Misspelled docker subcommand. Registered behind for_app({"docker"}).
class DockerNotCommand : public Rule {
public:
    std::string name() const override { return "docker_not_command"; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

} // namespace autofix::rules
