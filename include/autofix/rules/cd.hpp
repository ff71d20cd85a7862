/*
 * cd rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include "autofix/core/rule.hpp"

namespace autofix::rules {

// "cd.." -> "cd ..". Looks at the script only.
class CdParent : public Rule {
public:
    std::string name() const override { return "cd_parent"; }
    int priority() const override { return 100; }
    bool requires_output() const override { return false; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// cd into a missing directory: create it first.
class CdMkdir : public Rule {
public:
    std::string name() const override { return "cd_mkdir"; }
    int priority() const override { return 200; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// cd into a misspelled directory: close matches among the siblings.
class CdCorrection : public Rule {
public:
    std::string name() const override { return "cd_correction"; }
    int priority() const override { return 300; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

} // namespace autofix::rules
