/*
 * git rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Each rule assumes a git invocation with aliases already expanded; the
 * registry wraps them in GitSupport.
 */
#pragma once
#include <string>
#include <vector>
#include "autofix/core/rule.hpp"

namespace autofix::rules {

// "git: 'brnch' is not a git command" followed by git's own suggestions.
class GitNotCommand : public Rule {
public:
    std::string name() const override { return "git_not_command"; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// No upstream configured: use the "git push --set-upstream ..." git prints.
class GitPush : public Rule {
public:
    std::string name() const override { return "git_push"; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// "branch -d" on an unmerged branch -> "branch -D".
class GitBranchDelete : public Rule {
public:
    std::string name() const override { return "git_branch_delete"; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// Long option written with one dash: "git commit -amend" -> "--amend".
class GitTwoDashes : public Rule {
public:
    std::string name() const override { return "git_two_dashes"; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

} // namespace autofix::rules
