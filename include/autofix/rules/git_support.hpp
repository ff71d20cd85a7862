/*
 * AutoFix Git Support
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Ecosystem wrapper for git rules. GitSupport<R> accepts only git/hub
 *   invocations and, when git traced an alias expansion in the output,
 *   hands the inner rule a Command whose script uses the expanded form.
 *   Helpers shared by the git rules live here too.
 *
 * License (MIT): (see full text in lex/lexer.hpp header)
 */
#pragma once
#include <string>
#include <utility>
#include <vector>
#include "autofix/core/rule.hpp"

namespace autofix {

bool is_git_command(const Command& cmd);

// "trace: alias expansion: co => 'checkout'" rewrites the first whole-word
// "co" of the script to "checkout". Returns cmd unchanged otherwise.
Command expand_git_alias(const Command& cmd);

// Trimmed, non-empty lines following the first line containing a separator.
std::vector<std::string> get_all_matched_commands(const std::string& output,
                                                  const std::vector<std::string>& separators = {"Did you mean"});

// One script per close match (n = 3, cutoff 0.1) of broken in matched.
std::vector<std::string> replace_command(const std::string& script, const std::string& broken,
                                         const std::vector<std::string>& matched);

template <typename R>
class GitSupport : public Rule {
public:
    explicit GitSupport(R inner) : m_inner(std::move(inner)) {}

    std::string name() const override { return inner().name(); }
    int priority() const override { return inner().priority(); }
    bool enabled_by_default() const override { return inner().enabled_by_default(); }
    bool requires_output() const override { return inner().requires_output(); }

    bool is_match(const Command& cmd) const override {
        if (!is_git_command(cmd)) return false;
        return inner().is_match(expand_git_alias(cmd));
    }
    std::vector<std::string> get_new_command(const Command& cmd) const override {
        return inner().get_new_command(expand_git_alias(cmd));
    }

    bool has_side_effect() const override { return inner().has_side_effect(); }
    SideEffectResult side_effect(const Command& old_cmd, const std::string& new_script) const override {
        return inner().side_effect(old_cmd, new_script);
    }

private:
    const Rule& inner() const { return detail::as_rule(m_inner); }

    R m_inner;
};

template <typename R>
GitSupport<R> git_support(R rule) {
    return GitSupport<R>(std::move(rule));
}

} // namespace autofix
