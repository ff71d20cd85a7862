/*
 * AutoFix Corrected Command
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   One ranked candidate fix. Holds the replacement script, its resolved
 *   priority and, for rules with a side effect, a handle made of the
 *   originating rule and the original Command. The side effect is resolved
 *   and dispatched to that rule only after the script ran successfully.
 *
 * License (MIT): (see full text in lex/lexer.hpp header)
 */
#pragma once
#include <optional>
#include <string>
#include "autofix/core/command.hpp"
#include "autofix/core/rule.hpp"
#include "autofix/exec/shell.hpp"

namespace autofix {

struct Settings;

class CorrectedCommand {
public:
    CorrectedCommand(std::string script, int priority);
    CorrectedCommand(std::string script, int priority, RulePtr rule, Command original);

    const std::string& script() const { return m_script; }
    int priority() const { return m_priority; }
    bool has_side_effect() const { return m_effect.has_value(); }
    // Name of the rule owning the side effect, empty when there is none.
    std::string side_effect_rule() const;

    // No-op success when no side effect is attached. Without an argument the
    // Command captured at correction time is passed to the rule.
    SideEffectResult run_side_effect() const;
    SideEffectResult run_side_effect(const Command& old_cmd) const;

    // Spawn the script through the shell with inherited stdio and the
    // settings' extra environment. The side effect runs only on exit 0; a
    // failing side effect is logged and does not change the exit status.
    // The side effect receives old_cmd.
    RunResult run(const Command& old_cmd, const Settings& settings) const;

    // (priority, script) ascending.
    bool operator<(const CorrectedCommand& o) const;

    // Same script, regardless of priority or side effect.
    bool duplicates(const CorrectedCommand& o) const { return m_script == o.m_script; }

private:
    struct SideEffectHandle {
        RulePtr rule;
        Command original;
    };

    std::string m_script;
    int m_priority;
    std::optional<SideEffectHandle> m_effect;
};

} // namespace autofix
