/*
 * Corrected command implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/core/corrected_command.hpp>
#include <autofix/config/settings.hpp>
#include <autofix/util/log.hpp>

namespace autofix {

CorrectedCommand::CorrectedCommand(std::string script, int priority)
    : m_script(std::move(script)), m_priority(priority) {}

CorrectedCommand::CorrectedCommand(std::string script, int priority, RulePtr rule, Command original)
    : m_script(std::move(script)), m_priority(priority) {
    if (rule) m_effect = SideEffectHandle{std::move(rule), std::move(original)};
}

std::string CorrectedCommand::side_effect_rule() const {
    return m_effect ? m_effect->rule->name() : std::string();
}

SideEffectResult CorrectedCommand::run_side_effect() const {
    if (!m_effect) return {};
    return run_side_effect(m_effect->original);
}

SideEffectResult CorrectedCommand::run_side_effect(const Command& old_cmd) const {
    if (!m_effect) return {};
    log::debug("side effect of " + m_effect->rule->name() + " for: " + m_script);
    return m_effect->rule->side_effect(old_cmd, m_script);
}

RunResult CorrectedCommand::run(const Command& old_cmd, const Settings& settings) const {
    auto r = run_shell(m_script, settings.env);
    if (!r.error.empty()) { log::error(r.error); return r; }
    if (r.exit_code != 0) {
        r.error = m_script + ": exited with status " + std::to_string(r.exit_code);
        return r;
    }
    auto se = run_side_effect(old_cmd);
    if (!se.ok()) log::warn("side effect failed: " + se.message);
    return r;
}

bool CorrectedCommand::operator<(const CorrectedCommand& o) const {
    if (m_priority != o.m_priority) return m_priority < o.m_priority;
    return m_script < o.m_script;
}

} // namespace autofix
