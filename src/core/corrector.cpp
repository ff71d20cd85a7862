/*
 * Corrector implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/core/corrector.hpp>
#include <autofix/rules/registry.hpp>
#include <autofix/util/log.hpp>
#include <algorithm>
#include <exception>
#include <unordered_set>

namespace autofix {

bool is_rule_active(const Rule& rule, const Settings& settings) {
    auto name = rule.name();
    if (settings.is_excluded(name)) return false;
    if (rule.enabled_by_default()) return settings.all_rules_enabled() || settings.is_listed(name);
    return settings.is_listed(name);
}

// Candidates of one rule; exceptions are contained and mean "no match".
static std::optional<std::vector<std::string>> evaluate_rule(const Rule& rule, const Command& cmd) {
    try {
        if (!rule.is_match(cmd)) return std::nullopt;
        return rule.get_new_command(cmd);
    } catch (const std::exception& e) {
        log::warn("rule " + rule.name() + " failed: " + e.what());
    }
    return std::nullopt;
}

static void collect(const RulePtr& rule, const Command& cmd, int priority,
                    std::vector<CorrectedCommand>& out) {
    if (rule->requires_output() && cmd.output().empty()) return;
    auto scripts = evaluate_rule(*rule, cmd);
    if (!scripts) return;
    log::debug("rule " + rule->name() + " matched: " + cmd.script());
    bool effect = rule->has_side_effect();
    for (auto &s : *scripts) {
        if (s == cmd.script()) continue;
        if (effect) out.emplace_back(s, priority, rule, cmd);
        else out.emplace_back(s, priority);
    }
}

void organize_corrections(std::vector<CorrectedCommand>& corrections, std::size_t limit) {
    std::stable_sort(corrections.begin(), corrections.end());
    std::vector<CorrectedCommand> unique;
    unique.reserve(corrections.size());
    std::unordered_set<std::string> seen;
    for (auto &c : corrections) {
        if (seen.insert(c.script()).second) unique.push_back(std::move(c));
    }
    if (limit > 0 && unique.size() > limit) unique.erase(unique.begin() + static_cast<std::ptrdiff_t>(limit), unique.end());
    corrections = std::move(unique);
}

std::vector<CorrectedCommand> get_corrected_commands(const Command& cmd, const Settings& settings,
                                                     const std::vector<RulePtr>& rules) {
    std::vector<CorrectedCommand> out;
    for (auto &rule : rules) {
        if (!rule || !is_rule_active(*rule, settings)) continue;
        collect(rule, cmd, settings.get_rule_priority(rule->name(), rule->priority()), out);
    }
    organize_corrections(out, settings.num_close_matches);
    return out;
}

std::vector<CorrectedCommand> get_corrected_commands(const Command& cmd, const Settings& settings) {
    return get_corrected_commands(cmd, settings, all_rules(settings));
}

std::optional<CorrectedCommand> get_best_correction(const Command& cmd, const Settings& settings,
                                                    const std::vector<RulePtr>& rules) {
    auto all = get_corrected_commands(cmd, settings, rules);
    if (all.empty()) return std::nullopt;
    return all.front();
}

std::optional<CorrectedCommand> get_best_correction(const Command& cmd, const Settings& settings) {
    return get_best_correction(cmd, settings, all_rules(settings));
}

std::vector<CorrectedCommand> match_rule(const Command& cmd, const std::string& rule_name,
                                         const std::vector<RulePtr>& rules) {
    std::vector<CorrectedCommand> out;
    auto it = std::find_if(rules.begin(), rules.end(), [&](const RulePtr& r){ return r && r->name() == rule_name; });
    if (it == rules.end()) { log::debug("no such rule: " + rule_name); return out; }
    collect(*it, cmd, (*it)->priority(), out);
    organize_corrections(out, 0);
    return out;
}

std::vector<CorrectedCommand> match_rule(const Command& cmd, const std::string& rule_name) {
    return match_rule(cmd, rule_name, all_rules(Settings{}));
}

} // namespace autofix
