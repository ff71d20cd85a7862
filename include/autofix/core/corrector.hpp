/*
 * AutoFix Corrector
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Runs every enabled rule against a failed Command and turns the matches
 *   into a ranked, deduplicated, truncated list of CorrectedCommand. The
 *   result depends only on (command, settings, rule set), never on the order
 *   rules are evaluated in.
 *
 * License (MIT): (see full text in lex/lexer.hpp header)
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "autofix/config/settings.hpp"
#include "autofix/core/command.hpp"
#include "autofix/core/corrected_command.hpp"
#include "autofix/core/rule.hpp"

namespace autofix {

// Exclusion wins; rules disabled by default must be listed explicitly.
bool is_rule_active(const Rule& rule, const Settings& settings);

std::vector<CorrectedCommand> get_corrected_commands(const Command& cmd, const Settings& settings,
                                                     const std::vector<RulePtr>& rules);
// Uses all_rules(settings).
std::vector<CorrectedCommand> get_corrected_commands(const Command& cmd, const Settings& settings);

std::optional<CorrectedCommand> get_best_correction(const Command& cmd, const Settings& settings,
                                                    const std::vector<RulePtr>& rules);
std::optional<CorrectedCommand> get_best_correction(const Command& cmd, const Settings& settings);

// Run one rule by name regardless of its enabled state, with its own
// priority. Empty when the rule is unknown or does not match.
std::vector<CorrectedCommand> match_rule(const Command& cmd, const std::string& rule_name,
                                         const std::vector<RulePtr>& rules);
std::vector<CorrectedCommand> match_rule(const Command& cmd, const std::string& rule_name);

// Sort by (priority, script), drop later entries with an already seen
// script, truncate to limit when limit > 0.
void organize_corrections(std::vector<CorrectedCommand>& corrections, std::size_t limit);

} // namespace autofix
