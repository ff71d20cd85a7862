/*
 * Rule registry - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <vector>
#include "autofix/config/settings.hpp"
#include "autofix/core/rule.hpp"

namespace autofix {

// Every built-in rule, wrapped as registered. Settings only parameterise
// construction; enabling and priorities are resolved by the Corrector.
std::vector<RulePtr> all_rules(const Settings& settings);

} // namespace autofix
