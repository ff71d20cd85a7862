/*
 * Fuzzy string matching - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace autofix {

inline constexpr std::size_t kDefaultCloseMatches = 3;
inline constexpr double kDefaultCutoff = 0.6;

// Jaro similarity in [0,1] over Unicode code points (inputs are UTF-8).
// Two empty strings score 1.0.
double jaro(const std::string& a, const std::string& b);

// Jaro-Winkler: Jaro boosted by the common prefix (max 4 chars, scale 0.1)
// when the Jaro score exceeds 0.7. similarity(x, x) == 1.0.
double similarity(const std::string& a, const std::string& b);

// Best matches with score >= cutoff, highest score first. Equal scores keep
// their order in possibilities. At most n results.
std::vector<std::string> get_close_matches(const std::string& word,
                                           const std::vector<std::string>& possibilities,
                                           std::size_t n = kDefaultCloseMatches,
                                           double cutoff = kDefaultCutoff);

// Single best match; with fallback_to_first the first possibility is returned
// when nothing clears the cutoff. nullopt for an empty list.
std::optional<std::string> get_closest(const std::string& word,
                                       const std::vector<std::string>& possibilities,
                                       double cutoff = kDefaultCutoff,
                                       bool fallback_to_first = true);

} // namespace autofix
