/*
 * Fuzzy string matching implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/util/fuzzy.hpp>
#include <algorithm>
#include <utility>

namespace autofix {

// UTF-8 to code points. A byte that does not start a valid sequence counts as one unit.
static std::u32string decode_utf8(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
        bool valid = len > 0 && i + len <= s.size();
        for (std::size_t k = 1; valid && k < len; ++k)
            valid = (static_cast<unsigned char>(s[i+k]) & 0xC0) == 0x80;
        if (!valid) { out.push_back(c); ++i; continue; }
        char32_t cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
        for (std::size_t k = 1; k < len; ++k) cp = (cp << 6) | (static_cast<unsigned char>(s[i+k]) & 0x3F);
        out.push_back(cp);
        i += len;
    }
    return out;
}

static double jaro_points(const std::u32string& a, const std::u32string& b) {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;
    if (a == b) return 1.0;

    const std::size_t la = a.size(), lb = b.size();
    std::size_t range = std::max(la, lb) / 2;
    range = range > 0 ? range - 1 : 0;

    std::vector<bool> a_flags(la, false), b_flags(lb, false);
    std::size_t matches = 0;
    for (std::size_t i=0;i<la;++i) {
        std::size_t lo = i > range ? i - range : 0;
        std::size_t hi = std::min(i + range + 1, lb);
        for (std::size_t j=lo;j<hi;++j) {
            if (b_flags[j] || a[i] != b[j]) continue;
            a_flags[i] = b_flags[j] = true;
            ++matches;
            break;
        }
    }
    if (matches == 0) return 0.0;

    // half-transpositions: matched chars that appear in a different order
    std::size_t k = 0, half_transpositions = 0;
    for (std::size_t i=0;i<la;++i) {
        if (!a_flags[i]) continue;
        while (!b_flags[k]) ++k;
        if (a[i] != b[k]) ++half_transpositions;
        ++k;
    }
    double m = static_cast<double>(matches);
    double t = static_cast<double>(half_transpositions) / 2.0;
    return (m / la + m / lb + (m - t) / m) / 3.0;
}

double jaro(const std::string& a, const std::string& b) {
    return jaro_points(decode_utf8(a), decode_utf8(b));
}

double similarity(const std::string& a, const std::string& b) {
    auto pa = decode_utf8(a), pb = decode_utf8(b);
    double sim = jaro_points(pa, pb);
    if (sim <= 0.7) return sim;
    std::size_t prefix = 0, limit = std::min<std::size_t>({pa.size(), pb.size(), 4});
    while (prefix < limit && pa[prefix] == pb[prefix]) ++prefix;
    return sim + 0.1 * static_cast<double>(prefix) * (1.0 - sim);
}

std::vector<std::string> get_close_matches(const std::string& word,
                                           const std::vector<std::string>& possibilities,
                                           std::size_t n, double cutoff) {
    std::vector<std::string> out;
    if (possibilities.empty() || n == 0) return out;

    std::vector<std::pair<double, const std::string*>> scored;
    scored.reserve(possibilities.size());
    for (auto &p : possibilities) {
        double s = similarity(word, p);
        if (s >= cutoff) scored.emplace_back(s, &p);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& x, const auto& y){ return x.first > y.first; });

    for (auto &entry : scored) {
        if (out.size() >= n) break;
        out.push_back(*entry.second);
    }
    return out;
}

std::optional<std::string> get_closest(const std::string& word,
                                       const std::vector<std::string>& possibilities,
                                       double cutoff, bool fallback_to_first) {
    if (possibilities.empty()) return std::nullopt;
    auto best = get_close_matches(word, possibilities, 1, cutoff);
    if (!best.empty()) return best.front();
    if (fallback_to_first) return possibilities.front();
    return std::nullopt;
}

} // namespace autofix
