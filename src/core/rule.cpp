/*
 * Rule helpers - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/core/rule.hpp>
#include <algorithm>

namespace autofix {

std::string program_basename(const std::string& word) {
    auto slash = word.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? word : word.substr(slash + 1);
    const std::string exe = ".exe";
    if (base.size() > exe.size() && base.compare(base.size()-exe.size(), exe.size(), exe) == 0)
        base.erase(base.size()-exe.size());
    return base;
}

bool is_app(const Command& cmd, const std::vector<std::string>& app_names) {
    auto &parts = cmd.parts();
    if (parts.empty()) return false;
    auto base = program_basename(parts.front());
    return std::find(app_names.begin(), app_names.end(), base) != app_names.end();
}

} // namespace autofix
