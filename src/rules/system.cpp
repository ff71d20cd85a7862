/*
 * System rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/rules/system.hpp>
#include <autofix/exec/shell.hpp>
#include <autofix/lex/lexer.hpp>
#include <autofix/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace autofix::rules {

static const char* kPermissionPatterns[] = {
    "Permission denied", "permission denied", "EACCES", "Operation not permitted",
    "you cannot perform this operation unless you are root", "must be root",
    "need to be root", "needs to be run as root", "requires superuser privileges",
    "requires root", "Access denied", "access denied", "must have root privileges",
    "This operation requires root", "Unable to write", "Cannot open",
    "Read-only file system", "only root can", "must be superuser",
    "you need root privileges", "insufficient permissions", "are you root?",
    "Please run as root", "not allowed to perform this operation",
};

static const char* kPrivilegeCommands[] = {"sudo", "su", "pkexec", "doas", "runas"};

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static bool contains(const std::string& s, const char* needle) { return s.find(needle) != std::string::npos; }

bool Sudo::is_match(const Command& cmd) const {
    auto &parts = cmd.parts();
    if (!parts.empty()) {
        auto prog = lower(program_basename(parts.front()));
        for (auto p : kPrivilegeCommands) if (prog == p) return false;
    }
    for (auto p : kPermissionPatterns) if (contains(cmd.output(), p)) return true;
    return false;
}

std::vector<std::string> Sudo::get_new_command(const Command& cmd) const {
    if (cmd.script().find('$') != std::string::npos) return {"sudo -E " + cmd.script()};
    return {"sudo " + cmd.script()};
}

bool SlLs::is_match(const Command& cmd) const {
    auto script = trim(cmd.script());
    if (script.rfind("sl", 0) != 0) return false;
    if (script.size() > 2 && script[2] != ' ' && script[2] != '\t') return false;
    auto out = lower(cmd.output());
    return contains(out, "not found") || contains(out, "not recognized") || contains(out, "unknown command");
}

std::vector<std::string> SlLs::get_new_command(const Command& cmd) const {
    auto script = trim(cmd.script());
    return {"ls" + script.substr(2)};
}

bool RmRoot::is_match(const Command& cmd) const {
    auto &parts = cmd.parts();
    bool rm = std::find(parts.begin(), parts.end(), "rm") != parts.end();
    bool root = std::find(parts.begin(), parts.end(), "/") != parts.end();
    return rm && root && !contains(cmd.script(), "--no-preserve-root") && contains(cmd.output(), "--no-preserve-root");
}

std::vector<std::string> RmRoot::get_new_command(const Command& cmd) const {
    return {cmd.script() + " --no-preserve-root"};
}

static const char* kTarExtensions[] = {
    ".tar", ".tar.Z", ".tar.bz2", ".tar.gz", ".tar.lz", ".tar.lzma", ".tar.xz",
    ".taz", ".tb2", ".tbz", ".tbz2", ".tgz", ".tlz", ".txz", ".tz",
};

std::optional<TarArchive> find_tar_archive(const std::vector<std::string>& parts) {
    for (std::size_t i = 1; i < parts.size(); ++i) {
        auto &p = parts[i];
        for (auto ext : kTarExtensions) {
            std::string e(ext);
            if (p.size() > e.size() && p.compare(p.size()-e.size(), e.size(), e) == 0)
                return TarArchive{p, p.substr(0, p.size()-e.size())};
        }
    }
    return std::nullopt;
}

static bool is_tar_extract(const Command& cmd) {
    if (contains(cmd.script(), "--extract")) return true;
    auto &parts = cmd.parts();
    return parts.size() > 1 && parts[1].find('x') != std::string::npos && parts[1].find('/') == std::string::npos;
}

bool DirtyUntar::is_match(const Command& cmd) const {
    return is_app(cmd, {"tar"}) && !contains(cmd.script(), "-C") && is_tar_extract(cmd)
        && find_tar_archive(cmd.parts()).has_value();
}

std::vector<std::string> DirtyUntar::get_new_command(const Command& cmd) const {
    auto tar = find_tar_archive(cmd.parts());
    if (!tar) return {};
    auto dir = shell_quote(tar->base);
    return {"mkdir -p " + dir + " && " + cmd.script() + " -C " + dir};
}

SideEffectResult DirtyUntar::side_effect(const Command& old_cmd, const std::string& new_script) const {
    (void)new_script;
    auto tar = find_tar_archive(old_cmd.parts());
    if (!tar) return {};
    auto listing = capture_output("tar -tf " + shell_quote(tar->path), std::chrono::seconds(15));
    if (!listing.ok()) {
        return {false, "cannot list " + tar->path + " (exit " + std::to_string(listing.exit_code) + ")"};
    }
    std::istringstream iss(listing.output);
    std::string member;
    int removed = 0;
    while (std::getline(iss, member)) {
        member = trim(member);
        if (member.empty() || member.front() == '/' || member.find("..") != std::string::npos) continue;
        std::error_code ec;
        auto st = fs::symlink_status(member, ec);
        if (ec || !(fs::is_regular_file(st) || fs::is_symlink(st))) continue;
        if (fs::remove(member, ec)) ++removed;
        else if (ec) log::warn("cannot remove " + member + ": " + ec.message());
    }
    log::debug("dirty_untar removed " + std::to_string(removed) + " files");
    return {};
}

} // namespace autofix::rules
