/*
 * System rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "autofix/core/rule.hpp"

namespace autofix::rules {

// Permission errors: prefix the command with sudo ("sudo -E" when the
// script expands variables).
class Sudo : public Rule {
public:
    std::string name() const override { return "sudo"; }
    int priority() const override { return 50; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// "sl" typed for "ls".
class SlLs : public Rule {
public:
    std::string name() const override { return "sl_ls"; }
    int priority() const override { return 100; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// rm refusing to touch "/". Only runs when listed explicitly.
class RmRoot : public Rule {
public:
    std::string name() const override { return "rm_root"; }
    bool enabled_by_default() const override { return false; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
};

// Archive and the directory name derived from it, e.g. "a/b.tar.gz" -> "a/b".
struct TarArchive {
    std::string path;
    std::string base;
};
std::optional<TarArchive> find_tar_archive(const std::vector<std::string>& parts);

// "tar xf a.tar" extracts into the cwd: extract into a directory named after
// the archive instead, then delete the files the first run scattered.
class DirtyUntar : public Rule {
public:
    std::string name() const override { return "dirty_untar"; }
    bool requires_output() const override { return false; }
    bool is_match(const Command& cmd) const override;
    std::vector<std::string> get_new_command(const Command& cmd) const override;
    bool has_side_effect() const override { return true; }
    SideEffectResult side_effect(const Command& old_cmd, const std::string& new_script) const override;
};

} // namespace autofix::rules
