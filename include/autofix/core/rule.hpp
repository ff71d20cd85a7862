/*
 * AutoFix Rule Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   A Rule is one correction heuristic: a predicate over a failed Command and
 *   a transform producing replacement scripts, plus the metadata the
 *   Corrector uses to filter and rank it. ForAppRule decorates any rule with
 *   an "only for these programs" precondition without touching the rule.
 *
 * License (MIT): (see full text in lex/lexer.hpp header)
 */
#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "autofix/core/command.hpp"

namespace autofix {

inline constexpr int kDefaultPriority = 1000;

struct SideEffectResult {
    bool success = true;
    std::string message;     // failure description
    bool ok() const { return success; }
};

class Rule {
public:
    virtual ~Rule() = default;

    virtual std::string name() const = 0;
    virtual int priority() const { return kDefaultPriority; } // lower = shown first
    virtual bool enabled_by_default() const { return true; }
    virtual bool requires_output() const { return true; }

    // Must depend only on cmd and process-external state (fs, PATH, env).
    virtual bool is_match(const Command& cmd) const = 0;
    // Called only after is_match returned true. May return zero candidates.
    virtual std::vector<std::string> get_new_command(const Command& cmd) const = 0;

    // Rules overriding side_effect must also return true here, otherwise the
    // Corrector does not attach it to their corrections.
    virtual bool has_side_effect() const { return false; }
    // Runs after the chosen correction exited successfully.
    virtual SideEffectResult side_effect(const Command& old_cmd, const std::string& new_script) const {
        (void)old_cmd; (void)new_script;
        return {};
    }
};

using RulePtr = std::shared_ptr<const Rule>;

// True when the basename of the first word (path and ".exe" stripped) is one of app_names.
bool is_app(const Command& cmd, const std::vector<std::string>& app_names);

// Basename of a program word: "/usr/bin/git" -> "git", "C:\\git.exe" -> "git".
std::string program_basename(const std::string& word);

namespace detail {
template <typename R> const Rule& as_rule(const R& r) { return r; }
inline const Rule& as_rule(const RulePtr& r) { return *r; }
} // namespace detail

// R is a concrete Rule held by value, or a RulePtr.
template <typename R>
class ForAppRule : public Rule {
public:
    ForAppRule(R inner, std::vector<std::string> app_names)
        : m_inner(std::move(inner)), m_apps(std::move(app_names)) {}

    std::string name() const override { return inner().name(); }
    int priority() const override { return inner().priority(); }
    bool enabled_by_default() const override { return inner().enabled_by_default(); }
    bool requires_output() const override { return inner().requires_output(); }

    bool is_match(const Command& cmd) const override {
        return is_app(cmd, m_apps) && inner().is_match(cmd);
    }
    std::vector<std::string> get_new_command(const Command& cmd) const override {
        return inner().get_new_command(cmd);
    }

    bool has_side_effect() const override { return inner().has_side_effect(); }
    SideEffectResult side_effect(const Command& old_cmd, const std::string& new_script) const override {
        return inner().side_effect(old_cmd, new_script);
    }

    const std::vector<std::string>& app_names() const { return m_apps; }

private:
    const Rule& inner() const { return detail::as_rule(m_inner); }

    R m_inner;
    std::vector<std::string> m_apps;
};

template <typename R>
ForAppRule<R> for_app(R rule, std::vector<std::string> app_names) {
    return ForAppRule<R>(std::move(rule), std::move(app_names));
}

// Move a concrete rule (or wrapper) into a shared handle for the registry.
template <typename R>
RulePtr share_rule(R rule) {
    return std::make_shared<R>(std::move(rule));
}

} // namespace autofix
