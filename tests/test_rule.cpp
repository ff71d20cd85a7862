/*
 * Rule wrapper tests - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <autofix/core/rule.hpp>
#include <autofix/rules/git_support.hpp>

using namespace autofix;

namespace {

// Matches everything, records the last script it saw.
class Recorder : public Rule {
public:
    std::string name() const override { return "recorder"; }
    int priority() const override { return 42; }
    bool enabled_by_default() const override { return false; }
    bool requires_output() const override { return false; }
    bool is_match(const Command& cmd) const override { m_seen = cmd.script(); return true; }
    std::vector<std::string> get_new_command(const Command& cmd) const override {
        m_seen = cmd.script();
        return {cmd.script() + " --fixed"};
    }
    bool has_side_effect() const override { return true; }
    SideEffectResult side_effect(const Command&, const std::string& s) const override {
        return {false, "effect:" + s};
    }
    mutable std::string m_seen;
};

} // namespace

TEST(ProgramBasename, StripsPathAndExe) {
    EXPECT_EQ(program_basename("/usr/bin/git"), "git");
    EXPECT_EQ(program_basename("C:\\Tools\\git.exe"), "git");
    EXPECT_EQ(program_basename("git"), "git");
    EXPECT_EQ(program_basename(".exe"), ".exe");
}

TEST(IsApp, FirstWordOnly) {
    EXPECT_TRUE(is_app(Command("/usr/local/bin/docker ps", ""), {"docker"}));
    EXPECT_FALSE(is_app(Command("sudo docker ps", ""), {"docker"}));
    EXPECT_FALSE(is_app(Command("", ""), {"docker"}));
}

TEST(ForApp, RejectsOtherPrograms) {
    auto rule = for_app(Recorder{}, {"git"});
    EXPECT_FALSE(rule.is_match(Command("hg status", "boom")));
    EXPECT_FALSE(rule.is_match(Command("gitk", "boom")));
    EXPECT_TRUE(rule.is_match(Command("git status", "boom")));
    EXPECT_TRUE(rule.is_match(Command("/usr/bin/git.exe status", "boom")));
}

TEST(ForApp, ForwardsMetadataAndSideEffect) {
    auto rule = for_app(Recorder{}, {"git"});
    EXPECT_EQ(rule.name(), "recorder");
    EXPECT_EQ(rule.priority(), 42);
    EXPECT_FALSE(rule.enabled_by_default());
    EXPECT_FALSE(rule.requires_output());
    EXPECT_TRUE(rule.has_side_effect());
    EXPECT_EQ(rule.get_new_command(Command("git x", "")), std::vector<std::string>{"git x --fixed"});
    EXPECT_EQ(rule.side_effect(Command("git x", ""), "git y").message, "effect:git y");
    EXPECT_EQ(rule.app_names(), std::vector<std::string>{"git"});
}

TEST(ForApp, WrapsSharedRule) {
    RulePtr inner = share_rule(Recorder{});
    RulePtr wrapped = share_rule(for_app(inner, {"docker", "podman"}));
    EXPECT_TRUE(wrapped->is_match(Command("podman ps", "")));
    EXPECT_FALSE(wrapped->is_match(Command("kubectl ps", "")));
    EXPECT_EQ(wrapped->name(), "recorder");
}

TEST(GitAlias, ExpandsTracedAlias) {
    Command cmd("git co main", "trace: alias expansion: co => 'checkout'\nerror: pathspec");
    auto expanded = expand_git_alias(cmd);
    EXPECT_EQ(expanded.script(), "git checkout main");
    EXPECT_EQ(expanded.output(), cmd.output());
    EXPECT_EQ(expanded.parts()[1], "checkout");
}

TEST(GitAlias, MultiWordExpansionFirstOccurrenceOnly) {
    Command cmd("git st st", "trace: alias expansion: st => 'status' '-sb'\n");
    EXPECT_EQ(expand_git_alias(cmd).script(), "git status -sb st");
}

TEST(GitAlias, WordBoundary) {
    Command cmd("git co-author co", "trace: alias expansion: co => checkout\n");
    // "co-author" has a boundary after "co"; the first whole word wins
    EXPECT_EQ(expand_git_alias(cmd).script(), "git checkout-author co");
    Command cmd2("git cobra", "trace: alias expansion: co => checkout\n");
    EXPECT_EQ(expand_git_alias(cmd2).script(), "git cobra");
}

TEST(GitAlias, ShellAliasKeepsDollarSigns) {
    Command cmd("git lg -n 3", "trace: alias expansion: lg => '!f() { echo $1 $&; }; f'\n");
    EXPECT_EQ(expand_git_alias(cmd).script(), "git !f() { echo $1 $&; }; f -n 3");
}

TEST(GitAlias, NoTraceUnchanged) {
    Command cmd("git co main", "error: pathspec 'main' did not match");
    EXPECT_EQ(expand_git_alias(cmd).script(), "git co main");
}

TEST(GitSupportWrapper, OnlyGitAndHub) {
    auto rule = git_support(Recorder{});
    EXPECT_TRUE(rule.is_match(Command("git status", "")));
    EXPECT_TRUE(rule.is_match(Command("hub status", "")));
    EXPECT_FALSE(rule.is_match(Command("svn status", "")));
}

TEST(GitSupportWrapper, InnerSeesExpandedCommand) {
    Recorder inner;
    auto rule = git_support(inner);
    Command cmd("git co main", "trace: alias expansion: co => 'checkout'\n");
    ASSERT_TRUE(rule.is_match(cmd));
    EXPECT_EQ(rule.get_new_command(cmd), std::vector<std::string>{"git checkout main --fixed"});
    EXPECT_EQ(rule.name(), "recorder");
    EXPECT_TRUE(rule.has_side_effect());
}

TEST(GitHelpers, MatchedCommandsAfterSeparator) {
    std::string out = "git: 'stts' is not a git command. See 'git --help'.\n\n"
                      "The most similar commands are\n\tstatus\n\tstash\n\n";
    auto m = get_all_matched_commands(out, {"The most similar command"});
    EXPECT_EQ(m, (std::vector<std::string>{"status", "stash"}));
    EXPECT_TRUE(get_all_matched_commands("nothing here").empty());
}

TEST(GitHelpers, ReplaceCommand) {
    auto fixes = replace_command("git stts -s", "stts", {"status", "stash"});
    ASSERT_FALSE(fixes.empty());
    EXPECT_EQ(fixes.front(), "git status -s");
    EXPECT_LE(fixes.size(), 3u);
}
