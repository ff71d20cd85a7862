/*
 * Shell execution tests - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <autofix/config/settings.hpp>
#include <autofix/core/corrected_command.hpp>
#include <autofix/exec/shell.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

using namespace autofix;
using namespace std::chrono_literals;

namespace {

// Counts successful side effects by appending to a file.
class TouchRule : public Rule {
public:
    explicit TouchRule(std::string path) : m_path(std::move(path)) {}
    std::string name() const override { return "touch"; }
    bool is_match(const Command&) const override { return true; }
    std::vector<std::string> get_new_command(const Command&) const override { return {}; }
    bool has_side_effect() const override { return true; }
    SideEffectResult side_effect(const Command& old_cmd, const std::string& s) const override {
        std::ofstream(m_path, std::ios::app) << old_cmd.script() << "->" << s << '\n';
        return {};
    }
private:
    std::string m_path;
};

std::string tmp_path(const char* tag) {
    return "/tmp/autofix_" + std::string(tag) + "_" + std::to_string(getpid());
}

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST(ShellRun, ExitStatus) {
    EXPECT_EQ(run_shell("true").exit_code, 0);
    EXPECT_TRUE(run_shell("true").ok());
    auto r = run_shell("exit 7");
    EXPECT_EQ(r.exit_code, 7);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(run_shell("kill -9 $$").exit_code, 128 + 9);
}

TEST(ShellRun, ExtraEnvironment) {
    auto out = tmp_path("env");
    auto r = run_shell("printf %s \"$AUTOFIX_TEST_VAR\" > " + out, {{"AUTOFIX_TEST_VAR", "hello"}});
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(slurp(out), "hello");
    std::remove(out.c_str());
    EXPECT_EQ(std::getenv("AUTOFIX_TEST_VAR"), nullptr);
}

TEST(ShellCapture, StderrFirst) {
    auto r = capture_output("echo out; echo err 1>&2; exit 3", 5000ms);
    EXPECT_EQ(r.output, "err\nout\n");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.timed_out);
}

TEST(ShellCapture, SingleStream) {
    EXPECT_EQ(capture_output("printf abc", 5000ms).output, "abc");
    EXPECT_EQ(capture_output("printf abc 1>&2", 5000ms).output, "abc");
    EXPECT_EQ(capture_output("printf a 1>&2; printf b", 5000ms).output, "a\nb");
}

TEST(ShellCapture, TimeoutKillsChild) {
    auto start = std::chrono::steady_clock::now();
    auto r = capture_output("echo started; sleep 5", 300ms);
    auto took = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.ok());
    EXPECT_LT(took, 3s);
    EXPECT_EQ(r.output, "started\n");
}

TEST(ShellCapture, TimeoutFromSettings) {
    Settings s;
    s.wait_command = 1;
    auto r = capture_output("sleep 3", s);
    EXPECT_TRUE(r.timed_out);
}

TEST(CorrectedRun, SideEffectAfterSuccess) {
    auto log_path = tmp_path("effect");
    std::remove(log_path.c_str());
    RulePtr rule = std::make_shared<TouchRule>(log_path);
    Command original("gti status", "gti: command not found");
    CorrectedCommand ok("true", 1, rule, original);
    ASSERT_TRUE(ok.has_side_effect());
    auto r = ok.run(original, Settings{});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(slurp(log_path), "gti status->true\n");

    CorrectedCommand bad("exit 4", 1, rule, original);
    auto rb = bad.run(original, Settings{});
    EXPECT_EQ(rb.exit_code, 4);
    EXPECT_FALSE(rb.error.empty());
    EXPECT_EQ(slurp(log_path), "gti status->true\n");
    std::remove(log_path.c_str());
}

TEST(CorrectedRun, SideEffectGetsCallerCommand) {
    auto log_path = tmp_path("caller");
    std::remove(log_path.c_str());
    RulePtr rule = std::make_shared<TouchRule>(log_path);
    CorrectedCommand c("true", 1, rule, Command("gti status", "gti: command not found"));
    EXPECT_TRUE(c.run(Command("gti log", "gti: command not found"), Settings{}).ok());
    EXPECT_TRUE(c.run_side_effect().ok());
    EXPECT_EQ(slurp(log_path), "gti log->true\ngti status->true\n");
    std::remove(log_path.c_str());
}

TEST(CorrectedRun, NoSideEffect) {
    CorrectedCommand c("true", 1);
    EXPECT_FALSE(c.has_side_effect());
    EXPECT_TRUE(c.run_side_effect().ok());
    EXPECT_TRUE(c.run(Command("x", ""), Settings{}).ok());
}

TEST(CorrectedOrder, PriorityThenScript) {
    EXPECT_LT(CorrectedCommand("b", 1), CorrectedCommand("a", 2));
    EXPECT_LT(CorrectedCommand("a", 2), CorrectedCommand("b", 2));
    EXPECT_TRUE(CorrectedCommand("a", 1).duplicates(CorrectedCommand("a", 9)));
}
