// AutoFix main: re-run the failed command, print ranked corrections, optionally run the first one
#include <autofix/config/loader.hpp>
#include <autofix/core/command.hpp>
#include <autofix/core/corrector.hpp>
#include <autofix/exec/shell.hpp>
#include <autofix/lex/lexer.hpp>
#include <autofix/rules/registry.hpp>
#include <autofix/util/log.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace autofix;

static const char* kPlaceholder = "AUTOFIX_ARGUMENT_PLACEHOLDER";

struct CliOptions {
    CliOverrides overrides;
    bool list_rules = false;
    bool help = false;
    std::string force_command;
    std::string rule;
    std::vector<std::string> words;
};

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static bool g_color = true;
static std::string apply_color(const std::string& s, const char* code){ if(!g_color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }

static void usage(std::ostream& os) {
    os << "Usage: autofix [-y|--yes] [-d|--debug] [--force-command CMD] [--list-rules]\n"
          "               [--rule NAME] [--] [command...]\n";
}

static bool parse_args(int argc, char* argv[], CliOptions& o) {
    bool rest = false;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (rest) { o.words.push_back(a); continue; }
        if (a=="--") rest = true;
        else if (a=="-y"||a=="--yes") o.overrides.yes = true;
        else if (a=="-d"||a=="--debug") o.overrides.debug = true;
        else if (a=="-h"||a=="--help") o.help = true;
        else if (a=="--list-rules") o.list_rules = true;
        else if (a=="--force-command"||a=="--rule") {
            if (i+1>=argc) { std::cerr << "autofix: " << a << " requires an argument\n"; return false; }
            (a=="--rule" ? o.rule : o.force_command) = argv[++i];
        }
        else if (a.size()>1 && a[0]=='-' && o.words.empty()) { std::cerr << "autofix: unknown option " << a << "\n"; return false; }
        else { o.words.push_back(a); rest = true; }
    }
    // Shell functions pass "<alias args> PLACEHOLDER <command>"; keep what follows.
    for (size_t i=0;i<o.words.size();++i) {
        if (o.words[i]==kPlaceholder) { o.words.erase(o.words.begin(), o.words.begin()+static_cast<std::ptrdiff_t>(i)+1); break; }
    }
    return true;
}

// Last history line that is not an invocation of autofix itself.
static std::string command_from_history() {
    std::string hist = getenv_or("AUTOFIX_HISTORY");
    if (hist.empty()) hist = getenv_or("TF_HISTORY");
    std::istringstream ss(hist); std::string line, last;
    while (std::getline(ss, line)) {
        auto words = whitespace_split(line);
        if (words.empty()) continue;
        auto &w = words.front();
        if (w=="autofix"||w=="fuck"||w=="oops"||w=="thefuck") continue;
        last = line;
    }
    return last;
}

static std::string resolve_script(const CliOptions& o) {
    if (!o.force_command.empty()) return o.force_command;
    if (!o.words.empty()) {
        std::string s;
        for (auto &w : o.words) { if(!s.empty()) s += ' '; s += w; }
        return s;
    }
    return command_from_history();
}

static int list_rules(const Settings& settings) {
    for (auto &r : all_rules(settings)) {
        bool on = is_rule_active(*r, settings);
        std::cout << apply_color(r->name(), on ? "1;32" : "2") << "  priority="
                  << settings.get_rule_priority(r->name(), r->priority())
                  << (on ? "" : "  (disabled)")
                  << (r->requires_output() ? "" : "  (no output needed)") << '\n';
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) { usage(std::cerr); return 2; }
    if (opts.help) { usage(std::cout); return 0; }

    // Debug requested on the command line applies while settings load too.
    if (opts.overrides.debug) log::set_level(log::Level::Debug);
    auto settings = load_settings(opts.overrides);
    if (settings.debug) log::set_level(log::Level::Debug);
    g_color = !settings.no_colors;

    if (opts.list_rules) return list_rules(settings);

    auto script = resolve_script(opts);
    if (script.empty()) { std::cerr << "autofix: no command to correct\n"; usage(std::cerr); return 2; }

    auto captured = capture_output(script, settings);
    if (!captured.error.empty()) log::error(captured.error);
    if (captured.timed_out) log::warn("command timed out after " + std::to_string(settings.get_wait_time(script)) + "s: " + script);
    log::debug("captured output (exit " + std::to_string(captured.exit_code) + "):\n" + captured.output);

    Command cmd(script, captured.output);
    auto corrections = opts.rule.empty() ? get_corrected_commands(cmd, settings)
                                         : match_rule(cmd, opts.rule, all_rules(settings));
    if (corrections.empty()) {
        std::cout << "No corrections available for: " << script << '\n';
        return 1;
    }

    if (!settings.require_confirmation) {
        auto &best = corrections.front();
        std::cerr << apply_color(best.script(), "1") << '\n';
        auto r = best.run(cmd, settings);
        if (!r.ok()) std::cerr << "autofix: " << r.error << '\n';
        return r.exit_code;
    }

    for (size_t i=0;i<corrections.size();++i) {
        auto &c = corrections[i];
        std::cout << apply_color(std::to_string(i+1)+":", "1;36") << ' ' << apply_color(c.script(), i==0 ? "1" : "0")
                  << (c.has_side_effect() ? apply_color(" (+side effect)", "2") : std::string()) << '\n';
    }
    return 0;
}
