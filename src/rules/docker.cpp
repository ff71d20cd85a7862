/*
 * docker rules - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/rules/docker.hpp>
#include <autofix/util/executables.hpp>
#include <autofix/util/fuzzy.hpp>
#include <regex>

namespace autofix::rules {

const std::vector<std::string>& docker_commands() {
    static const std::vector<std::string> cmds = {
        "attach", "build", "commit", "cp", "create", "diff", "events", "exec", "export",
        "history", "images", "import", "info", "inspect", "kill", "load", "login", "logout",
        "logs", "pause", "port", "ps", "pull", "push", "rename", "restart", "rm", "rmi",
        "run", "save", "search", "start", "stats", "stop", "tag", "top", "unpause", "update",
        "version", "volume", "wait", "builder", "config", "container", "context", "image",
        "manifest", "network", "node", "plugin", "secret", "service", "stack", "swarm",
        "system", "trust",
    };
    return cmds;
}

bool DockerNotCommand::is_match(const Command& cmd) const {
    auto &out = cmd.output();
    return out.find("is not a docker command") != std::string::npos
        || out.find("Usage:\tdocker") != std::string::npos
        || out.find("Usage: docker") != std::string::npos;
}

std::vector<std::string> DockerNotCommand::get_new_command(const Command& cmd) const {
    static const std::regex wrong_re(R"(docker: '(\w+)' is not a docker command)");
    std::string wrong;
    std::smatch m;
    if (std::regex_search(cmd.output(), m, wrong_re)) wrong = m[1].str();
    else if (cmd.parts().size() >= 2) wrong = cmd.parts()[1];
    if (wrong.empty()) return {};
    std::vector<std::string> out;
    for (auto &fix : get_close_matches(wrong, docker_commands()))
        out.push_back(replace_argument(cmd.script(), wrong, fix));
    return out;
}

} // namespace autofix::rules
