/*
 * Rule registry - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/rules/registry.hpp>
#include <autofix/rules/cd.hpp>
#include <autofix/rules/docker.hpp>
#include <autofix/rules/git.hpp>
#include <autofix/rules/git_support.hpp>
#include <autofix/rules/no_command.hpp>
#include <autofix/rules/system.hpp>

namespace autofix {

std::vector<RulePtr> all_rules(const Settings& settings) {
    using namespace rules;
    return {
        share_rule(Sudo{}),
        share_rule(CdParent{}),
        share_rule(CdMkdir{}),
        share_rule(CdCorrection{}),
        share_rule(SlLs{}),
        share_rule(NoCommand{settings.excluded_search_path_prefixes}),
        share_rule(git_support(GitNotCommand{})),
        share_rule(git_support(GitPush{})),
        share_rule(git_support(GitBranchDelete{})),
        share_rule(git_support(GitTwoDashes{})),
        share_rule(for_app(DockerNotCommand{}, {"docker"})),
        share_rule(DirtyUntar{}),
        share_rule(RmRoot{}),
    };
}

} // namespace autofix
