/*
 * Command model implementation - AutoFix
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <autofix/core/command.hpp>
#include <autofix/lex/lexer.hpp>
#include <autofix/util/log.hpp>

namespace autofix {

Command::Command(std::string script, std::string output)
    : m_script(std::move(script)), m_output(std::move(output)) {}

const std::vector<std::string>& Command::parts() const {
    if (!m_parts) {
        auto words = shell_split(m_script);
        if (words) {
            m_parts = std::move(*words);
        } else {
            log::debug("unbalanced quoting, splitting on whitespace: " + m_script);
            m_parts = whitespace_split(m_script);
        }
    }
    return *m_parts;
}

Command Command::with_script(std::string script) const {
    return Command(std::move(script), m_output);
}

} // namespace autofix
