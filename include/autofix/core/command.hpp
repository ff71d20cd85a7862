/*
 * AutoFix Command Model
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   A failed invocation: the script exactly as typed and its captured output
 *   (stderr first, then stdout). The shell-split words of the script are
 *   computed on first use and cached for the lifetime of the instance.
 *
 * License (MIT): (see full text in lex/lexer.hpp header)
 */
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace autofix {

class Command {
public:
    Command(std::string script, std::string output);

    const std::string& script() const { return m_script; }
    const std::string& output() const { return m_output; }

    // Shell words of script(); whitespace split when quoting is unbalanced.
    const std::vector<std::string>& parts() const;

    // Same output, new script, fresh parts cache.
    Command with_script(std::string script) const;

private:
    std::string m_script;
    std::string m_output;
    mutable std::optional<std::vector<std::string>> m_parts; // lazily filled by parts()
};

} // namespace autofix
