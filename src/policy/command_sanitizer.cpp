/*
 * Copyright (C) 2026 Codyard
 *
 * This file is part of PushGate.
 *
 * PushGate is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PushGate is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PushGate. If not, see <https://www.gnu.org/licenses/\>.
 */
#include "policy/command_sanitizer.h"
#include "support/errors.h"
#include <algorithm>

namespace pushgate {

namespace {

// Start of a command word: beginning of string or after a separator.
const std::string kWordStart = R"((^|[;&|(\s]))";
const std::string kWordEnd = R"((\s|$|[;&|)]))";

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

} // namespace

std::string describeCommand(const CommandSpec& spec) {
    if (const auto* tool = std::get_if<KnownTool>(&spec)) {
        std::string out = tool->name;
        for (const auto& arg : tool->args) {
            out += " " + arg;
        }
        return out;
    }
    return std::get<RawShellCommand>(spec).command;
}

CommandSanitizer::CommandSanitizer() {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    // Root, home, the working tree and top-level system directories, optionally quoted
    const std::string deleteTarget =
        R"((["']?)"
        R"((/\*?|~/?|\$HOME/?|\$\{HOME\}/?|\.\.?/?|\*|)"
        R"(/(bin|boot|dev|etc|home|lib|lib32|lib64|opt|proc|root|sbin|srv|sys|usr|var)/?\*?))"
        R"(["']?))";

    rules_.push_back({"recursive delete",
        std::regex(kWordStart + R"((\S*/)?rm\s+(-\S+\s+)*(-[a-z]*r[a-z]*|--recursive)\s+(-\S+\s+)*)"
                   + deleteTarget + kWordEnd, flags)});
    rules_.push_back({"recursive delete",
        std::regex(R"(--no-preserve-root)", flags)});

    rules_.push_back({"device write",
        std::regex(R"(>\s*/dev/(sd|hd|vd|xvd|nvme|mmcblk|disk))", flags)});
    rules_.push_back({"device write",
        std::regex(R"(\bdd\b[^;&|]*\bof=/dev/(sd|hd|vd|xvd|nvme|mmcblk|disk))", flags)});
    rules_.push_back({"device write",
        std::regex(kWordStart + R"(mkfs(\.[a-z0-9]+)?)" + kWordEnd, flags)});

    rules_.push_back({"pipe to shell",
        std::regex(R"(\|\s*(sudo\s+)?(/usr)?(/bin/)?(ba|da|z|k|c|tc|fi)?sh(\s|$|;))", flags)});
    rules_.push_back({"pipe to shell",
        std::regex(kWordStart + R"((ba|da|z|k)?sh\s+<\()", flags)});
    // Downloaded text substituted into a shell: sh -c "$(curl ...)", eval `wget ...`
    rules_.push_back({"pipe to shell",
        std::regex(kWordStart + R"(((\S*/)?(ba|da|z|k)?sh\s+(-\S+\s+)*-c|eval)\s+["']?(\$\(|`)\s*(curl|wget)\b)",
                   flags)});

    rules_.push_back({"privilege escalation",
        std::regex(kWordStart + R"((sudo|doas|pkexec|su))" + kWordEnd, flags)});
    rules_.push_back({"privilege escalation",
        std::regex(R"(\bchmod\s+(-\S+\s+)*[ugoa]*\+[rwxt]*s)", flags)});
    rules_.push_back({"privilege escalation",
        std::regex(R"(\bchmod\s+(-\S+\s+)*[2-7][0-7]{3}\b)", flags)});

    rules_.push_back({"fork bomb",
        std::regex(R"(:\s*\(\s*\)\s*\{[^}]*:\s*\|\s*:[^}]*&[^}]*\}\s*;\s*:)", flags)});
}

const std::vector<std::string>& CommandSanitizer::knownTools() {
    static const std::vector<std::string> tools = {
        "true", "false", "make", "ninja", "cmake", "ctest",
        "ruff", "flake8", "pylint", "mypy", "black", "isort", "pytest", "tox", "nox", "uv",
        "npm", "npx", "yarn", "pnpm", "eslint", "prettier", "tsc", "jest",
        "cargo", "go", "gofmt", "golangci-lint",
        "mvn", "gradle", "dotnet", "swift",
        "clang-tidy", "clang-format", "cppcheck", "shellcheck",
        "bundle", "rake", "rubocop"
    };
    return tools;
}

std::string CommandSanitizer::sanitize(const std::string& command) const {
    std::string trimmed = trim(command);
    if (trimmed.empty()) {
        throw UnsafeCommandError(command, "empty command");
    }
    for (char c : trimmed) {
        unsigned char uc = static_cast<unsigned char>(c);
        if ((uc < 0x20 && c != '\t') || uc == 0x7f) {
            throw UnsafeCommandError(trimmed, "control characters");
        }
    }
    for (const auto& rule : rules_) {
        if (std::regex_search(trimmed, rule.pattern)) {
            throw UnsafeCommandError(trimmed, rule.category);
        }
    }
    return trimmed;
}

bool CommandSanitizer::isCommandAllowed(const std::string& command) const {
    try {
        sanitize(command);
        return true;
    } catch (const UnsafeCommandError&) {
        return false;
    }
}

CommandSpec CommandSanitizer::classify(const std::string& command) const {
    std::string safe = sanitize(command);
    if (hasShellSyntax(safe)) {
        return RawShellCommand{safe};
    }

    std::string name = extractCommandName(safe);
    const auto& tools = knownTools();
    if (std::find(tools.begin(), tools.end(), name) == tools.end()) {
        return RawShellCommand{safe};
    }

    std::vector<std::string> words = splitWords(safe);
    KnownTool tool;
    tool.name = words.front();
    tool.args.assign(words.begin() + 1, words.end());
    return tool;
}

std::string CommandSanitizer::extractCommandName(const std::string& command) const {
    size_t end = command.find_first_of(" \t");
    return command.substr(0, end);
}

bool CommandSanitizer::hasShellSyntax(const std::string& command) const {
    static const std::string kShellChars = "|&;<>()$`\\*?[]{}~!#";
    if (command.find_first_of(kShellChars) != std::string::npos) {
        return true;
    }
    // VAR=value prefix
    if (extractCommandName(command).find('=') != std::string::npos) {
        return true;
    }
    // Unbalanced quotes are left to the shell to report
    char quote = 0;
    for (char c : command) {
        if (quote == 0 && (c == '\'' || c == '"')) {
            quote = c;
        } else if (c == quote) {
            quote = 0;
        }
    }
    return quote != 0;
}

std::vector<std::string> CommandSanitizer::splitWords(const std::string& command) const {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = 0;
    for (char c : command) {
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            inWord = true;
        } else if (c == ' ' || c == '\t') {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }
    if (inWord) {
        words.push_back(current);
    }
    return words;
}

} // namespace pushgate
