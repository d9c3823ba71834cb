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
#ifndef PUSHGATE_COMMAND_SANITIZER_H
#define PUSHGATE_COMMAND_SANITIZER_H

#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace pushgate {

// A program on the known-tool list, spawned directly without a shell.
struct KnownTool {
    std::string name;
    std::vector<std::string> args;
};

// Anything else; executed through /bin/sh -c.
struct RawShellCommand {
    std::string command;
};

using CommandSpec = std::variant<KnownTool, RawShellCommand>;

// Printable form of a command spec, e.g. "ruff check ." or "sh -c 'make && make test'"
std::string describeCommand(const CommandSpec& spec);

/**
 * CommandSanitizer
 *
 * Policy commands come from a document that lives inside the branch under
 * review, so every command is matched against a deny-list before it can
 * run. Pattern matching only; this is not a sandbox.
 */
class CommandSanitizer {
public:
    CommandSanitizer();

    /**
     * Return the trimmed command if it passes the deny-list.
     * @throws UnsafeCommandError on the first matching pattern
     */
    std::string sanitize(const std::string& command) const;

    bool isCommandAllowed(const std::string& command) const;

    /**
     * Sanitize, then split into a KnownTool when the command has no shell
     * syntax and names a known program; RawShellCommand otherwise.
     * @throws UnsafeCommandError
     */
    CommandSpec classify(const std::string& command) const;

    static const std::vector<std::string>& knownTools();

private:
    struct DenyRule {
        std::string category;
        std::regex pattern;
    };

    std::string extractCommandName(const std::string& command) const;
    bool hasShellSyntax(const std::string& command) const;
    std::vector<std::string> splitWords(const std::string& command) const;

    std::vector<DenyRule> rules_;
};

} // namespace pushgate

#endif // PUSHGATE_COMMAND_SANITIZER_H
