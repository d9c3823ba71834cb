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
#ifndef PUSHGATE_COMMAND_SERVICE_H
#define PUSHGATE_COMMAND_SERVICE_H

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "policy/command_sanitizer.h"

namespace pushgate {

// Set in the environment of every child so a nested invocation can tell it
// runs inside an outer gate.
constexpr const char* kNestedEnvVar = "PUSHGATE_ACTIVE";

struct CommandRequest {
    std::vector<std::string> argv;   // argv[0] resolved through PATH
    std::string workingDir;          // empty: inherit
    int timeoutMs = 0;               // 0: wait for exit
    bool mergeStderr = false;        // stderr into stdoutText, in order
};

struct CommandResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode;
    bool timedOut;
};

// Execution seam: gates and git queries go through this, tests substitute it.
using CommandExecutor = std::function<CommandResult(const CommandRequest&)>;

class CommandService {
public:
    explicit CommandService(size_t maxOutputBytes = 1024 * 1024);

    /**
     * Run a process to completion and capture its output.
     * A process killed by a signal reports 128 + signal number.
     * @throws ToolingError if the pipes or the process cannot be created
     */
    CommandResult executeCommand(const CommandRequest& request);

    // Executor bound to this service
    CommandExecutor executor();

    // KnownTool -> direct argv; RawShellCommand -> /bin/sh -c
    static CommandRequest requestFor(const CommandSpec& spec,
                                     const std::string& workingDir,
                                     int timeoutMs);

private:
    std::string sanitizeOutput(const std::string& output, size_t maxLength);

    size_t maxOutputBytes_;
};

} // namespace pushgate

#endif // PUSHGATE_COMMAND_SERVICE_H
