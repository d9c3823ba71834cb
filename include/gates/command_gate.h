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
#ifndef PUSHGATE_COMMAND_GATE_H
#define PUSHGATE_COMMAND_GATE_H

#include <string>
#include "gates/gate_types.h"
#include "policy/command_sanitizer.h"
#include "policy/push_policy.h"
#include "services/command_service.h"

namespace pushgate {

// Best-effort test count from runner output (pytest, GoogleTest, CTest,
// cargo, jest). Empty when the format is not recognized.
std::string summarizeTestOutput(const std::string& output);

/**
 * CommandGate - shared implementation of the lint and test gates
 *
 * Sanitizes the policy command, runs it in the repository root and maps
 * the exit status onto a gate result. Raises UnsafeCommandError for a
 * rejected command and ToolingError when the command cannot run or times
 * out.
 */
class CommandGate {
public:
    enum class Kind {
        Lint,
        Test
    };

    CommandGate(Kind kind, const CommandSanitizer& sanitizer, CommandExecutor executor);

    const char* name() const;

    GateResult run(const ValidationCommand& command, const ExecutionContext& context);

private:
    const char* label() const;

    Kind kind_;
    const CommandSanitizer& sanitizer_;
    CommandExecutor executor_;
};

} // namespace pushgate

#endif // PUSHGATE_COMMAND_GATE_H
