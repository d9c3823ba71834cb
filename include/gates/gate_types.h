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
#ifndef PUSHGATE_GATE_TYPES_H
#define PUSHGATE_GATE_TYPES_H

#include <string>
#include <vector>

namespace pushgate {

enum class GateStatus {
    Pass,
    Fail,
    Warn,
    Skipped
};

// "pass" / "fail" / "warn" / "skipped"
const char* gateStatusToString(GateStatus status);

/**
 * GateResult - outcome of one gate in one run
 *
 * Recorded once by the pipeline and not modified afterwards. `output` holds
 * the command's captured output verbatim.
 */
struct GateResult {
    std::string gate_name;
    GateStatus status = GateStatus::Skipped;
    std::string message;
    std::vector<std::string> detail_lines;
    bool required = false;
    std::string output;
};

GateResult makeGateResult(const std::string& gateName, GateStatus status,
                          const std::string& message, bool required);

/**
 * ExecutionContext - everything a run needs, passed explicitly
 *
 * command_timeout_seconds is the host's wall-clock budget per external
 * command and caps the policy's per-command timeout; 0 means no cap.
 */
struct ExecutionContext {
    std::string raw_command;
    std::string repo_root;
    std::string policy_path;
    std::string state_dir;
    int command_timeout_seconds = 0;
    bool nested = false;
};

} // namespace pushgate

#endif // PUSHGATE_GATE_TYPES_H
