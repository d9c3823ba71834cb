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
#include "gates/gate_types.h"

namespace pushgate {

const char* gateStatusToString(GateStatus status) {
    switch (status) {
        case GateStatus::Pass: return "pass";
        case GateStatus::Fail: return "fail";
        case GateStatus::Warn: return "warn";
        case GateStatus::Skipped: return "skipped";
    }
    return "unknown";
}

GateResult makeGateResult(const std::string& gateName, GateStatus status,
                          const std::string& message, bool required) {
    GateResult result;
    result.gate_name = gateName;
    result.status = status;
    result.message = message;
    result.required = required;
    return result;
}

} // namespace pushgate
