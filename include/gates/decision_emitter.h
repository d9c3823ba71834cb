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
#ifndef PUSHGATE_DECISION_EMITTER_H
#define PUSHGATE_DECISION_EMITTER_H

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "gates/gate_types.h"
#include "support/errors.h"

namespace pushgate {

enum class DecisionKind {
    Allow,
    Deny
};

const char* decisionKindToString(DecisionKind kind);

struct Decision {
    DecisionKind decision = DecisionKind::Allow;
    std::string reason;
    std::optional<std::string> additional_context;
};

// {"decision": "allow"|"deny", "reason": ..., "additionalContext": ...}
nlohmann::json decisionToJson(const Decision& decision);

/**
 * DecisionEmitter - 汇总门禁结果
 *
 * Deny iff a required gate failed. Context lists fail/warn messages in
 * execution order, then (on deny) the failing gate's output and the bypass
 * instructions, then the informational notices.
 */
class DecisionEmitter {
public:
    explicit DecisionEmitter(const std::string& bypassFlag);

    Decision emit(const std::vector<GateResult>& results,
                  const std::vector<std::string>& notices) const;

    // Deny for a missing or malformed policy, with setup instructions
    Decision policyError(const PolicyError& error) const;

    std::string bypassInstructions() const;

private:
    std::string bypassFlag_;
};

} // namespace pushgate

#endif // PUSHGATE_DECISION_EMITTER_H
