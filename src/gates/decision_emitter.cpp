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
#include "gates/decision_emitter.h"
#include <sstream>

using json = nlohmann::json;

namespace pushgate {

namespace {

std::string joinLines(const std::vector<std::string>& lines) {
    std::ostringstream out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out << "\n";
        }
        out << lines[i];
    }
    return out.str();
}

std::string stripTrailingNewlines(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

const char* decisionKindToString(DecisionKind kind) {
    return kind == DecisionKind::Deny ? "deny" : "allow";
}

json decisionToJson(const Decision& decision) {
    json j;
    j["decision"] = decisionKindToString(decision.decision);
    j["reason"] = decision.reason;
    if (decision.additional_context) {
        j["additionalContext"] = *decision.additional_context;
    }
    return j;
}

DecisionEmitter::DecisionEmitter(const std::string& bypassFlag)
    : bypassFlag_(bypassFlag) {
}

std::string DecisionEmitter::bypassInstructions() const {
    return "To bypass push rules (the bypass is audited): git push " + bypassFlag_;
}

Decision DecisionEmitter::emit(const std::vector<GateResult>& results,
                               const std::vector<std::string>& notices) const {
    const GateResult* failing = nullptr;
    std::vector<std::string> lines;

    for (const auto& result : results) {
        if (result.status == GateStatus::Fail && result.required && failing == nullptr) {
            failing = &result;
        }
        if (result.status != GateStatus::Fail && result.status != GateStatus::Warn) {
            continue;
        }
        std::string tag = result.status == GateStatus::Fail ? "FAIL" : "WARN";
        lines.push_back("[" + result.gate_name + "] " + tag + ": " + result.message);
        for (const auto& detail : result.detail_lines) {
            lines.push_back("  " + detail);
        }
    }

    Decision decision;
    if (failing != nullptr) {
        decision.decision = DecisionKind::Deny;
        decision.reason = failing->message;
        std::string output = stripTrailingNewlines(failing->output);
        if (!output.empty()) {
            lines.push_back("");
            lines.push_back("--- " + failing->gate_name + " output ---");
            lines.push_back(output);
        }
        lines.push_back("");
        lines.push_back(bypassInstructions());
    } else {
        decision.decision = DecisionKind::Allow;
        decision.reason = "All push rules passed";
    }

    for (const auto& notice : notices) {
        if (notice.empty()) {
            continue;
        }
        if (!lines.empty()) {
            lines.push_back("");
        }
        lines.push_back(notice);
    }

    if (!lines.empty()) {
        decision.additional_context = joinLines(lines);
    }
    return decision;
}

Decision DecisionEmitter::policyError(const PolicyError& error) const {
    Decision decision;
    decision.decision = DecisionKind::Deny;
    decision.reason = error.what();

    std::vector<std::string> lines;
    if (dynamic_cast<const MissingPolicyError*>(&error) != nullptr) {
        lines.push_back("Create " + error.path() + " starting with a metadata block:");
        lines.push_back("  ---");
        lines.push_back("  version: 1.0");
        lines.push_back("  enabled: true");
        lines.push_back("  bypass_flag: " + bypassFlag_);
        lines.push_back("  ---");
        lines.push_back("followed by '## Rebase Policy', '## Linting' and '## Testing' sections.");
        lines.push_back("`pushgate render-policy <file>` prints the canonical layout of an existing policy.");
    } else {
        lines.push_back("Fix " + error.path() + " and retry the push.");
    }
    lines.push_back("");
    lines.push_back(bypassInstructions());
    decision.additional_context = joinLines(lines);
    return decision;
}

} // namespace pushgate
