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
#include "gates/branch_naming_gate.h"
#include <regex>

namespace pushgate {

bool branchMatchesPattern(const std::string& branch, const std::string& pattern) {
    std::regex re(pattern);
    return std::regex_search(branch, re, std::regex_constants::match_continuous);
}

BranchNamingGate::BranchNamingGate(GitService& git)
    : git_(git) {
}

GateResult BranchNamingGate::run(const PushPolicy& policy) {
    if (!policy.enforce_branch_naming || policy.branch_naming_pattern.empty()) {
        return makeGateResult(kName, GateStatus::Skipped, "Branch naming not enforced", false);
    }

    std::string branch = git_.currentBranch();
    if (branch.empty()) {
        return makeGateResult(kName, GateStatus::Skipped, "Detached HEAD; no branch name to check", false);
    }
    if (branch == policy.base_branch) {
        return makeGateResult(kName, GateStatus::Skipped, "Base branch is exempt from naming rules", false);
    }

    if (!branchMatchesPattern(branch, policy.branch_naming_pattern)) {
        GateResult result = makeGateResult(kName, GateStatus::Warn,
            "Branch '" + branch + "' does not match naming pattern '" +
            policy.branch_naming_pattern + "'", false);
        result.detail_lines.push_back("Rename with: git branch -m <new-name>");
        return result;
    }
    return makeGateResult(kName, GateStatus::Pass,
                          "Branch '" + branch + "' matches naming pattern", false);
}

} // namespace pushgate
