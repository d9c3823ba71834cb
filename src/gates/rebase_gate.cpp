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
#include "gates/rebase_gate.h"

namespace pushgate {

RebaseGate::RebaseGate(GitService& git)
    : git_(git) {
}

GateResult RebaseGate::run(const PushPolicy& policy) {
    if (!policy.rebase_required) {
        return makeGateResult(kName, GateStatus::Skipped, "Rebase check not required by policy", false);
    }
    if (policy.rebase_enforcement == RebaseEnforcement::Disabled) {
        return makeGateResult(kName, GateStatus::Skipped, "Rebase check disabled by policy", false);
    }
    bool strict = policy.rebase_enforcement == RebaseEnforcement::Strict;

    std::string branch = git_.currentBranch();
    if (branch.empty()) {
        return makeGateResult(kName, GateStatus::Warn,
                              "Detached HEAD; cannot verify rebase status", strict);
    }
    if (branch == policy.base_branch) {
        return makeGateResult(kName, GateStatus::Skipped,
                              "Current branch is the base branch '" + branch +
                              "'; rebase check does not apply", strict);
    }

    std::string baseRef = git_.resolveBaseRef(policy.base_branch);
    std::string forkPoint = git_.mergeBase(baseRef, branch);
    std::vector<MergeCommit> merges = git_.findMergeCommits(forkPoint, branch);

    if (!merges.empty() && policy.allow_merge_commits) {
        return makeGateResult(kName, GateStatus::Pass,
                              "Branch '" + branch + "' has " + std::to_string(merges.size()) +
                              " merge commit(s) since it diverged from '" + baseRef +
                              "'; merge commits are allowed by policy", strict);
    }
    if (!merges.empty()) {
        // warn enforcement reports the same findings without blocking
        GateResult result = makeGateResult(kName, strict ? GateStatus::Fail : GateStatus::Warn,
            "Merge commits detected: " + std::to_string(merges.size()) +
            " merge commit(s) on '" + branch + "' since it diverged from '" + baseRef + "'",
            strict);
        for (const auto& commit : merges) {
            result.detail_lines.push_back(commit.shortSha + " " + commit.subject);
        }
        result.detail_lines.push_back("Rebase onto the base branch to linearize history: git rebase -i " +
                                      policy.base_branch);
        return result;
    }

    int ahead = git_.countCommitsAhead(baseRef, branch);
    return makeGateResult(kName, GateStatus::Pass,
                          "Branch '" + branch + "' is rebased on '" + baseRef + "' (" +
                          std::to_string(ahead) + " commit(s) ahead)", strict);
}

} // namespace pushgate
