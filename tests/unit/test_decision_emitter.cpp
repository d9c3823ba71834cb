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
#ifdef NDEBUG
#undef NDEBUG
#endif
#include "gates/decision_emitter.h"
#include <cassert>
#include <iostream>

using namespace pushgate;

namespace {

GateResult result(const std::string& name, GateStatus status, const std::string& message,
                  bool required = true) {
    return makeGateResult(name, status, message, required);
}

size_t positionOf(const std::string& haystack, const std::string& needle) {
    size_t pos = haystack.find(needle);
    assert(pos != std::string::npos);
    return pos;
}

} // namespace

// Test 1: Allow
void testAllow() {
    std::cout << "Test 1: Allow..." << std::endl;

    DecisionEmitter emitter("--skip-push-rules");
    std::vector<GateResult> results = {
        result("rebase", GateStatus::Pass, "Branch 'a' is rebased on 'main' (1 commit(s) ahead)"),
        result("lint", GateStatus::Skipped, "Lint not required by policy", false),
        result("test", GateStatus::Pass, "Tests passed: pytest"),
    };

    Decision decision = emitter.emit(results, {});
    assert(decision.decision == DecisionKind::Allow);
    assert(decision.reason == "All push rules passed");
    assert(!decision.additional_context.has_value());

    nlohmann::json j = decisionToJson(decision);
    assert(j["decision"] == "allow");
    assert(j["reason"] == "All push rules passed");
    assert(!j.contains("additionalContext"));

    std::cout << "✓ Allow test passed" << std::endl;
}

// Test 2: Warnings and optional failures do not deny
void testWarnings() {
    std::cout << "Test 2: Warnings..." << std::endl;

    DecisionEmitter emitter("--skip-push-rules");
    GateResult naming = result("branch_naming", GateStatus::Warn,
                               "Branch 'wip' does not match naming pattern 'feature/'", false);
    naming.detail_lines.push_back("Rename with: git branch -m <new-name>");
    std::vector<GateResult> results = {
        result("rebase", GateStatus::Warn, "Detached HEAD; cannot verify rebase status"),
        result("lint", GateStatus::Fail, "Lint failed (exit 1): ruff check .", false),
        naming,
    };

    Decision decision = emitter.emit(results, {"Cleanup pending"});
    assert(decision.decision == DecisionKind::Allow);
    assert(decision.additional_context.has_value());
    const std::string& ctx = *decision.additional_context;
    size_t rebase = positionOf(ctx, "[rebase] WARN: Detached HEAD");
    size_t lint = positionOf(ctx, "[lint] FAIL: Lint failed");
    size_t rename = positionOf(ctx, "\n  Rename with: git branch -m");
    size_t notice = positionOf(ctx, "\n\nCleanup pending");
    assert(rebase < lint && lint < rename && rename < notice);
    assert(ctx.find("git push --skip-push-rules") == std::string::npos);

    std::cout << "✓ Warnings test passed" << std::endl;
}

// Test 3: Deny
void testDeny() {
    std::cout << "Test 3: Deny..." << std::endl;

    DecisionEmitter emitter("--emergency");
    GateResult rebase = result("rebase", GateStatus::Fail,
                               "Merge commits detected: 1 merge commit(s) on 'f' since it diverged from 'main'");
    rebase.detail_lines = {"abc1234 Merge main into f",
                           "Rebase onto the base branch to linearize history: git rebase -i main"};
    GateResult lint = result("lint", GateStatus::Fail, "Lint failed (exit 2): make lint");
    lint.output = "E501 line too long\n\n";
    std::vector<GateResult> results = {rebase, lint};

    Decision decision = emitter.emit(results, {"", "Stale worktrees"});
    assert(decision.decision == DecisionKind::Deny);
    // First failing required gate names the reason
    assert(decision.reason == rebase.message);

    const std::string& ctx = *decision.additional_context;
    size_t first = positionOf(ctx, "[rebase] FAIL: Merge commits detected");
    size_t commitLine = positionOf(ctx, "  abc1234 Merge main into f");
    size_t second = positionOf(ctx, "[lint] FAIL: Lint failed");
    size_t bypass = positionOf(ctx, "To bypass push rules (the bypass is audited): git push --emergency");
    size_t notice = positionOf(ctx, "Stale worktrees");
    assert(first < commitLine && commitLine < second && second < bypass && bypass < notice);
    // Output belongs to the reason gate, which has none here
    assert(ctx.find("--- lint output ---") == std::string::npos);

    Decision lintOnly = emitter.emit({lint}, {});
    const std::string& lintCtx = *lintOnly.additional_context;
    assert(lintCtx.find("\n\n--- lint output ---\nE501 line too long\n\nTo bypass") != std::string::npos);

    nlohmann::json j = decisionToJson(lintOnly);
    assert(j["decision"] == "deny");
    assert(j["additionalContext"] == lintCtx);

    std::cout << "✓ Deny test passed" << std::endl;
}

// Test 4: Policy errors
void testPolicyErrors() {
    std::cout << "Test 4: Policy errors..." << std::endl;

    DecisionEmitter emitter("--skip-push-rules");

    Decision missing = emitter.policyError(MissingPolicyError("/repo/push-rules.md"));
    assert(missing.decision == DecisionKind::Deny);
    assert(missing.reason == "Push rules policy not found at: /repo/push-rules.md");
    const std::string& ctx = *missing.additional_context;
    size_t create = positionOf(ctx, "Create /repo/push-rules.md");
    size_t version = positionOf(ctx, "version: 1.0");
    size_t bypass = positionOf(ctx, "git push --skip-push-rules");
    assert(create < version && version < bypass);

    Decision malformed = emitter.policyError(
        MalformedPolicyError("/repo/push-rules.md", "unrecognized policy version '2.0'"));
    assert(malformed.decision == DecisionKind::Deny);
    assert(malformed.reason.find("unrecognized policy version") != std::string::npos);
    assert(malformed.additional_context->find("Fix /repo/push-rules.md") == 0);
    assert(malformed.additional_context->find("git push --skip-push-rules") != std::string::npos);

    std::cout << "✓ Policy errors test passed" << std::endl;
}

int main() {
    std::cout << "=== DecisionEmitter Unit Tests ===" << std::endl << std::endl;

    testAllow();
    testWarnings();
    testDeny();
    testPolicyErrors();

    std::cout << std::endl << "=== All tests passed! ===" << std::endl;
    return 0;
}
