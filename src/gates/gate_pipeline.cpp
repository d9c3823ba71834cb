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
#include "gates/gate_pipeline.h"
#include "gates/branch_naming_gate.h"
#include "gates/bypass_handler.h"
#include "gates/command_gate.h"
#include "gates/rebase_gate.h"
#include "services/git_service.h"
#include "support/errors.h"
#include "utils/log_path.h"
#include <utility>

namespace pushgate {

const char* pipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Init: return "INIT";
        case PipelineStage::BypassCheck: return "BYPASS_CHECK";
        case PipelineStage::PolicyLoad: return "POLICY_LOAD";
        case PipelineStage::RebaseGate: return "REBASE_GATE";
        case PipelineStage::LintGate: return "LINT_GATE";
        case PipelineStage::TestGate: return "TEST_GATE";
        case PipelineStage::BranchNamingGate: return "BRANCH_NAMING_GATE";
        case PipelineStage::Decision: return "DECISION";
        case PipelineStage::Done: return "DONE";
    }
    return "UNKNOWN";
}

GatePipeline::GatePipeline(StateStore* stateStore, CommandExecutor executor, PipelineOptions options)
    : stateStore_(stateStore), executor_(std::move(executor)), options_(options) {
}

PipelineRun GatePipeline::run(const ExecutionContext& context) {
    PipelineRun run;
    run.stages.push_back(PipelineStage::Init);

    if (context.nested) {
        run.decision.decision = DecisionKind::Allow;
        run.decision.reason = "nested invocation";
        LogLine("Push gate already active in a parent run; deferring to it");
        finish(run, "nested", "inner run deferred to the active pipeline");
        return run;
    }

    run.stages.push_back(PipelineStage::BypassCheck);
    std::string bypassFlag = resolveBypassFlag(context.policy_path);
    if (checkBypass(context.raw_command, bypassFlag)) {
        for (const char* gate : {RebaseGate::kName, "lint", "test", BranchNamingGate::kName}) {
            run.results.push_back(makeGateResult(gate, GateStatus::Skipped, "Bypassed via " + bypassFlag, false));
        }
        run.decision.decision = DecisionKind::Allow;
        run.decision.reason = "bypassed";
        LogLine("Push rules bypassed with " + bypassFlag);
        finish(run, "bypass", describeBranch(context) + " flag=" + bypassFlag);
        return run;
    }

    run.stages.push_back(PipelineStage::PolicyLoad);
    PushPolicy policy;
    try {
        policy = loadPolicy(context.policy_path);
    } catch (const PolicyError& e) {
        LogLine(std::string("Policy error: ") + e.what());
        run.decision = DecisionEmitter(bypassFlag).policyError(e);
        finish(run, "deny", describeBranch(context) + " policy_error=" + e.what());
        return run;
    }

    DecisionEmitter emitter(policy.bypass_flag);
    if (!policy.enabled) {
        run.decision.decision = DecisionKind::Allow;
        run.decision.reason = "Push rules disabled by policy";
        finish(run, "disabled", describeBranch(context));
        return run;
    }

    GitService git(executor_, context.repo_root);
    RebaseGate rebaseGate(git);
    CommandGate lintGate(CommandGate::Kind::Lint, sanitizer_, executor_);
    CommandGate testGate(CommandGate::Kind::Test, sanitizer_, executor_);
    BranchNamingGate namingGate(git);

    std::vector<NamedGate> gates = {
        {RebaseGate::kName, PipelineStage::RebaseGate,
         policy.rebase_required && policy.rebase_enforcement == RebaseEnforcement::Strict,
         [&]() { return rebaseGate.run(policy); }},
        {lintGate.name(), PipelineStage::LintGate, policy.lint.required,
         [&]() { return lintGate.run(policy.lint, context); }},
        {testGate.name(), PipelineStage::TestGate, policy.test.required,
         [&]() { return testGate.run(policy.test, context); }},
        {BranchNamingGate::kName, PipelineStage::BranchNamingGate, false,
         [&]() { return namingGate.run(policy); }},
    };

    bool halted = false;
    for (const auto& gate : gates) {
        if (halted) {
            run.results.push_back(makeGateResult(gate.name, GateStatus::Skipped,
                                                 "Not run: an earlier required gate failed",
                                                 gate.required));
            continue;
        }
        run.stages.push_back(gate.stage);
        GateResult result = runGuarded(gate);
        LogLine("Gate " + result.gate_name + ": " + gateStatusToString(result.status) +
                " - " + result.message);
        if (result.status == GateStatus::Fail && result.required) {
            halted = true;
        }
        run.results.push_back(std::move(result));
    }

    run.stages.push_back(PipelineStage::Decision);
    run.decision = emitter.emit(run.results, collectNotices());

    std::string detail = describeBranch(context);
    for (const auto& result : run.results) {
        detail += " " + result.gate_name + "=" + gateStatusToString(result.status);
    }
    if (run.decision.decision == DecisionKind::Deny) {
        detail += " reason=" + run.decision.reason;
    }
    finish(run, decisionKindToString(run.decision.decision), detail);
    return run;
}

GateResult GatePipeline::runGuarded(const NamedGate& gate) {
    try {
        GateResult result = gate.fn();
        result.gate_name = gate.name;
        return result;
    } catch (const UnsafeCommandError& e) {
        GateResult result = makeGateResult(gate.name, GateStatus::Fail, e.what(), gate.required);
        result.detail_lines.push_back("The command was not executed.");
        return result;
    } catch (const ToolingError& e) {
        return makeGateResult(gate.name, GateStatus::Warn, e.what(), gate.required);
    } catch (const std::exception& e) {
        return makeGateResult(gate.name, GateStatus::Warn,
                              std::string("Unexpected error: ") + e.what(), gate.required);
    }
}

std::vector<std::string> GatePipeline::collectNotices() {
    std::vector<std::string> notices;
    if (stateStore_ == nullptr || !options_.show_cleanup_notice) {
        return notices;
    }
    std::string notice = formatLedgerNotice(stateStore_->readLedger());
    if (!notice.empty()) {
        notices.push_back(notice);
    }
    return notices;
}

std::string GatePipeline::describeBranch(const ExecutionContext& context) {
    try {
        std::string branch = GitService(executor_, context.repo_root).currentBranch();
        return "branch=" + (branch.empty() ? std::string("(detached)") : branch);
    } catch (const std::exception&) {
        return "branch=(unknown)";
    }
}

void GatePipeline::finish(PipelineRun& run, const std::string& eventType, const std::string& detail) {
    run.audit_event = eventType;
    if (stateStore_ != nullptr && options_.audit_enabled) {
        // A failed append is logged by the store; the decision stands.
        stateStore_->appendAudit(eventType, detail);
    }
    run.stages.push_back(PipelineStage::Done);
}

} // namespace pushgate
