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
#ifndef PUSHGATE_GATE_PIPELINE_H
#define PUSHGATE_GATE_PIPELINE_H

#include <functional>
#include <string>
#include <vector>
#include "gates/decision_emitter.h"
#include "gates/gate_types.h"
#include "policy/command_sanitizer.h"
#include "policy/push_policy.h"
#include "services/command_service.h"
#include "support/state_store.h"

namespace pushgate {

enum class PipelineStage {
    Init,
    BypassCheck,
    PolicyLoad,
    RebaseGate,
    LintGate,
    TestGate,
    BranchNamingGate,
    Decision,
    Done
};

const char* pipelineStageToString(PipelineStage stage);

struct PipelineOptions {
    bool audit_enabled = true;
    bool show_cleanup_notice = true;
};

struct PipelineRun {
    Decision decision;
    std::vector<GateResult> results;     // one per gate, in execution order
    std::vector<PipelineStage> stages;   // stages actually entered
    std::string audit_event;             // event type appended for this run
};

/**
 * GatePipeline - 推送门禁流程
 *
 * INIT -> BYPASS_CHECK -> POLICY_LOAD -> REBASE -> LINT -> TEST ->
 * BRANCH_NAMING -> DECISION -> DONE
 *
 * Gates are folded in order. A failed required gate stops the fold and the
 * remaining gates are recorded as skipped. Tooling problems inside a gate
 * degrade it to warn; a rejected command fails it. Exactly one audit entry
 * is appended per run.
 */
class GatePipeline {
public:
    /**
     * @param stateStore audit trail and ledger; may be null (no audit, no notice)
     * @param executor runs git and the policy commands
     */
    GatePipeline(StateStore* stateStore, CommandExecutor executor,
                 PipelineOptions options = PipelineOptions());

    PipelineRun run(const ExecutionContext& context);

private:
    using GateFn = std::function<GateResult()>;

    struct NamedGate {
        std::string name;
        PipelineStage stage;
        bool required;
        GateFn fn;
    };

    GateResult runGuarded(const NamedGate& gate);
    std::vector<std::string> collectNotices();
    std::string describeBranch(const ExecutionContext& context);
    void finish(PipelineRun& run, const std::string& eventType, const std::string& detail);

    StateStore* stateStore_;
    CommandExecutor executor_;
    PipelineOptions options_;
    CommandSanitizer sanitizer_;
};

} // namespace pushgate

#endif // PUSHGATE_GATE_PIPELINE_H
