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
#ifndef PUSHGATE_REBASE_GATE_H
#define PUSHGATE_REBASE_GATE_H

#include "gates/gate_types.h"
#include "policy/push_policy.h"
#include "services/git_service.h"

namespace pushgate {

/**
 * RebaseGate
 *
 * Fails when the branch carries merge commits since it diverged from the
 * base branch. Under warn enforcement the same finding is a warning, and
 * allow_merge_commits accepts it. Git problems surface as ToolingError.
 */
class RebaseGate {
public:
    static constexpr const char* kName = "rebase";

    explicit RebaseGate(GitService& git);

    GateResult run(const PushPolicy& policy);

private:
    GitService& git_;
};

} // namespace pushgate

#endif // PUSHGATE_REBASE_GATE_H
