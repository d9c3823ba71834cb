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
#ifndef PUSHGATE_BRANCH_NAMING_GATE_H
#define PUSHGATE_BRANCH_NAMING_GATE_H

#include <string>
#include "gates/gate_types.h"
#include "policy/push_policy.h"
#include "services/git_service.h"

namespace pushgate {

// Prefix match, the way the naming pattern has always been applied.
bool branchMatchesPattern(const std::string& branch, const std::string& pattern);

// Advisory: a mismatch warns, never fails.
class BranchNamingGate {
public:
    static constexpr const char* kName = "branch_naming";

    explicit BranchNamingGate(GitService& git);

    GateResult run(const PushPolicy& policy);

private:
    GitService& git_;
};

} // namespace pushgate

#endif // PUSHGATE_BRANCH_NAMING_GATE_H
