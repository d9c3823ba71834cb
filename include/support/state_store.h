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
#ifndef PUSHGATE_STATE_STORE_H
#define PUSHGATE_STATE_STORE_H

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "support/audit_logger.h"

namespace pushgate {

struct PendingBranch {
    std::string name;
    std::string merged_at;      // ISO 8601, may be empty
    int pr_number = 0;          // 0 when unknown
};

struct PendingWorktree {
    std::string path;
    std::string branch;
    std::string orphaned_since; // ISO 8601, may be empty
};

/**
 * PendingCleanupLedger - 待清理分支 / worktree 清单
 *
 * Written wholesale by the external janitor. The gate only reads it and
 * surfaces it as an informational notice.
 */
struct PendingCleanupLedger {
    std::string last_updated;
    std::vector<PendingBranch> pending_branches;
    std::vector<PendingWorktree> pending_worktrees;
    std::map<std::string, std::string> non_compliant_branches;  // branch -> reason

    // Naming issues are reported but are not cleanup items
    size_t totalPending() const { return pending_branches.size() + pending_worktrees.size(); }
    bool hasPending() const { return totalPending() > 0 || !non_compliant_branches.empty(); }

    // "2 branch(es) to prune, 1 worktree(s) to clean, 1 branch(es) with naming issues"
    // or "no cleanup needed"
    std::string summary() const;
};

nlohmann::json ledgerToJson(const PendingCleanupLedger& ledger);

// Lenient conversion: unknown or mistyped fields are ignored.
PendingCleanupLedger ledgerFromJson(const nlohmann::json& j);

// Multi-line notice for pending cleanup, empty when nothing is pending.
std::string formatLedgerNotice(const PendingCleanupLedger& ledger);

// Parse "2026-10-18T12:00:00Z" / "2026-10-18T12:00:00.123Z" / "+00:00" forms.
std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& value);

/**
 * StateStore - 状态目录
 *
 * Three independent resources under one directory:
 * - audit.log              append-only audit trail
 * - janitor-last-run       ISO 8601 scalar
 * - pending-cleanup.json   pending-cleanup ledger
 */
class StateStore {
public:
    static constexpr const char* kAuditLogFile = "audit.log";
    static constexpr const char* kLastRunFile = "janitor-last-run";
    static constexpr const char* kLedgerFile = "pending-cleanup.json";

    explicit StateStore(const std::string& stateDir);

    /**
     * Create the directory and empty defaults for any missing resource.
     * Existing files are left untouched.
     * @return paths of the files created
     */
    std::vector<std::string> initialize();

    /**
     * Append one audit entry. Failures are logged and reported as false;
     * they never propagate.
     */
    bool appendAudit(const std::string& eventType, const std::string& detail);
    std::vector<AuditEntry> readAudit() const;
    std::map<std::string, int> auditStats() const;

    std::optional<std::chrono::system_clock::time_point> readLastRun() const;
    void writeLastRun(const std::string& isoTimestamp);
    std::optional<double> hoursSinceLastRun() const;

    /**
     * Read the ledger. Absence or corruption yields an empty ledger.
     */
    PendingCleanupLedger readLedger() const;

    /**
     * Replace the ledger document (temp file + rename).
     * @throws std::runtime_error when the file cannot be written
     */
    void writeLedger(const PendingCleanupLedger& ledger);

    const std::string& stateDir() const { return stateDir_; }
    std::string auditLogPath() const;
    std::string lastRunPath() const;
    std::string ledgerPath() const;

private:
    std::string stateDir_;
    AuditLogger auditLogger_;
};

} // namespace pushgate

#endif // PUSHGATE_STATE_STORE_H
