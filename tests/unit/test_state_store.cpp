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
/**
 * StateStore 单元测试
 */
#ifdef NDEBUG
#undef NDEBUG
#endif
#include "support/state_store.h"
#include <nlohmann/json.hpp>
#include <cassert>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace pushgate;

static std::string readFile(const std::string& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

int main() {
    std::cout << "\n[StateStore] 开始测试..." << std::endl;

    const std::string dir = "test_state_store_dir";
    fs::remove_all(dir);

    // Missing resources read as empty values
    {
        StateStore store(dir);
        assert(!store.readLastRun().has_value());
        assert(!store.hoursSinceLastRun().has_value());
        PendingCleanupLedger ledger = store.readLedger();
        assert(!ledger.hasPending());
        assert(ledger.summary() == "no cleanup needed");
        assert(store.readAudit().empty());
        assert(formatLedgerNotice(ledger).empty());
        std::cout << "  ✓ missing resources" << std::endl;
    }

    // initialize creates defaults and never overwrites
    {
        StateStore store(dir);
        auto created = store.initialize();
        assert(created.size() == 3);
        assert(fs::exists(store.auditLogPath()));
        assert(fs::exists(store.lastRunPath()));
        assert(fs::exists(store.ledgerPath()));
        assert(store.readLastRun().has_value());

        writeFile(store.lastRunPath(), "2026-01-01T00:00:00Z\n");
        created = store.initialize();
        assert(created.empty());
        assert(readFile(store.lastRunPath()) == "2026-01-01T00:00:00Z\n");
        std::cout << "  ✓ initialize" << std::endl;
    }

    // Last-run marker
    {
        StateStore store(dir);
        store.writeLastRun("2026-10-18T10:00:00Z");
        auto lastRun = store.readLastRun();
        assert(lastRun.has_value());
        auto expected = parseIsoTimestamp("2026-10-18T12:00:00+02:00");
        assert(expected.has_value() && *expected == *lastRun);

        auto oneHourAgo = std::chrono::system_clock::now() - std::chrono::hours(1);
        std::time_t t = std::chrono::system_clock::to_time_t(oneHourAgo);
        std::tm tm_utc;
        gmtime_r(&t, &tm_utc);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        store.writeLastRun(buf);
        auto hours = store.hoursSinceLastRun();
        assert(hours.has_value());
        assert(*hours > 0.9 && *hours < 1.1);

        bool threw = false;
        try {
            store.writeLastRun("yesterday");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        writeFile(store.lastRunPath(), "not a timestamp\n");
        assert(!store.readLastRun().has_value());
        std::cout << "  ✓ last-run marker" << std::endl;
    }

    // Timestamp parsing forms
    {
        assert(parseIsoTimestamp("2026-10-18T12:00:00Z").has_value());
        assert(parseIsoTimestamp("2026-10-18T12:00:00.123Z").has_value());
        assert(parseIsoTimestamp("2026-10-18T12:00:00").has_value());
        assert(parseIsoTimestamp("2026-10-18T12:00:00.5-05:30").has_value());
        assert(!parseIsoTimestamp("2026-10-18").has_value());
        assert(!parseIsoTimestamp("2026-10-18T12:00:00 UTC").has_value());
        std::cout << "  ✓ timestamp parsing" << std::endl;
    }

    // Ledger write and read
    {
        StateStore store(dir);
        PendingCleanupLedger ledger;
        ledger.last_updated = "2026-10-18T08:00:00Z";
        ledger.pending_branches.push_back({"feature/done", "2026-10-17T09:00:00Z", 42});
        ledger.pending_branches.push_back({"fix/typo", "", 0});
        ledger.pending_worktrees.push_back({"../wt-old", "feature/old", "2026-10-10T00:00:00Z"});
        store.writeLedger(ledger);
        assert(!fs::exists(store.ledgerPath() + ".tmp"));

        PendingCleanupLedger loaded = store.readLedger();
        assert(loaded.last_updated == "2026-10-18T08:00:00Z");
        assert(loaded.pending_branches.size() == 2);
        assert(loaded.pending_branches[0].pr_number == 42);
        assert(loaded.pending_worktrees.size() == 1);
        assert(loaded.pending_worktrees[0].branch == "feature/old");
        assert(loaded.totalPending() == 3);
        assert(loaded.summary() == "2 branch(es) to prune, 1 worktree(s) to clean");

        std::string notice = formatLedgerNotice(loaded);
        assert(notice.find("snapshot from 2026-10-18T08:00:00Z") != std::string::npos);
        assert(notice.find("2 merged branch(es) to prune") != std::string::npos);
        assert(notice.find("1 orphaned worktree(s)") != std::string::npos);
        assert(notice.find("naming issues") == std::string::npos);
        assert(notice.find("\nRun the janitor's prune step to clean up.") != std::string::npos);
        std::cout << "  ✓ ledger write/read" << std::endl;
    }

    // Branches with naming issues
    {
        StateStore store(dir);
        PendingCleanupLedger ledger;
        ledger.last_updated = "2026-10-18T09:00:00Z";
        ledger.non_compliant_branches["wip"] = "does not match naming pattern";
        ledger.non_compliant_branches["Feature/Upper"] = "uppercase";
        store.writeLedger(ledger);

        PendingCleanupLedger loaded = store.readLedger();
        assert(loaded.non_compliant_branches.size() == 2);
        assert(loaded.non_compliant_branches["wip"] == "does not match naming pattern");
        assert(loaded.totalPending() == 0);
        assert(loaded.hasPending());
        assert(loaded.summary() == "2 branch(es) with naming issues");

        std::string notice = formatLedgerNotice(loaded);
        size_t naming = notice.find("\n  - 2 branch(es) with naming issues");
        size_t prune = notice.find("\nRun the janitor's prune step to clean up.");
        assert(naming != std::string::npos && prune != std::string::npos && naming < prune);

        loaded.pending_branches.push_back({"feature/done", "", 0});
        assert(loaded.summary() == "1 branch(es) to prune, 2 branch(es) with naming issues");

        writeFile(store.ledgerPath(), R"({"non_compliant_branches": ["tmp", "", 3]})");
        PendingCleanupLedger listed = store.readLedger();
        assert(listed.non_compliant_branches.size() == 1);
        assert(listed.non_compliant_branches.count("tmp") == 1);
        std::cout << "  ✓ branches with naming issues" << std::endl;
    }

    // PR numbers outside the int range read as unknown
    {
        StateStore store(dir);
        writeFile(store.ledgerPath(),
                  R"({"pending_branches": [
                      {"name": "a", "pr_number": 4294967297},
                      {"name": "b", "pr_number": -5},
                      {"name": "c", "pr_number": 2147483647},
                      {"name": "d", "pr_number": 1.5}]})");
        PendingCleanupLedger ledger = store.readLedger();
        assert(ledger.pending_branches.size() == 4);
        assert(ledger.pending_branches[0].pr_number == 0);
        assert(ledger.pending_branches[1].pr_number == 0);
        assert(ledger.pending_branches[2].pr_number == 2147483647);
        assert(ledger.pending_branches[3].pr_number == 0);
        std::cout << "  ✓ out-of-range PR numbers" << std::endl;
    }

    // Legacy keys and plain-string entries
    {
        StateStore store(dir);
        writeFile(store.ledgerPath(),
                  R"({"last_updated": "2026-09-01T00:00:00Z",
                      "merged_branches": ["old-a", {"name": "old-b", "pr_number": 7}],
                      "orphaned_worktrees": ["/tmp/wt1"]})");
        PendingCleanupLedger ledger = store.readLedger();
        assert(ledger.pending_branches.size() == 2);
        assert(ledger.pending_branches[0].name == "old-a");
        assert(ledger.pending_branches[1].pr_number == 7);
        assert(ledger.pending_worktrees.size() == 1);
        assert(ledger.pending_worktrees[0].path == "/tmp/wt1");
        std::cout << "  ✓ legacy ledger keys" << std::endl;
    }

    // Corrupt ledger reads as empty
    {
        StateStore store(dir);
        writeFile(store.ledgerPath(), "{ this is not json");
        assert(!store.readLedger().hasPending());
        writeFile(store.ledgerPath(), "[1, 2, 3]");
        assert(!store.readLedger().hasPending());
        std::cout << "  ✓ corrupt ledger" << std::endl;
    }

    // Audit append and stats
    {
        StateStore store(dir);
        fs::remove(store.auditLogPath());
        assert(store.appendAudit("allow", "branch=feature/a rebase=pass"));
        assert(store.appendAudit("deny", "branch=feature/b reason=Lint failed"));
        assert(store.appendAudit("allow", "branch=feature/c"));
        auto entries = store.readAudit();
        assert(entries.size() == 3);
        assert(entries[1].event_type == "deny");
        assert(entries[1].detail == "branch=feature/b reason=Lint failed");
        assert(entries[0].timestamp <= entries[2].timestamp);
        auto stats = store.auditStats();
        assert(stats["allow"] == 2 && stats["deny"] == 1);
        std::cout << "  ✓ audit append" << std::endl;
    }

    // Append failure is reported, not thrown
    {
        const std::string blocked = dir + "/blocker";
        writeFile(blocked, "x");
        StateStore store(blocked + "/state");
        assert(!store.appendAudit("allow", "branch=x"));
        std::cout << "  ✓ audit append failure" << std::endl;
    }

    fs::remove_all(dir);

    std::cout << "[通过] StateStore 测试" << std::endl;
    return 0;
}
