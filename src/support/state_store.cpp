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
#include "support/state_store.h"
#include "utils/log_path.h"
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace pushgate {

namespace {

std::string stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

const json* arrayField(const json& j, const char* key, const char* legacyKey) {
    auto it = j.find(key);
    if (it != j.end() && it->is_array()) {
        return &(*it);
    }
    it = j.find(legacyKey);
    if (it != j.end() && it->is_array()) {
        return &(*it);
    }
    return nullptr;
}

// Negative or out-of-range numbers read as unknown (0).
int prNumberField(const json& item) {
    auto it = item.find("pr_number");
    if (it == item.end() || !it->is_number_integer()) {
        return 0;
    }
    const auto maxPr = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    if (it->is_number_unsigned()) {
        std::uint64_t value = it->get<std::uint64_t>();
        return value <= maxPr ? static_cast<int>(value) : 0;
    }
    std::int64_t value = it->get<std::int64_t>();
    return value > 0 && static_cast<std::uint64_t>(value) <= maxPr ? static_cast<int>(value) : 0;
}

std::string nowIso() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void writeFileAtomically(const std::string& path, const std::string& content) {
    std::string tempPath = path + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open for writing: " + tempPath);
        }
        file << content;
        if (!file.good()) {
            throw std::runtime_error("Cannot write: " + tempPath);
        }
    }
    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::remove(tempPath.c_str());
        throw std::runtime_error("Cannot replace " + path + ": " + ec.message());
    }
}

} // namespace

// ===== Ledger =====

std::string PendingCleanupLedger::summary() const {
    std::string out;
    if (!pending_branches.empty()) {
        out += std::to_string(pending_branches.size()) + " branch(es) to prune";
    }
    if (!pending_worktrees.empty()) {
        if (!out.empty()) out += ", ";
        out += std::to_string(pending_worktrees.size()) + " worktree(s) to clean";
    }
    if (!non_compliant_branches.empty()) {
        if (!out.empty()) out += ", ";
        out += std::to_string(non_compliant_branches.size()) + " branch(es) with naming issues";
    }
    return out.empty() ? "no cleanup needed" : out;
}

json ledgerToJson(const PendingCleanupLedger& ledger) {
    json j;
    j["last_updated"] = ledger.last_updated;
    j["pending_branches"] = json::array();
    for (const auto& b : ledger.pending_branches) {
        j["pending_branches"].push_back({
            {"name", b.name},
            {"merged_at", b.merged_at},
            {"pr_number", b.pr_number}
        });
    }
    j["pending_worktrees"] = json::array();
    for (const auto& w : ledger.pending_worktrees) {
        j["pending_worktrees"].push_back({
            {"path", w.path},
            {"branch", w.branch},
            {"orphaned_since", w.orphaned_since}
        });
    }
    j["non_compliant_branches"] = ledger.non_compliant_branches;
    return j;
}

PendingCleanupLedger ledgerFromJson(const json& j) {
    PendingCleanupLedger ledger;
    if (!j.is_object()) {
        return ledger;
    }
    ledger.last_updated = stringField(j, "last_updated");

    // Older janitor versions wrote merged_branches / orphaned_worktrees,
    // sometimes as bare strings.
    if (const json* branches = arrayField(j, "pending_branches", "merged_branches")) {
        for (const auto& item : *branches) {
            PendingBranch b;
            if (item.is_string()) {
                b.name = item.get<std::string>();
            } else if (item.is_object()) {
                b.name = stringField(item, "name");
                b.merged_at = stringField(item, "merged_at");
                b.pr_number = prNumberField(item);
            }
            if (!b.name.empty()) {
                ledger.pending_branches.push_back(b);
            }
        }
    }
    if (const json* worktrees = arrayField(j, "pending_worktrees", "orphaned_worktrees")) {
        for (const auto& item : *worktrees) {
            PendingWorktree w;
            if (item.is_string()) {
                w.path = item.get<std::string>();
            } else if (item.is_object()) {
                w.path = stringField(item, "path");
                w.branch = stringField(item, "branch");
                w.orphaned_since = stringField(item, "orphaned_since");
            }
            if (!w.path.empty()) {
                ledger.pending_worktrees.push_back(w);
            }
        }
    }

    // Object of branch -> reason, or a bare list of branch names
    auto naming = j.find("non_compliant_branches");
    if (naming != j.end() && naming->is_object()) {
        for (const auto& entry : naming->items()) {
            ledger.non_compliant_branches[entry.key()] =
                entry.value().is_string() ? entry.value().get<std::string>() : "";
        }
    } else if (naming != j.end() && naming->is_array()) {
        for (const auto& item : *naming) {
            if (item.is_string() && !item.get<std::string>().empty()) {
                ledger.non_compliant_branches[item.get<std::string>()] = "";
            }
        }
    }
    return ledger;
}

std::string formatLedgerNotice(const PendingCleanupLedger& ledger) {
    if (!ledger.hasPending()) {
        return "";
    }
    std::ostringstream oss;
    oss << "Repository cleanup pending (snapshot";
    if (!ledger.last_updated.empty()) {
        oss << " from " << ledger.last_updated;
    }
    oss << "):";
    if (!ledger.pending_branches.empty()) {
        oss << "\n  - " << ledger.pending_branches.size() << " merged branch(es) to prune";
    }
    if (!ledger.pending_worktrees.empty()) {
        oss << "\n  - " << ledger.pending_worktrees.size() << " orphaned worktree(s)";
    }
    if (!ledger.non_compliant_branches.empty()) {
        oss << "\n  - " << ledger.non_compliant_branches.size() << " branch(es) with naming issues";
    }
    oss << "\nRun the janitor's prune step to clean up.";
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& value) {
    if (value.size() < 19) {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream ss(value.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    std::string rest = value.substr(19);
    if (!rest.empty() && rest[0] == '.') {
        size_t i = 1;
        while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) {
            ++i;
        }
        rest = rest.substr(i);
    }

    long offsetSeconds = 0;
    if (rest == "Z" || rest.empty()) {
        offsetSeconds = 0;
    } else if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') && rest[3] == ':') {
        int hours = std::atoi(rest.substr(1, 2).c_str());
        int minutes = std::atoi(rest.substr(4, 2).c_str());
        offsetSeconds = (hours * 3600L + minutes * 60L) * (rest[0] == '-' ? -1 : 1);
    } else {
        return std::nullopt;
    }

    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t - offsetSeconds);
}

// ===== StateStore =====

StateStore::StateStore(const std::string& stateDir)
    : stateDir_(stateDir),
      auditLogger_(GetStateFilePath(stateDir, kAuditLogFile)) {
}

std::string StateStore::auditLogPath() const {
    return GetStateFilePath(stateDir_, kAuditLogFile);
}

std::string StateStore::lastRunPath() const {
    return GetStateFilePath(stateDir_, kLastRunFile);
}

std::string StateStore::ledgerPath() const {
    return GetStateFilePath(stateDir_, kLedgerFile);
}

std::vector<std::string> StateStore::initialize() {
    std::vector<std::string> created;
    if (!EnsureDir(stateDir_)) {
        throw std::runtime_error("Cannot create state directory: " + stateDir_);
    }

    if (!fs::exists(lastRunPath())) {
        writeFileAtomically(lastRunPath(), nowIso() + "\n");
        created.push_back(lastRunPath());
    }
    if (!fs::exists(ledgerPath())) {
        PendingCleanupLedger empty;
        empty.last_updated = nowIso();
        writeFileAtomically(ledgerPath(), ledgerToJson(empty).dump(2) + "\n");
        created.push_back(ledgerPath());
    }
    if (!fs::exists(auditLogPath())) {
        std::ofstream touch(auditLogPath(), std::ios::app);
        if (!touch.is_open()) {
            throw std::runtime_error("Cannot create audit log: " + auditLogPath());
        }
        created.push_back(auditLogPath());
    }
    return created;
}

bool StateStore::appendAudit(const std::string& eventType, const std::string& detail) {
    if (auditLogger_.append(eventType, detail)) {
        return true;
    }
    LogLine("Warning: audit entry not recorded (" + eventType + "): " + detail);
    return false;
}

std::vector<AuditEntry> StateStore::readAudit() const {
    return auditLogger_.readEntries();
}

std::map<std::string, int> StateStore::auditStats() const {
    return auditLogger_.getStats();
}

std::optional<std::chrono::system_clock::time_point> StateStore::readLastRun() const {
    std::ifstream in(lastRunPath());
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string content;
    std::getline(in, content);
    while (!content.empty() && std::isspace(static_cast<unsigned char>(content.back()))) {
        content.pop_back();
    }
    return parseIsoTimestamp(content);
}

void StateStore::writeLastRun(const std::string& isoTimestamp) {
    if (!parseIsoTimestamp(isoTimestamp)) {
        throw std::runtime_error("Not an ISO 8601 timestamp: " + isoTimestamp);
    }
    if (!EnsureDir(stateDir_)) {
        throw std::runtime_error("Cannot create state directory: " + stateDir_);
    }
    writeFileAtomically(lastRunPath(), isoTimestamp + "\n");
}

std::optional<double> StateStore::hoursSinceLastRun() const {
    auto lastRun = readLastRun();
    if (!lastRun) {
        return std::nullopt;
    }
    auto elapsed = std::chrono::system_clock::now() - *lastRun;
    return std::chrono::duration<double>(elapsed).count() / 3600.0;
}

PendingCleanupLedger StateStore::readLedger() const {
    std::ifstream file(ledgerPath());
    if (!file.is_open()) {
        return PendingCleanupLedger();
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        LogLine("Ignoring unreadable cleanup ledger: " + ledgerPath());
        return PendingCleanupLedger();
    }
    return ledgerFromJson(j);
}

void StateStore::writeLedger(const PendingCleanupLedger& ledger) {
    if (!EnsureDir(stateDir_)) {
        throw std::runtime_error("Cannot create state directory: " + stateDir_);
    }
    writeFileAtomically(ledgerPath(), ledgerToJson(ledger).dump(2) + "\n");
}

} // namespace pushgate
