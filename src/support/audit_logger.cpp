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
#include "support/audit_logger.h"
#include "utils/log_path.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace pushgate {

namespace {

const char* const kSeparator = " - ";

// One entry per line: newlines inside the detail are flattened.
std::string flatten(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\r') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace

std::string formatAuditLine(const AuditEntry& entry) {
    std::string line = entry.timestamp + kSeparator + flatten(entry.event_type);
    if (!entry.detail.empty()) {
        line += ": " + flatten(entry.detail);
    }
    return line;
}

bool parseAuditLine(const std::string& line, AuditEntry& entry) {
    size_t sep = line.find(kSeparator);
    if (sep == std::string::npos || sep == 0) {
        return false;
    }
    entry.timestamp = line.substr(0, sep);
    std::string message = line.substr(sep + 3);
    size_t colon = message.find(": ");
    if (colon == std::string::npos) {
        entry.event_type = message;
        entry.detail.clear();
    } else {
        entry.event_type = message.substr(0, colon);
        entry.detail = message.substr(colon + 2);
    }
    return !entry.event_type.empty();
}

// Constructor
AuditLogger::AuditLogger(const std::string& logPath)
    : logPath_(logPath) {
}

// Destructor
AuditLogger::~AuditLogger() {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

bool AuditLogger::append(const std::string& eventType, const std::string& detail) {
    AuditEntry entry;
    entry.event_type = eventType;
    entry.detail = detail;
    return appendEntry(entry);
}

bool AuditLogger::appendEntry(const AuditEntry& entry) {
    AuditEntry stamped = entry;

    // Stamp and write under one lock so file order matches timestamp order
    std::lock_guard<std::mutex> lock(logMutex_);
    if (stamped.timestamp.empty()) {
        stamped.timestamp = nextTimestampLocked();
    }
    return writeLogLine(formatAuditLine(stamped) + "\n");
}

std::vector<AuditEntry> AuditLogger::readEntries() const {
    std::vector<AuditEntry> entries;
    std::ifstream in(logPath_);
    std::string line;
    while (std::getline(in, line)) {
        AuditEntry entry;
        if (parseAuditLine(line, entry)) {
            entries.push_back(entry);
        }
    }
    return entries;
}

std::map<std::string, int> AuditLogger::getStats() const {
    std::map<std::string, int> stats;
    for (const auto& entry : readEntries()) {
        stats[entry.event_type]++;
    }
    return stats;
}

// Get current UTC timestamp in ISO 8601 format
std::string AuditLogger::getCurrentTimestamp() {
    std::lock_guard<std::mutex> lock(logMutex_);
    return nextTimestampLocked();
}

// Caller holds logMutex_.
std::string AuditLogger::nextTimestampLocked() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_utc;
    gmtime_r(&time_t_now, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    // Fixed-width format: lexical order is chronological order
    std::string stamp = oss.str();
    if (stamp < lastTimestamp_) {
        stamp = lastTimestamp_;
    }
    lastTimestamp_ = stamp;
    return stamp;
}

// Write a single log line. Caller holds logMutex_.
bool AuditLogger::writeLogLine(const std::string& line) {
    if (!logFile_.is_open()) {
        if (!ensureLogDirectory()) {
            return false;
        }
        logFile_.open(logPath_, std::ios::out | std::ios::app);
        if (!logFile_.is_open()) {
            LogLine("Failed to open audit log: " + logPath_);
            return false;
        }
    }

    logFile_.write(line.data(), static_cast<std::streamsize>(line.size()));
    logFile_.flush();  // Ensure immediate write
    if (!logFile_.good()) {
        LogLine("Failed to write audit log: " + logPath_);
        logFile_.close();
        return false;
    }
    return true;
}

// Ensure log directory exists
bool AuditLogger::ensureLogDirectory() {
    fs::path logDir = fs::path(logPath_).parent_path();
    if (logDir.empty()) {
        return true;
    }
    if (!EnsureDir(logDir.string())) {
        LogLine("Failed to create audit log directory: " + logDir.string());
        return false;
    }
    return true;
}

} // namespace pushgate
