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
#ifndef PUSHGATE_AUDIT_LOGGER_H
#define PUSHGATE_AUDIT_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <map>
#include <vector>

namespace pushgate {

// Audit log entry structure
struct AuditEntry {
    std::string timestamp;      // UTC ISO 8601 timestamp
    std::string event_type;     // "bypass", "allow", "deny", "disabled", "nested"
    std::string detail;         // Free text, single line
};

// Format one entry as a log line (without trailing newline):
//   2026-10-18T12:03:01.234Z - bypass: branch=feature/x
std::string formatAuditLine(const AuditEntry& entry);

// Parse a log line back into an entry. Returns false for malformed lines.
bool parseAuditLine(const std::string& line, AuditEntry& entry);

// AuditLogger - append-only, line-oriented audit log.
//
// Each entry is written as one complete line in a single write and flushed
// immediately; the file is opened in append mode so concurrent writers from
// other processes interleave as whole lines.
class AuditLogger {
public:
    // Constructor: initialize logger with log file path
    explicit AuditLogger(const std::string& logPath);

    // Destructor: ensure file is closed
    ~AuditLogger();

    // Append an entry stamped with the current time.
    // Returns false if the line could not be written.
    bool append(const std::string& eventType, const std::string& detail);

    // Append a pre-built entry (timestamp filled in when empty)
    bool appendEntry(const AuditEntry& entry);

    // Read back every well-formed entry
    std::vector<AuditEntry> readEntries() const;

    // Count entries per event type
    std::map<std::string, int> getStats() const;

    // Current UTC timestamp in ISO 8601 format, never earlier than the
    // last one this logger handed out
    std::string getCurrentTimestamp();

    const std::string& path() const { return logPath_; }

private:
    // Next non-decreasing timestamp; caller holds logMutex_
    std::string nextTimestampLocked();

    // Write a single log line
    bool writeLogLine(const std::string& line);

    // Ensure log directory exists
    bool ensureLogDirectory();

    std::string logPath_;           // Log file path
    std::mutex logMutex_;           // Mutex for thread-safe logging
    std::ofstream logFile_;         // Output file stream
    std::string lastTimestamp_;     // Last timestamp handed out
};

} // namespace pushgate

#endif // PUSHGATE_AUDIT_LOGGER_H
