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
#include "support/audit_logger.h"
#include <iostream>
#include <cassert>
#include <thread>
#include <filesystem>
#include <fstream>
#include <set>
#include <vector>

namespace fs = std::filesystem;
using namespace pushgate;

// Test helper: read all lines from a file
std::vector<std::string> readAllLines(const std::string& filepath) {
    std::vector<std::string> lines;
    std::ifstream file(filepath);
    std::string line;

    while (std::getline(file, line)) {
        lines.push_back(line);
    }

    return lines;
}

// Test 1: Basic logging functionality
void testBasicLogging() {
    std::cout << "Test 1: Basic logging functionality..." << std::endl;

    if (fs::exists("test_logs")) {
        fs::remove_all("test_logs");
    }

    // Directory is created on first write
    AuditLogger logger("test_logs/state/audit.log");
    assert(logger.append("bypass", "branch=feature/login flag=--skip-push-rules"));

    assert(fs::exists("test_logs/state/audit.log"));
    auto lines = readAllLines("test_logs/state/audit.log");
    assert(lines.size() == 1);
    assert(lines[0].find(" - bypass: branch=feature/login flag=--skip-push-rules") != std::string::npos);
    assert(lines[0].size() > 24 && lines[0][10] == 'T' && lines[0][23] == 'Z');

    std::cout << "✓ Basic logging test passed" << std::endl;

    fs::remove_all("test_logs");
}

// Test 2: Format and parse
void testFormatAndParse() {
    std::cout << "Test 2: Format and parse..." << std::endl;

    AuditEntry entry;
    entry.timestamp = "2026-10-18T12:03:01.234Z";
    entry.event_type = "deny";
    entry.detail = "branch=x\nreason=Lint failed";

    std::string line = formatAuditLine(entry);
    assert(line == "2026-10-18T12:03:01.234Z - deny: branch=x reason=Lint failed");

    AuditEntry parsed;
    assert(parseAuditLine(line, parsed));
    assert(parsed.timestamp == entry.timestamp);
    assert(parsed.event_type == "deny");
    assert(parsed.detail == "branch=x reason=Lint failed");

    AuditEntry bare;
    bare.timestamp = "2026-10-18T12:03:01.234Z";
    bare.event_type = "nested";
    assert(formatAuditLine(bare) == "2026-10-18T12:03:01.234Z - nested");
    assert(parseAuditLine(formatAuditLine(bare), parsed));
    assert(parsed.event_type == "nested" && parsed.detail.empty());

    assert(!parseAuditLine("garbage without separator", parsed));
    assert(!parseAuditLine("", parsed));

    std::cout << "✓ Format and parse test passed" << std::endl;
}

// Test 3: Thread safety
void testThreadSafety() {
    std::cout << "Test 3: Thread safety..." << std::endl;

    if (fs::exists("test_logs")) {
        fs::remove_all("test_logs");
    }

    AuditLogger logger("test_logs/audit.log");

    const int numThreads = 10;
    const int entriesPerThread = 20;
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < entriesPerThread; i++) {
                logger.append("allow", "thread_" + std::to_string(t) + "_entry_" + std::to_string(i));
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    // Every line complete and parseable, none lost, and file order is
    // timestamp order
    auto lines = readAllLines("test_logs/audit.log");
    assert(lines.size() == numThreads * entriesPerThread);
    std::set<std::string> details;
    std::string previous;
    for (const auto& line : lines) {
        AuditEntry entry;
        assert(parseAuditLine(line, entry));
        assert(entry.event_type == "allow");
        assert(previous <= entry.timestamp);
        previous = entry.timestamp;
        details.insert(entry.detail);
    }
    assert(details.size() == numThreads * entriesPerThread);

    std::cout << "✓ Thread safety test passed" << std::endl;

    fs::remove_all("test_logs");
}

// Test 4: Timestamps never go backwards
void testMonotonicTimestamps() {
    std::cout << "Test 4: Monotonic timestamps..." << std::endl;

    AuditLogger logger("test_logs/audit.log");
    std::string previous;
    for (int i = 0; i < 200; i++) {
        std::string stamp = logger.getCurrentTimestamp();
        assert(stamp.size() == 24);
        assert(previous <= stamp);
        previous = stamp;
    }

    std::cout << "✓ Monotonic timestamps test passed" << std::endl;
}

// Test 5: Read back and stats
void testReadAndStats() {
    std::cout << "Test 5: Read back and stats..." << std::endl;

    if (fs::exists("test_logs")) {
        fs::remove_all("test_logs");
    }

    AuditLogger logger("test_logs/audit.log");
    logger.append("allow", "branch=a");
    logger.append("deny", "branch=b");
    logger.append("allow", "branch=c");
    logger.append("bypass", "branch=d");

    // Foreign junk line is skipped on read
    {
        std::ofstream out("test_logs/audit.log", std::ios::app);
        out << "not an audit line\n";
    }

    auto entries = logger.readEntries();
    assert(entries.size() == 4);
    assert(entries[0].detail == "branch=a");
    assert(entries[3].event_type == "bypass");

    auto stats = logger.getStats();
    assert(stats["allow"] == 2);
    assert(stats["deny"] == 1);
    assert(stats["bypass"] == 1);
    assert(stats.count("nested") == 0);

    std::cout << "✓ Read back and stats test passed" << std::endl;

    fs::remove_all("test_logs");
}

// Test 6: Unwritable location reports failure
void testWriteFailure() {
    std::cout << "Test 6: Write failure..." << std::endl;

    if (fs::exists("test_logs")) {
        fs::remove_all("test_logs");
    }
    fs::create_directories("test_logs");
    {
        // A regular file where the parent directory should be
        std::ofstream blocker("test_logs/blocked");
        blocker << "x";
    }

    AuditLogger logger("test_logs/blocked/audit.log");
    assert(!logger.append("allow", "branch=a"));

    std::cout << "✓ Write failure test passed" << std::endl;

    fs::remove_all("test_logs");
}

int main() {
    std::cout << "=== AuditLogger Unit Tests ===" << std::endl << std::endl;

    testBasicLogging();
    testFormatAndParse();
    testThreadSafety();
    testMonotonicTimestamps();
    testReadAndStats();
    testWriteFailure();

    std::cout << std::endl << "=== All tests passed! ===" << std::endl;
    return 0;
}
