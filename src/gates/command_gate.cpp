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
#include "gates/command_gate.h"
#include "support/errors.h"
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <utility>

namespace pushgate {

namespace {

std::string matchTestSummary(const std::string& output) {
    std::smatch match;

    static const std::regex kCtest(R"((\d+)% tests passed, (\d+) tests? failed out of (\d+))");
    if (std::regex_search(output, match, kCtest)) {
        int total = std::stoi(match[3].str());
        int failed = std::stoi(match[2].str());
        return std::to_string(total - failed) + " of " + std::to_string(total) + " tests passed";
    }

    static const std::regex kGtest(R"(\[  PASSED  \] (\d+) tests?)");
    if (std::regex_search(output, match, kGtest)) {
        return match[1].str() + " tests passed";
    }

    // cargo prints one result line per test binary
    static const std::regex kCargo(R"(test result: ok\. (\d+) passed;)");
    int cargoPassed = 0;
    bool cargoSeen = false;
    for (auto it = std::sregex_iterator(output.begin(), output.end(), kCargo);
         it != std::sregex_iterator(); ++it) {
        cargoPassed += std::stoi((*it)[1].str());
        cargoSeen = true;
    }
    if (cargoSeen) {
        return std::to_string(cargoPassed) + " tests passed";
    }

    static const std::regex kJest(R"(Tests:[^\n]*?(\d+) passed, (\d+) total)");
    if (std::regex_search(output, match, kJest)) {
        return match[1].str() + " of " + match[2].str() + " tests passed";
    }

    static const std::regex kPytest(R"((\d+) passed)");
    if (std::regex_search(output, match, kPytest)) {
        return match[1].str() + " tests passed";
    }
    return "";
}

// The policy timeout, capped by the host budget when the host sets one.
int effectiveTimeoutSeconds(const ValidationCommand& command, const ExecutionContext& context) {
    if (command.timeout_seconds <= 0) {
        return context.command_timeout_seconds;
    }
    if (context.command_timeout_seconds <= 0) {
        return command.timeout_seconds;
    }
    return std::min(command.timeout_seconds, context.command_timeout_seconds);
}

} // namespace

std::string summarizeTestOutput(const std::string& output) {
    try {
        return matchTestSummary(output);
    } catch (const std::out_of_range&) {
        return "";
    }
}

CommandGate::CommandGate(Kind kind, const CommandSanitizer& sanitizer, CommandExecutor executor)
    : kind_(kind), sanitizer_(sanitizer), executor_(std::move(executor)) {
}

const char* CommandGate::name() const {
    return kind_ == Kind::Lint ? "lint" : "test";
}

const char* CommandGate::label() const {
    return kind_ == Kind::Lint ? "Lint" : "Tests";
}

GateResult CommandGate::run(const ValidationCommand& command, const ExecutionContext& context) {
    if (!command.required) {
        return makeGateResult(name(), GateStatus::Skipped,
                              std::string(label()) + " not required by policy", false);
    }

    CommandSpec spec = sanitizer_.classify(command.command);
    std::string shown = describeCommand(spec);
    int timeoutSeconds = effectiveTimeoutSeconds(command, context);
    CommandRequest request = CommandService::requestFor(spec, context.repo_root, timeoutSeconds * 1000);
    CommandResult result = executor_(request);

    if (result.timedOut) {
        throw ToolingError(std::string(label()) + " command timed out after " +
                           std::to_string(timeoutSeconds) + "s: " + shown);
    }
    if (result.exitCode == 126 || result.exitCode == 127) {
        throw ToolingError(std::string(label()) + " command could not be run (exit " +
                           std::to_string(result.exitCode) + "): " + shown);
    }

    std::string output = result.stdoutText + result.stderrText;
    if (result.exitCode != 0) {
        GateResult failed = makeGateResult(name(), GateStatus::Fail,
            std::string(label()) + " failed (exit " + std::to_string(result.exitCode) + "): " + shown,
            true);
        failed.output = output;
        return failed;
    }

    std::string message = std::string(label()) + " passed: " + shown;
    if (kind_ == Kind::Test) {
        std::string summary = summarizeTestOutput(output);
        if (!summary.empty()) {
            message += " (" + summary + ")";
        }
    }
    GateResult passed = makeGateResult(name(), GateStatus::Pass, message, true);
    passed.output = output;
    return passed;
}

} // namespace pushgate
