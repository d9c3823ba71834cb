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
 * CommandService 单元测试
 */
#ifdef NDEBUG
#undef NDEBUG
#endif
#include "services/command_service.h"
#include "policy/command_sanitizer.h"
#include "support/errors.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using namespace pushgate;

static CommandRequest shell(const std::string& script) {
    CommandRequest request;
    request.argv = {"/bin/sh", "-c", script};
    return request;
}

int main() {
    std::cout << "\n[CommandService] 开始测试..." << std::endl;

    CommandService service;

    auto result = service.executeCommand({{"echo", "hello"}, "", 0, false});
    assert(result.exitCode == 0);
    assert(!result.timedOut);
    assert(result.stdoutText == "hello\n");
    assert(result.stderrText.empty());
    std::cout << "  ✓ executeCommand" << std::endl;

    result = service.executeCommand(shell("echo out; echo err 1>&2; exit 3"));
    assert(result.exitCode == 3);
    assert(result.stdoutText == "out\n");
    assert(result.stderrText == "err\n");

    CommandRequest merged = shell("echo out; echo err 1>&2");
    merged.mergeStderr = true;
    result = service.executeCommand(merged);
    assert(result.exitCode == 0);
    assert(result.stdoutText == "out\nerr\n");
    assert(result.stderrText.empty());
    std::cout << "  ✓ exit codes and stderr" << std::endl;

    result = service.executeCommand({{"pushgate-no-such-binary-xyz"}, "", 0, false});
    assert(result.exitCode == 127);

    result = service.executeCommand(shell("kill -TERM $$"));
    assert(result.exitCode == 128 + 15);

    bool threw = false;
    try {
        service.executeCommand(CommandRequest{});
    } catch (const ToolingError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  ✓ missing binary, signal, empty argv" << std::endl;

    // Timeout kills the whole process group
    auto start = std::chrono::steady_clock::now();
    CommandRequest slow = shell("sleep 5; echo finished");
    slow.timeoutMs = 200;
    result = service.executeCommand(slow);
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(result.timedOut);
    assert(result.exitCode == -1);
    assert(result.stdoutText.find("finished") == std::string::npos);
    assert(elapsed < std::chrono::seconds(4));
    std::cout << "  ✓ timeout" << std::endl;

    CommandService small(16);
    result = small.executeCommand(shell("i=0; while [ $i -lt 200 ]; do echo line$i; i=$((i+1)); done"));
    assert(result.exitCode == 0);
    assert(result.stdoutText.size() == 16);
    assert(result.stdoutText.compare(0, 6, "line0\n") == 0);
    std::cout << "  ✓ output cap" << std::endl;

    const std::string dir = "test_command_service_dir";
    fs::remove_all(dir);
    fs::create_directories(dir);
    CommandRequest inDir = shell("pwd");
    inDir.workingDir = dir;
    result = service.executeCommand(inDir);
    assert(result.exitCode == 0);
    assert(result.stdoutText.find(dir) != std::string::npos);

    inDir.workingDir = dir + "/missing";
    result = service.executeCommand(inDir);
    assert(result.exitCode == 126);
    fs::remove_all(dir);
    std::cout << "  ✓ working directory" << std::endl;

    result = service.executeCommand(shell(std::string("echo $") + kNestedEnvVar));
    assert(result.stdoutText == "1\n");
    std::cout << "  ✓ nested marker exported" << std::endl;

    // Request construction from a classified command
    CommandSanitizer sanitizer;
    CommandRequest direct = CommandService::requestFor(sanitizer.classify("pytest -q tests/"), "/repo", 5000);
    assert(direct.argv.size() == 3);
    assert(direct.argv[0] == "pytest" && direct.argv[2] == "tests/");
    assert(direct.workingDir == "/repo");
    assert(direct.timeoutMs == 5000);
    assert(direct.mergeStderr);

    CommandRequest viaShell = CommandService::requestFor(sanitizer.classify("make lint && make test"), "", 0);
    assert(viaShell.argv.size() == 3);
    assert(viaShell.argv[0] == "/bin/sh" && viaShell.argv[1] == "-c");
    assert(viaShell.argv[2] == "make lint && make test");

    result = service.executeCommand(CommandService::requestFor(sanitizer.classify("echo a && echo b"), "", 0));
    assert(result.stdoutText == "a\nb\n");
    std::cout << "  ✓ requestFor" << std::endl;

    auto exec = service.executor();
    assert(exec({{"true"}, "", 0, false}).exitCode == 0);
    assert(exec({{"false"}, "", 0, false}).exitCode == 1);
    std::cout << "  ✓ executor" << std::endl;

    std::cout << "[通过] CommandService 测试" << std::endl;
    return 0;
}
