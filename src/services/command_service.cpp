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
#include "services/command_service.h"
#include "support/errors.h"
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pushgate {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Append what is readable; false once the writer side is closed.
bool drainFd(int fd, std::string& sink, size_t cap) {
    char buffer[4096];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        size_t room = sink.size() < cap ? cap - sink.size() : 0;
        sink.append(buffer, std::min(static_cast<size_t>(n), room));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// SIGTERM the whole group, then SIGKILL if it is still there after a grace period.
int terminateGroup(pid_t pid) {
    int status = 0;
    ::killpg(pid, SIGTERM);
    for (int i = 0; i < 20; ++i) {
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ::killpg(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
    return status;
}

} // namespace

CommandService::CommandService(size_t maxOutputBytes)
    : maxOutputBytes_(maxOutputBytes) {
}

CommandResult CommandService::executeCommand(const CommandRequest& request) {
    if (request.argv.empty()) {
        throw ToolingError("Empty argument vector");
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0) {
        throw ToolingError("Failed to create stdout pipe: " + std::string(std::strerror(errno)));
    }
    if (!request.mergeStderr && ::pipe(errPipe) != 0) {
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw ToolingError("Failed to create stderr pipe: " + std::string(std::strerror(errno)));
    }

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        throw ToolingError("Failed to create process: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(request.mergeStderr ? outPipe[1] : errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        if (!request.mergeStderr) {
            ::close(errPipe[0]);
            ::close(errPipe[1]);
        }
        if (!request.workingDir.empty() && ::chdir(request.workingDir.c_str()) != 0) {
            ::_exit(126);
        }
        ::setenv(kNestedEnvVar, "1", 1);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    std::string outText;
    std::string errText;
    bool timedOut = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(request.timeoutMs);

    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        struct pollfd fds[2];
        int count = 0;
        if (outPipe[0] >= 0) {
            fds[count++] = {outPipe[0], POLLIN, 0};
        }
        if (errPipe[0] >= 0) {
            fds[count++] = {errPipe[0], POLLIN, 0};
        }

        int waitMs = 200;
        if (request.timeoutMs > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                timedOut = true;
                break;
            }
            waitMs = static_cast<int>(std::min<long long>(remaining, 200));
        }

        int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            bool isOut = fds[i].fd == outPipe[0];
            std::string& sink = isOut ? outText : errText;
            if (!drainFd(fds[i].fd, sink, maxOutputBytes_)) {
                closeFd(isOut ? outPipe[0] : errPipe[0]);
            }
        }
    }

    int status = 0;
    if (timedOut) {
        status = terminateGroup(pid);
    } else {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    CommandResult result{};
    result.stdoutText = sanitizeOutput(outText, maxOutputBytes_);
    result.stderrText = sanitizeOutput(errText, maxOutputBytes_);
    result.exitCode = timedOut ? -1 : decodeStatus(status);
    result.timedOut = timedOut;
    return result;
}

CommandExecutor CommandService::executor() {
    return [this](const CommandRequest& request) {
        return executeCommand(request);
    };
}

CommandRequest CommandService::requestFor(const CommandSpec& spec,
                                          const std::string& workingDir,
                                          int timeoutMs) {
    CommandRequest request;
    if (const auto* tool = std::get_if<KnownTool>(&spec)) {
        request.argv.push_back(tool->name);
        request.argv.insert(request.argv.end(), tool->args.begin(), tool->args.end());
    } else {
        request.argv = {"/bin/sh", "-c", std::get<RawShellCommand>(spec).command};
    }
    request.workingDir = workingDir;
    request.timeoutMs = timeoutMs;
    request.mergeStderr = true;
    return request;
}

std::string CommandService::sanitizeOutput(const std::string& output, size_t maxLength) {
    if (output.size() <= maxLength) {
        return output;
    }
    return output.substr(0, maxLength);
}

} // namespace pushgate
