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
#include "services/git_service.h"
#include "support/errors.h"
#include <sstream>
#include <utility>

namespace pushgate {

namespace {

const int kGitTimeoutMs = 30000;
const char kFieldSep = '\x1f';

std::string trimTrailing(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
        value.pop_back();
    }
    return value;
}

std::string firstLine(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    return trimTrailing(line);
}

} // namespace

bool MergeCommit::fromLogLine(const std::string& line, MergeCommit& commit) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, kFieldSep)) {
        fields.push_back(field);
    }
    if (fields.size() < 4 || fields[0].empty()) {
        return false;
    }
    commit.sha = fields[0];
    commit.shortSha = fields[1];
    commit.subject = fields[2];
    commit.parents.clear();
    std::istringstream parents(fields[3]);
    std::string parent;
    while (parents >> parent) {
        commit.parents.push_back(parent);
    }
    return true;
}

GitService::GitService(CommandExecutor executor, const std::string& repoRoot)
    : executor_(std::move(executor)), repoRoot_(repoRoot) {
}

CommandResult GitService::git(const std::vector<std::string>& args) {
    CommandRequest request;
    request.argv.push_back("git");
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.workingDir = repoRoot_;
    request.timeoutMs = kGitTimeoutMs;

    CommandResult result = executor_(request);
    if (result.timedOut) {
        throw ToolingError("git " + args.front() + " timed out");
    }
    if (result.exitCode == 127) {
        throw ToolingError("git executable not found");
    }
    if (result.stderrText.find("not a git repository") != std::string::npos) {
        throw ToolingError("Not a git repository: " + repoRoot_);
    }
    return result;
}

std::string GitService::gitOutput(const std::vector<std::string>& args) {
    CommandResult result = git(args);
    if (result.exitCode != 0) {
        std::string detail = firstLine(result.stderrText);
        throw ToolingError("git " + args.front() + " failed (exit " +
                           std::to_string(result.exitCode) + ")" +
                           (detail.empty() ? "" : ": " + detail));
    }
    return result.stdoutText;
}

std::string GitService::currentBranch() {
    CommandResult result = git({"symbolic-ref", "--quiet", "--short", "HEAD"});
    if (result.exitCode == 1) {
        return "";
    }
    if (result.exitCode != 0) {
        throw ToolingError("Cannot determine current branch: " + firstLine(result.stderrText));
    }
    return trimTrailing(result.stdoutText);
}

bool GitService::refExists(const std::string& ref) {
    CommandResult result = git({"rev-parse", "--verify", "--quiet", ref + "^{commit}"});
    return result.exitCode == 0;
}

std::string GitService::resolveBaseRef(const std::string& base) {
    if (refExists(base)) {
        return base;
    }
    std::string remote = "origin/" + base;
    if (refExists(remote)) {
        return remote;
    }
    throw ToolingError("Base branch '" + base + "' not found locally or on origin");
}

std::string GitService::mergeBase(const std::string& a, const std::string& b) {
    std::string sha = trimTrailing(gitOutput({"merge-base", a, b}));
    if (sha.empty()) {
        throw ToolingError("No merge-base between " + a + " and " + b);
    }
    return sha;
}

std::vector<MergeCommit> GitService::findMergeCommits(const std::string& base,
                                                      const std::string& head) {
    std::string output = gitOutput({"log", "--merges", "--format=%H%x1f%h%x1f%s%x1f%P",
                                    base + ".." + head});
    std::vector<MergeCommit> commits;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        MergeCommit commit;
        if (MergeCommit::fromLogLine(trimTrailing(line), commit)) {
            commits.push_back(commit);
        }
    }
    return commits;
}

int GitService::countCommitsAhead(const std::string& base, const std::string& head) {
    std::string output = trimTrailing(gitOutput({"rev-list", "--count", base + ".." + head}));
    try {
        return std::stoi(output);
    } catch (const std::exception&) {
        throw ToolingError("Unexpected rev-list output: " + output);
    }
}

} // namespace pushgate
