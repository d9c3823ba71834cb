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
#ifndef PUSHGATE_GIT_SERVICE_H
#define PUSHGATE_GIT_SERVICE_H

#include <string>
#include <vector>
#include "services/command_service.h"

namespace pushgate {

struct MergeCommit {
    std::string sha;
    std::string shortSha;
    std::string subject;
    std::vector<std::string> parents;

    // Parses one line of `git log --format=%H%x1f%h%x1f%s%x1f%P`
    static bool fromLogLine(const std::string& line, MergeCommit& commit);
};

/**
 * GitService - read-only repository queries
 *
 * Every failure (git missing, not a repository, unknown ref) is reported as
 * ToolingError.
 */
class GitService {
public:
    GitService(CommandExecutor executor, const std::string& repoRoot);

    // Empty string on detached HEAD
    std::string currentBranch();

    bool refExists(const std::string& ref);

    // `base` if it resolves locally, else `origin/<base>`
    // @throws ToolingError if neither exists
    std::string resolveBaseRef(const std::string& base);

    std::string mergeBase(const std::string& a, const std::string& b);

    // Merge commits reachable from `head` but not from `base`, newest first
    std::vector<MergeCommit> findMergeCommits(const std::string& base, const std::string& head);

    int countCommitsAhead(const std::string& base, const std::string& head);

private:
    CommandResult git(const std::vector<std::string>& args);
    std::string gitOutput(const std::vector<std::string>& args);

    CommandExecutor executor_;
    std::string repoRoot_;
};

} // namespace pushgate

#endif // PUSHGATE_GIT_SERVICE_H
