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
#ifndef PUSHGATE_UTILS_LOG_PATH_H
#define PUSHGATE_UTILS_LOG_PATH_H

#include <string>

namespace pushgate {

// Resolve a path relative to the repository root. Absolute paths are
// returned unchanged.
// e.g. ResolveRepoPath("/work/app", ".specify/state") -> "/work/app/.specify/state"
std::string ResolveRepoPath(const std::string& repoRoot, const std::string& path);

// Full path of a file inside the state directory.
std::string GetStateFilePath(const std::string& stateDir, const char* filename);

// Create the directory (and parents). Returns false if it cannot be created.
bool EnsureDir(const std::string& dir);

// Mirror diagnostics into a file in addition to stderr. Empty path disables.
void SetLogFile(const std::string& path);

// Write a timestamped diagnostic line to stderr (stdout is reserved for the
// decision document).
void LogLine(const std::string& line);

} // namespace pushgate

#endif // PUSHGATE_UTILS_LOG_PATH_H
