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
#ifndef PUSHGATE_ERRORS_H
#define PUSHGATE_ERRORS_H

#include <stdexcept>
#include <string>

namespace pushgate {

// Policy document problems. Always resolved as deny with setup instructions.
class PolicyError : public std::runtime_error {
public:
    PolicyError(const std::string& path, const std::string& message)
        : std::runtime_error(message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class MissingPolicyError : public PolicyError {
public:
    explicit MissingPolicyError(const std::string& path)
        : PolicyError(path, "Push rules policy not found at: " + path) {}
};

class MalformedPolicyError : public PolicyError {
public:
    MalformedPolicyError(const std::string& path, const std::string& detail)
        : PolicyError(path, "Malformed push rules policy " + path + ": " + detail) {}
};

// Raised by the command sanitizer; the command is never executed.
class UnsafeCommandError : public std::runtime_error {
public:
    UnsafeCommandError(const std::string& command, const std::string& category)
        : std::runtime_error("Unsafe command rejected (" + category + "): " + command),
          command_(command), category_(category) {}

    const std::string& command() const { return command_; }
    const std::string& category() const { return category_; }

private:
    std::string command_;
    std::string category_;
};

// Infrastructure failure unrelated to the policy itself (missing tool,
// spawn failure, git error, timeout). Downgrades the owning gate to warn.
class ToolingError : public std::runtime_error {
public:
    explicit ToolingError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace pushgate

#endif // PUSHGATE_ERRORS_H
