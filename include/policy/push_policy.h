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
#ifndef PUSHGATE_PUSH_POLICY_H
#define PUSHGATE_PUSH_POLICY_H

#include <string>
#include <nlohmann/json.hpp>

namespace pushgate {

constexpr const char* kDefaultBypassFlag = "--skip-push-rules";
constexpr const char* kDefaultBaseBranch = "main";
constexpr int kDefaultCommandTimeoutSeconds = 300;
constexpr int kMaxCommandTimeoutSeconds = 3600;

// strict fails on merge commits, warn reports them, disabled skips the check
enum class RebaseEnforcement {
    Strict,
    Warn,
    Disabled
};

const char* rebaseEnforcementName(RebaseEnforcement enforcement);

struct ValidationCommand {
    bool required = false;
    std::string command;
    int timeout_seconds = kDefaultCommandTimeoutSeconds;
};

/**
 * PushPolicy - 推送规则
 *
 * Typed form of push-rules.md. Reloaded on every run.
 */
struct PushPolicy {
    std::string version;
    bool enabled = true;
    std::string base_branch = kDefaultBaseBranch;
    bool rebase_required = true;
    RebaseEnforcement rebase_enforcement = RebaseEnforcement::Strict;
    bool allow_merge_commits = false;
    ValidationCommand lint;
    ValidationCommand test;
    std::string bypass_flag = kDefaultBypassFlag;
    bool enforce_branch_naming = false;
    std::string branch_naming_pattern;
};

/**
 * Load a policy document. `.json` files use the JSON form, anything else the
 * markdown form.
 * @throws MissingPolicyError if the file does not exist
 * @throws MalformedPolicyError if it cannot be parsed or fails validation
 */
PushPolicy loadPolicy(const std::string& path);

// `source` only names the document in error messages. The markdown form's
// YAML metadata block is deep-merged over the body sections.
PushPolicy parsePolicyMarkdown(const std::string& content, const std::string& source);
PushPolicy parsePolicyJson(const nlohmann::json& document, const std::string& source);

nlohmann::json policyToJson(const PushPolicy& policy);
std::string renderPolicyMarkdown(const PushPolicy& policy);

/**
 * Read only the bypass_flag key of the metadata block. Never throws;
 * returns an empty string when the file or key is absent.
 */
std::string readBypassFlagLenient(const std::string& path);

} // namespace pushgate

#endif // PUSHGATE_PUSH_POLICY_H
