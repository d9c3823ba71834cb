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
#include "policy/push_policy.h"
#include "support/errors.h"
#include "utils/log_path.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace pushgate {

namespace {

enum class Section {
    None,
    Rebase,
    Lint,
    Test,
    BranchNaming
};

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string stripQuotes(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// "Base Branch" / "base-branch" / "baseBranch" -> "base_branch"
std::string normalizeKey(const std::string& key) {
    std::string text = trim(key);
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == ' ' || c == '\t' || c == '-' || c == '_') {
            if (!out.empty() && out.back() != '_') {
                out += '_';
            }
            continue;
        }
        if (std::isupper(c) && i > 0 && std::islower(static_cast<unsigned char>(text[i - 1])) &&
            !out.empty() && out.back() != '_') {
            out += '_';
        }
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

bool parseBool(const std::string& raw, const std::string& key, const std::string& source) {
    std::string value = toLower(stripQuotes(trim(raw)));
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    throw MalformedPolicyError(source, "'" + key + "' must be a boolean, got '" + raw + "'");
}

// Text between the first and last backtick, or empty when there is none.
std::string backticked(const std::string& value) {
    size_t open = value.find('`');
    size_t close = value.rfind('`');
    if (open == std::string::npos || close == open) {
        return "";
    }
    return trim(value.substr(open + 1, close - open - 1));
}

Section classifyHeading(const std::string& heading) {
    std::string text = toLower(heading);
    if (text.find("rebase policy") != std::string::npos) {
        return Section::Rebase;
    }
    if (text.find("branch naming") != std::string::npos) {
        return Section::BranchNaming;
    }
    if (text.find("linting") != std::string::npos) {
        return Section::Lint;
    }
    if (text.find("testing") != std::string::npos) {
        return Section::Test;
    }
    return Section::None;
}

std::string sectionTitle(Section section) {
    switch (section) {
        case Section::Rebase: return "Rebase Policy";
        case Section::Lint: return "Linting";
        case Section::Test: return "Testing";
        case Section::BranchNaming: return "Branch Naming";
        default: return "";
    }
}

// "- **Required**: true" -> ("required", "true")
bool splitKeyValue(const std::string& line, std::string& key, std::string& value) {
    std::string text = trim(line);
    if (text.size() >= 2 && (text[0] == '-' || text[0] == '*') && text[1] == ' ') {
        text = trim(text.substr(2));
    }
    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    std::string rawKey;
    for (size_t i = 0; i < colon; ++i) {
        if (text[i] != '*') {
            rawKey += text[i];
        }
    }
    rawKey = trim(rawKey);
    if (rawKey.empty() || !std::isalpha(static_cast<unsigned char>(rawKey[0]))) {
        return false;
    }
    std::string rest = trim(text.substr(colon + 1));
    if (rest.compare(0, 2, "**") == 0) {    // "**Key:** value"
        rest = trim(rest.substr(2));
    }
    key = normalizeKey(rawKey);
    value = rest;
    return true;
}

// `value` or `'value'`, unwrapped
std::string plainValue(const std::string& value) {
    std::string quoted = backticked(value);
    return quoted.empty() ? stripQuotes(trim(value)) : quoted;
}

RebaseEnforcement parseEnforcement(const std::string& raw, const std::string& key,
                                   const std::string& source) {
    std::string value = toLower(trim(raw));
    if (value == "strict") {
        return RebaseEnforcement::Strict;
    }
    if (value == "warn") {
        return RebaseEnforcement::Warn;
    }
    if (value == "disabled") {
        return RebaseEnforcement::Disabled;
    }
    throw MalformedPolicyError(source, "'" + key + "' must be strict, warn or disabled, got '" + raw + "'");
}

int parseTimeout(const std::string& raw, const std::string& key, const std::string& source) {
    std::string value = trim(raw);
    if (!value.empty() && value.back() == 's') {
        value.pop_back();
    }
    bool digits = !value.empty() && value.size() <= 6 &&
                  std::all_of(value.begin(), value.end(),
                              [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        throw MalformedPolicyError(source, "'" + key + "' must be a number of seconds, got '" + raw + "'");
    }
    return std::stoi(value);
}

bool isRecognizedVersion(const std::string& version) {
    static const std::regex kVersion(R"(^(\d+)\.(\d+)$)");
    std::smatch match;
    if (!std::regex_match(version, match, kVersion)) {
        return false;
    }
    return match[1].str() == "1";
}

void validatePolicy(const PushPolicy& policy, const std::string& source) {
    if (policy.version.empty()) {
        throw MalformedPolicyError(source, "metadata block has no version marker");
    }
    if (!isRecognizedVersion(policy.version)) {
        throw MalformedPolicyError(source, "unrecognized policy version '" + policy.version + "'");
    }

    const std::string& base = policy.base_branch;
    if (base.empty()) {
        throw MalformedPolicyError(source, "base branch must not be empty");
    }
    if (base.front() == '-' || base.back() == '.' || base.find("..") != std::string::npos ||
        base.find_first_of(" \t~^:?*[\\") != std::string::npos) {
        throw MalformedPolicyError(source, "invalid base branch name '" + base + "'");
    }

    if (policy.bypass_flag.empty() || policy.bypass_flag.front() != '-' ||
        policy.bypass_flag.find_first_of(" \t") != std::string::npos) {
        throw MalformedPolicyError(source, "bypass_flag must be a single token starting with '-', got '" +
                                   policy.bypass_flag + "'");
    }

    const struct {
        const char* key;
        const ValidationCommand* command;
    } commands[] = {
        {"lint.timeout", &policy.lint},
        {"test.timeout", &policy.test},
    };
    for (const auto& entry : commands) {
        int timeout = entry.command->timeout_seconds;
        if (timeout < 1 || timeout > kMaxCommandTimeoutSeconds) {
            throw MalformedPolicyError(source, std::string("'") + entry.key + "' must be between 1 and " +
                                       std::to_string(kMaxCommandTimeoutSeconds) + " seconds, got " +
                                       std::to_string(timeout));
        }
    }

    if (!policy.branch_naming_pattern.empty()) {
        try {
            std::regex compiled(policy.branch_naming_pattern);
        } catch (const std::regex_error& e) {
            throw MalformedPolicyError(source, "invalid branch naming pattern '" +
                                       policy.branch_naming_pattern + "': " + e.what());
        }
    }
}

template <typename T>
T jsonField(const json& object, const char* key, const T& fallback, const std::string& source) {
    if (!object.contains(key) || object.at(key).is_null()) {
        return fallback;
    }
    try {
        return object.at(key).get<T>();
    } catch (const json::exception&) {
        throw MalformedPolicyError(source, std::string("field '") + key + "' has the wrong type");
    }
}

const json& jsonSection(const json& document, const char* key, const std::string& source) {
    static const json kEmpty = json::object();
    if (!document.contains(key) || document.at(key).is_null()) {
        return kEmpty;
    }
    if (!document.at(key).is_object()) {
        throw MalformedPolicyError(source, std::string("section '") + key + "' must be an object");
    }
    return document.at(key);
}

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}


std::string sectionKey(Section section) {
    switch (section) {
        case Section::Rebase: return "rebase_policy";
        case Section::Lint: return "lint";
        case Section::Test: return "test";
        case Section::BranchNaming: return "branch_naming";
        default: return "";
    }
}

// Flattened "section.key" -> scalar text, body first, metadata merged over it.
using Fields = std::map<std::string, std::string>;

enum class Frontmatter {
    Found,
    Missing,
    Unclosed
};

Frontmatter splitFrontmatter(const std::string& content, std::string& metadata,
                             std::vector<std::string>& body) {
    std::vector<std::string> lines = splitLines(content);
    if (!lines.empty() && lines[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
        lines[0] = lines[0].substr(3);
    }
    if (lines.empty() || trim(lines[0]) != "---") {
        return Frontmatter::Missing;
    }
    for (size_t i = 1; i < lines.size(); ++i) {
        if (trim(lines[i]) == "---") {
            metadata.clear();
            for (size_t j = 1; j < i; ++j) {
                metadata += lines[j] + "\n";
            }
            body.assign(lines.begin() + static_cast<std::ptrdiff_t>(i) + 1, lines.end());
            return Frontmatter::Found;
        }
    }
    return Frontmatter::Unclosed;
}

YAML::Node loadMetadata(const std::string& text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        std::string where = e.mark.is_null() ? "" : " at line " + std::to_string(e.mark.line + 2);
        throw MalformedPolicyError(source, "invalid YAML metadata" + where + ": " + e.msg);
    }
    if (root.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!root.IsMap()) {
        throw MalformedPolicyError(source, "metadata block must be a mapping of 'key: value' entries");
    }
    return root;
}

// Flat metadata keys that live inside a section
std::string metadataAlias(const std::string& key) {
    if (key == "base_branch") {
        return "rebase_policy.base_branch";
    }
    if (key == "enforce_branch_naming") {
        return "branch_naming.enforce";
    }
    if (key == "branch_naming_pattern") {
        return "branch_naming.pattern";
    }
    return key;
}

void flattenMetadata(const YAML::Node& node, const std::string& prefix, Fields& fields,
                     const std::string& source) {
    for (const auto& entry : node) {
        std::string key = normalizeKey(entry.first.as<std::string>());
        std::string path = prefix.empty() ? metadataAlias(key) : prefix + "." + key;
        const YAML::Node& value = entry.second;
        if (value.IsMap()) {
            flattenMetadata(value, path, fields, source);
        } else if (value.IsScalar()) {
            fields[path] = plainValue(value.as<std::string>());
        } else if (value.IsSequence()) {
            throw MalformedPolicyError(source, "'" + path + "' must be a value or a mapping, not a list");
        }
    }
}

const std::string* findField(const Fields& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? nullptr : &it->second;
}

void applyCommandFields(ValidationCommand& target, const Fields& fields, const std::string& section,
                        const std::string& title, const std::string& source) {
    if (const std::string* required = findField(fields, section + ".required")) {
        target.required = parseBool(*required, section + ".required", source);
    }
    if (const std::string* command = findField(fields, section + ".command")) {
        target.command = trim(*command);
    }
    if (const std::string* timeout = findField(fields, section + ".timeout")) {
        target.timeout_seconds = parseTimeout(*timeout, section + ".timeout", source);
    }
    if (target.required && target.command.empty()) {
        throw MalformedPolicyError(source, title + " is required but has no backticked Command");
    }
}

PushPolicy policyFromFields(const Fields& fields, const std::string& source) {
    PushPolicy policy;
    if (const std::string* version = findField(fields, "version")) {
        policy.version = *version;
    }
    if (const std::string* enabled = findField(fields, "enabled")) {
        policy.enabled = parseBool(*enabled, "enabled", source);
    }
    if (const std::string* flag = findField(fields, "bypass_flag")) {
        policy.bypass_flag = *flag;
    }

    if (const std::string* required = findField(fields, "rebase_policy.required")) {
        policy.rebase_required = parseBool(*required, "rebase_policy.required", source);
    }
    if (const std::string* base = findField(fields, "rebase_policy.base_branch")) {
        policy.base_branch = *base;
    }
    if (const std::string* enforcement = findField(fields, "rebase_policy.enforcement")) {
        policy.rebase_enforcement = parseEnforcement(*enforcement, "rebase_policy.enforcement", source);
    }
    if (const std::string* allow = findField(fields, "rebase_policy.allow_merge_commits")) {
        policy.allow_merge_commits = parseBool(*allow, "rebase_policy.allow_merge_commits", source);
    }

    applyCommandFields(policy.lint, fields, "lint", sectionTitle(Section::Lint), source);
    applyCommandFields(policy.test, fields, "test", sectionTitle(Section::Test), source);

    if (const std::string* enforce = findField(fields, "branch_naming.enforce")) {
        policy.enforce_branch_naming = parseBool(*enforce, "branch_naming.enforce", source);
    }
    if (const std::string* pattern = findField(fields, "branch_naming.pattern")) {
        policy.branch_naming_pattern = *pattern;
    }
    return policy;
}

} // namespace

const char* rebaseEnforcementName(RebaseEnforcement enforcement) {
    switch (enforcement) {
        case RebaseEnforcement::Warn: return "warn";
        case RebaseEnforcement::Disabled: return "disabled";
        default: return "strict";
    }
}

PushPolicy loadPolicy(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw MissingPolicyError(path);
    }

    std::string content = readFile(path);

    if (trim(content).empty()) {
        throw MalformedPolicyError(path, "file is empty");
    }

    if (toLower(fs::path(path).extension().string()) == ".json") {
        json document;
        try {
            document = json::parse(content);
        } catch (const json::parse_error& e) {
            throw MalformedPolicyError(path, std::string("invalid JSON: ") + e.what());
        }
        return parsePolicyJson(document, path);
    }
    return parsePolicyMarkdown(content, path);
}

PushPolicy parsePolicyMarkdown(const std::string& content, const std::string& source) {
    std::string metadataText;
    std::vector<std::string> body;
    switch (splitFrontmatter(content, metadataText, body)) {
        case Frontmatter::Missing:
            throw MalformedPolicyError(source, "file must start with a metadata block (---)");
        case Frontmatter::Unclosed:
            throw MalformedPolicyError(source, "metadata block not closed (missing closing ---)");
        case Frontmatter::Found:
            break;
    }
    YAML::Node metadata = loadMetadata(metadataText, source);

    Fields fields;
    Section current = Section::None;
    for (const auto& raw : body) {
        std::string line = trim(raw);
        if (line.empty()) {
            continue;
        }
        if (line[0] == '#') {
            size_t textStart = line.find_first_not_of('#');
            current = textStart == std::string::npos ? Section::None
                                                     : classifyHeading(line.substr(textStart));
            continue;
        }
        if (current == Section::None) {
            continue;
        }
        std::string key;
        std::string value;
        if (!splitKeyValue(line, key, value)) {
            continue;
        }
        // Body commands must be backticked
        value = key == "command" ? backticked(value) : plainValue(value);
        fields.emplace(sectionKey(current) + "." + key, value);   // first occurrence wins
    }

    // Metadata block overrides the body
    try {
        flattenMetadata(metadata, "", fields, source);
    } catch (const YAML::Exception& e) {
        throw MalformedPolicyError(source, std::string("invalid YAML metadata: ") + e.what());
    }

    PushPolicy policy = policyFromFields(fields, source);
    validatePolicy(policy, source);
    return policy;
}

PushPolicy parsePolicyJson(const json& document, const std::string& source) {
    if (!document.is_object()) {
        throw MalformedPolicyError(source, "policy document must be a JSON object");
    }

    PushPolicy policy;
    if (document.contains("version") && document.at("version").is_number()) {
        throw MalformedPolicyError(source, "version must be a string such as \"1.0\"");
    }
    policy.version = jsonField<std::string>(document, "version", "", source);
    policy.enabled = jsonField<bool>(document, "enabled", policy.enabled, source);
    policy.bypass_flag = jsonField<std::string>(document, "bypass_flag", policy.bypass_flag, source);

    const json& rebase = jsonSection(document, "rebase_policy", source);
    policy.rebase_required = jsonField<bool>(rebase, "required", policy.rebase_required, source);
    policy.base_branch = jsonField<std::string>(rebase, "base_branch", policy.base_branch, source);
    policy.rebase_enforcement = parseEnforcement(
        jsonField<std::string>(rebase, "enforcement", rebaseEnforcementName(policy.rebase_enforcement), source),
        "rebase_policy.enforcement", source);
    policy.allow_merge_commits = jsonField<bool>(rebase, "allow_merge_commits", false, source);

    const struct {
        const char* key;
        const char* title;
        ValidationCommand* target;
    } commands[] = {
        {"lint", "Linting", &policy.lint},
        {"test", "Testing", &policy.test},
    };
    for (const auto& entry : commands) {
        const json& section = jsonSection(document, entry.key, source);
        entry.target->required = jsonField<bool>(section, "required", false, source);
        entry.target->command = trim(jsonField<std::string>(section, "command", "", source));
        entry.target->timeout_seconds = jsonField<int>(section, "timeout", kDefaultCommandTimeoutSeconds, source);
        if (entry.target->required && entry.target->command.empty()) {
            throw MalformedPolicyError(source, std::string(entry.title) + " is required but has no command");
        }
    }

    const json& naming = jsonSection(document, "branch_naming", source);
    policy.enforce_branch_naming = jsonField<bool>(naming, "enforce", false, source);
    policy.branch_naming_pattern = jsonField<std::string>(naming, "pattern", "", source);

    validatePolicy(policy, source);
    return policy;
}

json policyToJson(const PushPolicy& policy) {
    json j;
    j["version"] = policy.version;
    j["enabled"] = policy.enabled;
    j["bypass_flag"] = policy.bypass_flag;
    j["rebase_policy"] = {
        {"required", policy.rebase_required},
        {"base_branch", policy.base_branch},
        {"enforcement", rebaseEnforcementName(policy.rebase_enforcement)},
        {"allow_merge_commits", policy.allow_merge_commits}
    };
    auto commandJson = [](const ValidationCommand& command) {
        return json{
            {"required", command.required},
            {"command", command.command},
            {"timeout", command.timeout_seconds}
        };
    };
    j["lint"] = commandJson(policy.lint);
    j["test"] = commandJson(policy.test);
    j["branch_naming"] = {
        {"enforce", policy.enforce_branch_naming},
        {"pattern", policy.branch_naming_pattern}
    };
    return j;
}

std::string renderPolicyMarkdown(const PushPolicy& policy) {
    auto boolText = [](bool value) { return value ? "true" : "false"; };

    std::ostringstream out;
    out << "---\n";
    out << "version: \"" << policy.version << "\"\n";
    out << "enabled: " << boolText(policy.enabled) << "\n";
    out << "bypass_flag: \"" << policy.bypass_flag << "\"\n";
    out << "---\n\n";
    out << "# Push Rules\n\n";
    out << "Checks run before every `git push`. Bypass with `git push "
        << policy.bypass_flag << "`.\n\n";

    out << "## Rebase Policy\n\n";
    out << "- **Required**: " << boolText(policy.rebase_required) << "\n";
    out << "- **Base Branch**: " << policy.base_branch << "\n";
    out << "- **Enforcement**: " << rebaseEnforcementName(policy.rebase_enforcement) << "\n";
    out << "- **Allow Merge Commits**: " << boolText(policy.allow_merge_commits) << "\n\n";

    const struct {
        const char* title;
        const ValidationCommand* command;
    } commands[] = {
        {"Linting", &policy.lint},
        {"Testing", &policy.test},
    };
    for (const auto& entry : commands) {
        out << "## " << entry.title << "\n\n";
        out << "- **Required**: " << boolText(entry.command->required) << "\n";
        if (!entry.command->command.empty()) {
            out << "- **Command**: `" << entry.command->command << "`\n";
        }
        out << "- **Timeout**: " << entry.command->timeout_seconds << "\n";
        out << "\n";
    }

    out << "## Branch Naming\n\n";
    out << "- **Enforce**: " << boolText(policy.enforce_branch_naming) << "\n";
    if (!policy.branch_naming_pattern.empty()) {
        out << "- **Pattern**: `" << policy.branch_naming_pattern << "`\n";
    }
    return out.str();
}

std::string readBypassFlagLenient(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return "";
    }
    std::string content = readFile(path);

    if (toLower(fs::path(path).extension().string()) == ".json") {
        json document = json::parse(content, nullptr, false);
        if (document.is_object() && document.contains("bypass_flag") &&
            document["bypass_flag"].is_string()) {
            return trim(document["bypass_flag"].get<std::string>());
        }
        return "";
    }

    std::string metadataText;
    std::vector<std::string> body;
    if (splitFrontmatter(content, metadataText, body) != Frontmatter::Found) {
        return "";
    }
    try {
        YAML::Node metadata = YAML::Load(metadataText);
        if (!metadata.IsMap()) {
            return "";
        }
        for (const auto& entry : metadata) {
            if (normalizeKey(entry.first.as<std::string>()) == "bypass_flag" && entry.second.IsScalar()) {
                return trim(entry.second.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        LogLine(std::string("Warning: cannot read bypass_flag from ") + path + ": " + e.what());
    }
    return "";
}

} // namespace pushgate
