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
#include "support/config_manager.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace pushgate {

namespace {

bool parseBoolSetting(const std::string& key, const std::string& value) {
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    throw std::runtime_error(key + " must be true or false, got '" + value + "'");
}

int parseIntSetting(const std::string& key, const std::string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::runtime_error(key + " must be a whole number, got '" + value + "'");
    }
    return parsed;
}

} // namespace

json configToJson(const GateConfig& config) {
    json j;
    j["policy_file"] = config.policy_file;
    j["state_dir"] = config.state_dir;
    j["command_timeout_seconds"] = config.command_timeout_seconds;
    j["max_output_bytes"] = config.max_output_bytes;
    j["audit_enabled"] = config.audit_enabled;
    j["show_cleanup_notice"] = config.show_cleanup_notice;
    return j;
}

// ===== 构造函数 =====

ConfigManager::ConfigManager(const std::string& configPath)
    : config_(generateDefaultConfig()), configPath_(configPath) {
}

// ===== 公共方法 =====

bool ConfigManager::load() {
    std::lock_guard<std::mutex> lock(configMutex_);

    std::ifstream file(configPath_);
    if (!file.is_open()) {
        config_ = generateDefaultConfig();
        return false;
    }

    GateConfig loaded = generateDefaultConfig();
    try {
        json j;
        file >> j;
        file.close();

        if (!j.is_object()) {
            throw std::runtime_error("Config file must contain a JSON object: " + configPath_);
        }

        loaded.policy_file = j.value("policy_file", loaded.policy_file);
        loaded.state_dir = j.value("state_dir", loaded.state_dir);
        loaded.command_timeout_seconds = j.value("command_timeout_seconds", loaded.command_timeout_seconds);
        loaded.max_output_bytes = j.value("max_output_bytes", loaded.max_output_bytes);
        loaded.audit_enabled = j.value("audit_enabled", loaded.audit_enabled);
        loaded.show_cleanup_notice = j.value("show_cleanup_notice", loaded.show_cleanup_notice);

        if (j.contains("audit") && j["audit"].is_object()) {
            const auto& audit = j["audit"];
            loaded.audit_enabled = audit.value("enabled", loaded.audit_enabled);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Config file format error in " + configPath_ + ": " + std::string(e.what()));
    }

    std::string error;
    if (!validateConfig(loaded, error)) {
        throw std::runtime_error("Config validation failed for " + configPath_ + ": " + error);
    }
    config_ = loaded;
    return true;
}

void ConfigManager::save() {
    std::lock_guard<std::mutex> lock(configMutex_);

    std::string error;
    if (!validateConfig(config_, error)) {
        throw std::runtime_error("Config validation failed: " + error);
    }

    fs::path parent = fs::path(configPath_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }

    std::string tempPath = configPath_ + ".tmp";
    std::ofstream file(tempPath, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file for saving: " + tempPath);
    }

    file << configToJson(config_).dump(4) << std::endl;
    file.close();

    std::error_code ec;
    fs::rename(tempPath, configPath_, ec);
    if (ec) {
        std::remove(tempPath.c_str());
        throw std::runtime_error("Cannot replace config file: " + configPath_);
    }
}

// ===== 配置项访问器 =====

std::string ConfigManager::getPolicyFile() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.policy_file;
}

std::string ConfigManager::getStateDir() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.state_dir;
}

int ConfigManager::getCommandTimeoutSeconds() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.command_timeout_seconds;
}

int ConfigManager::getMaxOutputBytes() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.max_output_bytes;
}

bool ConfigManager::isAuditEnabled() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.audit_enabled;
}

bool ConfigManager::isCleanupNoticeEnabled() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.show_cleanup_notice;
}

GateConfig ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

// ===== 配置项修改器 =====

void ConfigManager::setPolicyFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.policy_file = path;
}

void ConfigManager::setStateDir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.state_dir = dir;
}

void ConfigManager::setCommandTimeoutSeconds(int seconds) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.command_timeout_seconds = seconds;
}

void ConfigManager::setMaxOutputBytes(int bytes) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.max_output_bytes = bytes;
}

void ConfigManager::setAuditEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.audit_enabled = enabled;
}

void ConfigManager::setCleanupNoticeEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.show_cleanup_notice = enabled;
}

void ConfigManager::applySetting(const std::string& assignment) {
    size_t eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::runtime_error("Setting must look like key=value, got '" + assignment + "'");
    }
    std::string key = assignment.substr(0, eq);
    std::string value = assignment.substr(eq + 1);

    if (key == "policy_file") {
        setPolicyFile(value);
    } else if (key == "state_dir") {
        setStateDir(value);
    } else if (key == "command_timeout_seconds") {
        setCommandTimeoutSeconds(parseIntSetting(key, value));
    } else if (key == "max_output_bytes") {
        setMaxOutputBytes(parseIntSetting(key, value));
    } else if (key == "audit_enabled") {
        setAuditEnabled(parseBoolSetting(key, value));
    } else if (key == "show_cleanup_notice") {
        setCleanupNoticeEnabled(parseBoolSetting(key, value));
    } else {
        throw std::runtime_error("Unknown setting '" + key + "'");
    }
}

// ===== 私有方法 =====

GateConfig ConfigManager::generateDefaultConfig() {
    GateConfig config;
    config.policy_file = "push-rules.md";
    config.state_dir = ".specify/state";
    config.command_timeout_seconds = 300;
    config.max_output_bytes = 1024 * 1024;
    config.audit_enabled = true;
    config.show_cleanup_notice = true;
    return config;
}

bool ConfigManager::validateConfig(const GateConfig& config, std::string& error) const {
    if (config.policy_file.empty()) {
        error = "policy_file must not be empty";
        return false;
    }
    if (config.state_dir.empty()) {
        error = "state_dir must not be empty";
        return false;
    }
    if (config.command_timeout_seconds < 0 || config.command_timeout_seconds > 3600) {
        error = "command_timeout_seconds out of range (0-3600)";
        return false;
    }
    if (config.max_output_bytes <= 0) {
        error = "max_output_bytes must be a positive integer";
        return false;
    }
    return true;
}

} // namespace pushgate
