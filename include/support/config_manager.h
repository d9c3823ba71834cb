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
#ifndef PUSHGATE_CONFIG_MANAGER_H
#define PUSHGATE_CONFIG_MANAGER_H

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

namespace pushgate {

/**
 * GateConfig - 宿主配置结构
 *
 * Host-side settings; the policy itself lives in the policy document.
 * - policy_file: policy document, relative to the repository root
 * - state_dir: state directory, relative to the repository root
 * - command_timeout_seconds: wall-clock budget per lint/test command (0 = none)
 * - max_output_bytes: captured output cap per command
 * - audit_enabled: append audit entries
 * - show_cleanup_notice: surface the pending-cleanup ledger in decisions
 */
struct GateConfig {
    std::string policy_file;
    std::string state_dir;
    int command_timeout_seconds;
    int max_output_bytes;
    bool audit_enabled;
    bool show_cleanup_notice;
};

nlohmann::json configToJson(const GateConfig& config);

/**
 * ConfigManager - 配置管理器
 *
 * Loads `.specify/pushgate.json`. A missing file means defaults; a file
 * that does not parse or validate is an error.
 */
class ConfigManager {
public:
    static constexpr const char* kDefaultConfigPath = ".specify/pushgate.json";

    /**
     * @param configPath 配置文件路径
     */
    explicit ConfigManager(const std::string& configPath = kDefaultConfigPath);

    /**
     * 加载配置文件
     * @return false when the file does not exist (defaults are in effect)
     * @throws std::runtime_error on malformed JSON or invalid values
     */
    bool load();

    /**
     * 保存配置到文件 (temp file + rename)
     */
    void save();

    std::string getPolicyFile() const;
    std::string getStateDir() const;
    int getCommandTimeoutSeconds() const;
    int getMaxOutputBytes() const;
    bool isAuditEnabled() const;
    bool isCleanupNoticeEnabled() const;

    void setPolicyFile(const std::string& path);
    void setStateDir(const std::string& dir);
    void setCommandTimeoutSeconds(int seconds);
    void setMaxOutputBytes(int bytes);
    void setAuditEnabled(bool enabled);
    void setCleanupNoticeEnabled(bool enabled);

    /**
     * 应用一条 "key=value" 设置, key 与配置文件字段同名
     * @throws std::runtime_error on an unknown key or a value of the wrong type
     */
    void applySetting(const std::string& assignment);

    GateConfig snapshot() const;

private:
    static GateConfig generateDefaultConfig();
    bool validateConfig(const GateConfig& config, std::string& error) const;

    GateConfig config_;              // 当前配置
    std::string configPath_;         // 配置文件路径
    mutable std::mutex configMutex_; // 线程安全锁
};

} // namespace pushgate

#endif // PUSHGATE_CONFIG_MANAGER_H
