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
#include "utils/log_path.h"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace pushgate {

namespace {
std::mutex g_logMutex;
std::string g_logFile;
}

std::string ResolveRepoPath(const std::string& repoRoot, const std::string& path) {
    fs::path p(path);
    if (p.is_absolute() || repoRoot.empty()) {
        return p.lexically_normal().string();
    }
    return (fs::path(repoRoot) / p).lexically_normal().string();
}

std::string GetStateFilePath(const std::string& stateDir, const char* filename) {
    return (fs::path(stateDir) / filename).string();
}

bool EnsureDir(const std::string& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    fs::create_directories(dir, ec);
    return !ec && fs::is_directory(dir, ec);
}

void SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logFile = path;
}

void LogLine(const std::string& line) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << "[" << buf << "] " << line << std::endl;
    if (g_logFile.empty()) {
        return;
    }
    std::ofstream out(g_logFile, std::ios::app);
    if (!out.is_open()) {
        return;
    }
    out << "[" << buf << "] " << line << "\n";
}

} // namespace pushgate
