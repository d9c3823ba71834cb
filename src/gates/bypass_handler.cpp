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
#include "gates/bypass_handler.h"
#include "policy/push_policy.h"
#include <sstream>

namespace pushgate {

bool checkBypass(const std::string& rawCommand, const std::string& bypassFlag) {
    if (bypassFlag.empty()) {
        return false;
    }
    std::istringstream stream(rawCommand);
    std::string token;
    while (stream >> token) {
        std::string bare;
        for (char c : token) {
            if (c != '"' && c != '\'') {
                bare += c;
            }
        }
        if (bare == bypassFlag) {
            return true;
        }
    }
    return false;
}

std::string resolveBypassFlag(const std::string& policyPath) {
    std::string flag = readBypassFlagLenient(policyPath);
    if (flag.empty() || flag.front() != '-') {
        return kDefaultBypassFlag;
    }
    return flag;
}

} // namespace pushgate
