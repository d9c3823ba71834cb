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
#ifndef PUSHGATE_BYPASS_HANDLER_H
#define PUSHGATE_BYPASS_HANDLER_H

#include <string>

namespace pushgate {

// True when `bypassFlag` is one of the whitespace-separated tokens of the
// raw command (surrounding quotes ignored). Substrings do not count.
bool checkBypass(const std::string& rawCommand, const std::string& bypassFlag);

// Bypass flag named by the policy, or the default flag when the policy is
// missing, unreadable or names none. Never throws, so a broken policy
// cannot lock out the override.
std::string resolveBypassFlag(const std::string& policyPath);

} // namespace pushgate

#endif // PUSHGATE_BYPASS_HANDLER_H
