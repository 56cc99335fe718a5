/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#pragma once
#include <string>

namespace kg {

// Thread-safe logging (to file + stdout).
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// Enable/disable the stdout copy (file logging is unaffected).
void set_log_console(bool on);

// Masked fingerprint of a credential for log lines ("AIza…"); "****" under 12 chars.
std::string key_fingerprint(const std::string& key);

} // namespace kg
