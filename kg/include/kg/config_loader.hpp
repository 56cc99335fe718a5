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
#include <vector>
#include <unordered_map>
#include "kg/gateway_config.hpp"

namespace kg {

using EnvMap = std::unordered_map<std::string, std::string>;

// Parse a dotenv file (KEY=VALUE lines, '#' comments, optional "export ",
// optional quotes). Returns false if the file cannot be opened; malformed
// lines are skipped. Existing entries in `out` are not overwritten.
bool load_dotenv(const std::string& path, EnvMap& out);

// Parse dotenv text (same rules as load_dotenv).
void parse_dotenv(const std::string& text, EnvMap& out);

// Snapshot of the variables KeyGate reads from the process environment.
EnvMap process_env();

// Split "k1;k2; k3;" into trimmed, non-empty credentials.
std::vector<std::string> split_credentials(const std::string& s);

// Apply recognised variables (API_KEYS, TARGET_API_URL, RATE_LIMIT, ...) over cfg.
// Throws ConfigError on unparsable numbers or enum values.
void apply_env(const EnvMap& env, GatewayConfig& cfg);

// Throws ConfigError if the configuration cannot start a gateway.
void validate_config(const GatewayConfig& cfg);

} // namespace kg
