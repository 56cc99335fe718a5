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
#include <cstddef>

namespace kg::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

int  hexval(char c);

// Lowercase copy (ASCII)
std::string lower_copy(std::string s);

// ASCII case-insensitive equality
bool iequals(const std::string& a, const std::string& b);

// Strict non-negative decimal parse; false on junk, sign or overflow.
bool parse_size(const std::string& s, std::size_t& out);

} // namespace kg::internal
