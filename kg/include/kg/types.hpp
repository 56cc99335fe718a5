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
#include <utility>
#include <vector>

namespace kg {

// Where the admitted credential is placed on the outbound request.
enum class KeyInjection {
    Header,   // <key_header>: <key_prefix><key>
    Query     // ?<key_param>=<key>
};

// Transport-level failure reaching the upstream.
enum class TransportError {
    None,
    Connect,   // DNS, refused, TLS handshake / verification
    Timeout,   // connect or I/O deadline
    Protocol   // malformed or truncated response
};

// Ordered header list; keeps duplicates (Set-Cookie, Vary, ...) intact.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

} // namespace kg
