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
#include <cstdint>

namespace kg::internal {

// Parsed absolute http(s) URL. No userinfo, no fragment.
struct Url {
    bool          tls = false;  // https
    std::string   host;         // without brackets for IPv6 literals
    std::uint16_t port = 0;     // explicit or scheme default
    std::string   path;         // base path without trailing '/', may be empty
    std::string   query;        // raw query of the base URL, may be empty

    // Value for the Host header ("host" or "host:port" / "[v6]:port").
    std::string host_header() const;
};

// Parse "http://host[:port][/path][?query]". Returns false on anything else.
bool parse_url(const std::string& s, Url& out);

// Join the base path with a forwarded sub-path: ("/v1", "/models") -> "/v1/models".
// Always returns a path starting with '/'.
std::string join_path(const std::string& base, const std::string& sub);

} // namespace kg::internal
