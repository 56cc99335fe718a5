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
#include "kg/types.hpp"
#include "kg/http_request.hpp"
#include "kg/http_response.hpp"

namespace kg::internal {

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, kg::HttpRequest& r);

// Parse "HTTP/1.1 200 OK"
bool parse_status_line(const std::string& line, int& status_code, std::string& status_text);

// Parse a full header block (start line + header lines, no trailing CRLFCRLF).
bool parse_request_head(const std::string& head, kg::HttpRequest& r);
bool parse_response_head(const std::string& head, kg::HttpResponse& r);

// Case-insensitive header lookup (first match)
std::string hdr_ci(const kg::HeaderList& H, const char* name);
inline std::string hdr_ci(const kg::HttpRequest& R, const char* name) { return hdr_ci(R.headers, name); }

// Replace every header of that name by a single one.
void set_header_ci(kg::HeaderList& H, const std::string& name, const std::string& value);

// Remove every header of that name; returns how many were removed.
std::size_t erase_header_ci(kg::HeaderList& H, const std::string& name);

// True if `list` (comma separated) contains `token`, case-insensitively.
bool has_token_ci(const std::string& list, const char* token);

// Connection-level headers that must not be forwarded (RFC 9110 7.6.1),
// plus Content-Length which is recomputed on every hop.
bool is_hop_by_hop(const std::string& name);

// Remove hop-by-hop headers, including those named in the Connection header.
void strip_hop_by_hop(kg::HeaderList& H);

// Replace or append one query parameter in a raw query string.
// The value is percent-encoded; other parameters are kept byte for byte.
std::string set_query_param(const std::string& query, const std::string& name,
                            const std::string& value);

// RFC 3986 unreserved-set percent encoding.
std::string url_encode(const std::string& s);

// Canonical reason phrase for the status codes we emit ourselves.
const char* reason_phrase(int status_code);

} // namespace kg::internal
