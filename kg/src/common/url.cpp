/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/internal/url.hpp"
#include "kg/internal/utils.hpp"

namespace kg::internal {

std::string Url::host_header() const {
    const bool v6 = host.find(':') != std::string::npos;
    std::string h = v6 ? "[" + host + "]" : host;
    const std::uint16_t def = tls ? 443 : 80;
    if (port != def) h += ":" + std::to_string(port);
    return h;
}

bool parse_url(const std::string& s, Url& out) {
    std::string rest;
    const std::string lower = lower_copy(s.substr(0, 8));
    if (lower.compare(0, 7, "http://") == 0) {
        out.tls = false;
        rest = s.substr(7);
    } else if (lower.compare(0, 8, "https://") == 0) {
        out.tls = true;
        rest = s.substr(8);
    } else {
        return false;
    }
    if (rest.find('#') != std::string::npos) return false;

    std::size_t path_at = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_at);
    std::string tail = (path_at == std::string::npos) ? "" : rest.substr(path_at);
    if (authority.empty() || authority.find('@') != std::string::npos) return false;

    std::string port_s;
    if (authority[0] == '[') {
        std::size_t rb = authority.find(']');
        if (rb == std::string::npos || rb == 1) return false;
        out.host = authority.substr(1, rb - 1);
        if (rb + 1 < authority.size()) {
            if (authority[rb + 1] != ':') return false;
            port_s = authority.substr(rb + 2);
            if (port_s.empty()) return false;
        }
    } else {
        std::size_t colon = authority.find(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_s = authority.substr(colon + 1);
            if (port_s.empty()) return false;
        }
        if (out.host.empty()) return false;
    }

    if (port_s.empty()) {
        out.port = out.tls ? 443 : 80;
    } else {
        std::size_t p = 0;
        if (!parse_size(port_s, p) || p == 0 || p > 65535) return false;
        out.port = static_cast<std::uint16_t>(p);
    }

    std::size_t q = tail.find('?');
    out.path  = tail.substr(0, q);
    out.query = (q == std::string::npos) ? "" : tail.substr(q + 1);
    while (!out.path.empty() && out.path.back() == '/') out.path.pop_back();
    return true;
}

std::string join_path(const std::string& base, const std::string& sub) {
    std::string s = sub;
    while (!s.empty() && s.front() == '/') s.erase(0, 1);
    std::string out = base;
    while (!out.empty() && out.back() == '/') out.pop_back();
    out += "/";
    out += s;
    return out;
}

} // namespace kg::internal
