/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/internal/http_parser.hpp"
#include "kg/internal/utils.hpp"
#include <sstream>
#include <vector>
#include <algorithm>
#include <cctype>
#include <strings.h> // strcasecmp

namespace kg::internal {

namespace {

bool is_tchar(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
        return true;
    default:
        return false;
    }
}

// Header lines after the start line. Obsolete line folding is rejected.
bool parse_header_lines(const std::string& head, std::size_t pos, kg::HeaderList& out) {
    out.clear();
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        if (line.empty()) continue;
        if (line[0] == ' ' || line[0] == '\t') return false;
        std::size_t c = line.find(':');
        if (c == std::string::npos || c == 0) return false;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        for (char ch : k) {
            if (!is_tchar((unsigned char)ch)) return false;
        }
        trim_inplace(v);
        out.emplace_back(std::move(k), std::move(v));
    }
    return true;
}

} // namespace

bool parse_request_line(const std::string& line, kg::HttpRequest& r) {
    std::istringstream iss(line);
    std::string target;
    if (!(iss >> r.method >> target >> r.httpver)) return false;
    std::string extra;
    if (iss >> extra) return false;
    for (char c : r.method) {
        if (!is_tchar((unsigned char)c)) return false;
    }
    if (r.httpver != "HTTP/1.1" && r.httpver != "HTTP/1.0") return false;
    if (target.empty() || target[0] != '/') return false;

    std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

bool parse_status_line(const std::string& line, int& status_code, std::string& status_text) {
    // "HTTP/1.1 200 OK"
    std::istringstream iss(line);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    if (status_code < 100 || status_code > 999) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);
    return true;
}

bool parse_request_head(const std::string& head, kg::HttpRequest& r) {
    std::size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) line_end = head.size();
    if (!parse_request_line(head.substr(0, line_end), r)) return false;
    return parse_header_lines(head, line_end + 2, r.headers);
}

bool parse_response_head(const std::string& head, kg::HttpResponse& r) {
    std::size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) line_end = head.size();
    if (!parse_status_line(head.substr(0, line_end), r.status_code, r.status_text)) return false;
    return parse_header_lines(head, line_end + 2, r.headers);
}

std::string hdr_ci(const kg::HeaderList& H, const char* name){
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

void set_header_ci(kg::HeaderList& H, const std::string& name, const std::string& value) {
    erase_header_ci(H, name);
    H.emplace_back(name, value);
}

std::size_t erase_header_ci(kg::HeaderList& H, const std::string& name) {
    const std::size_t before = H.size();
    H.erase(std::remove_if(H.begin(), H.end(),
                           [&](const auto& kv){ return iequals(kv.first, name); }),
            H.end());
    return before - H.size();
}

bool has_token_ci(const std::string& list, const char* token) {
    const std::string want = lower_copy(token);
    std::size_t p = 0;
    while (p <= list.size()) {
        std::size_t comma = list.find(',', p);
        if (comma == std::string::npos) comma = list.size();
        std::string item = list.substr(p, comma - p);
        trim_inplace(item);
        if (lower_copy(item) == want) return true;
        p = comma + 1;
    }
    return false;
}

bool is_hop_by_hop(const std::string& name) {
    static const char* const kHop[] = {
        "Host", "Connection", "Keep-Alive", "Proxy-Connection",
        "Proxy-Authenticate", "Proxy-Authorization", "TE", "Trailer",
        "Transfer-Encoding", "Upgrade", "Content-Length"
    };
    for (const char* h : kHop) {
        if (strcasecmp(name.c_str(), h) == 0) return true;
    }
    return false;
}

void strip_hop_by_hop(kg::HeaderList& H) {
    // Headers listed in Connection are connection-scoped too.
    std::vector<std::string> named;
    for (const auto& kv : H) {
        if (!iequals(kv.first, "Connection")) continue;
        std::size_t p = 0;
        while (p <= kv.second.size()) {
            std::size_t comma = kv.second.find(',', p);
            if (comma == std::string::npos) comma = kv.second.size();
            std::string item = kv.second.substr(p, comma - p);
            trim_inplace(item);
            if (!item.empty()) named.push_back(item);
            p = comma + 1;
        }
    }
    H.erase(std::remove_if(H.begin(), H.end(), [&](const auto& kv){
                if (is_hop_by_hop(kv.first)) return true;
                for (const auto& n : named) {
                    if (iequals(n, kv.first)) return true;
                }
                return false;
            }),
            H.end());
}

std::string url_encode(const std::string& s) {
    static const char* H="0123456789ABCDEF";
    std::string out; out.reserve(s.size()*3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c=='-' || c=='.' || c=='_' || c=='~') {
            out.push_back((char)c);
        } else {
            out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]);
        }
    }
    return out;
}

std::string set_query_param(const std::string& query, const std::string& name,
                            const std::string& value)
{
    const std::string enc_name = url_encode(name);
    std::ostringstream oss;
    bool first = true;
    std::size_t p = 0;
    while (p < query.size()) {
        std::size_t amp = query.find('&', p);
        if (amp == std::string::npos) amp = query.size();
        std::string item = query.substr(p, amp - p);
        p = amp + 1;
        if (item.empty()) continue;
        std::string k = item.substr(0, item.find('='));
        if (k == name || k == enc_name) continue;
        if (!first) oss << '&';
        first = false;
        oss << item;
    }
    if (!first) oss << '&';
    oss << enc_name << '=' << url_encode(value);
    return oss.str();
}

const char* reason_phrase(int sc) {
    switch (sc) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 504: return "Gateway Timeout";
    default:  return "Unknown";
    }
}

} // namespace kg::internal
