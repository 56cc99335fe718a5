/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/internal/http_io.hpp"
#include "kg/internal/http_parser.hpp"
#include "kg/internal/utils.hpp"

#include <algorithm>
#include <sstream>

namespace kg::internal {

ReadStatus StreamReader::fill() {
    char buf[4096];
    long n = _s.read_some(buf, sizeof(buf));
    if (n == 0) return ReadStatus::Closed;
    if (n < 0) return _s.timed_out() ? ReadStatus::Timeout : ReadStatus::Error;
    compact();
    _buf.append(buf, buf + n);
    _received += static_cast<std::size_t>(n);
    return ReadStatus::Ok;
}

void StreamReader::compact() {
    if (_off > 0 && _off >= _buf.size() / 2) {
        _buf.erase(0, _off);
        _off = 0;
    }
}

ReadStatus StreamReader::read_head(std::string& head, std::size_t max_head) {
    while (true) {
        // RFC 9112 2.2: ignore at least one empty line before a request-line.
        while (available() >= 2 && _buf.compare(_off, 2, "\r\n") == 0) _off += 2;

        std::size_t end = _buf.find("\r\n\r\n", _off);
        if (end != std::string::npos) {
            if (end - _off > max_head) return ReadStatus::TooLarge;
            head.assign(_buf, _off, end - _off);
            _off = end + 4;
            return ReadStatus::Ok;
        }
        if (available() > max_head) return ReadStatus::TooLarge;
        ReadStatus st = fill();
        if (st != ReadStatus::Ok) return st;
    }
}

ReadStatus StreamReader::read_exact(std::size_t n, std::string& out) {
    while (available() < n) {
        ReadStatus st = fill();
        if (st == ReadStatus::Closed) return ReadStatus::Malformed; // truncated
        if (st != ReadStatus::Ok) return st;
    }
    out.append(_buf, _off, n);
    _off += n;
    return ReadStatus::Ok;
}

ReadStatus StreamReader::read_line(std::string& line, std::size_t max_line) {
    while (true) {
        std::size_t end = _buf.find("\r\n", _off);
        if (end != std::string::npos) {
            if (end - _off > max_line) return ReadStatus::TooLarge;
            line.assign(_buf, _off, end - _off);
            _off = end + 2;
            return ReadStatus::Ok;
        }
        if (available() > max_line) return ReadStatus::TooLarge;
        ReadStatus st = fill();
        if (st == ReadStatus::Closed) return ReadStatus::Malformed;
        if (st != ReadStatus::Ok) return st;
    }
}

ReadStatus StreamReader::read_to_close(std::string& out, std::size_t max_total) {
    while (true) {
        if (out.size() + available() > max_total) return ReadStatus::TooLarge;
        out.append(_buf, _off, available());
        _off = _buf.size();
        ReadStatus st = fill();
        if (st == ReadStatus::Closed) return ReadStatus::Ok;
        if (st != ReadStatus::Ok) return st;
    }
}

ReadStatus StreamReader::read_chunked(std::string& out, std::size_t max_body) {
    std::string line;
    while (true) {
        ReadStatus st = read_line(line, 1024);
        if (st != ReadStatus::Ok) return st;

        // chunk-size [; chunk-ext]
        std::string size_s = line.substr(0, line.find(';'));
        trim_inplace(size_s);
        if (size_s.empty() || size_s.size() > 16) return ReadStatus::Malformed;
        std::size_t chunk = 0;
        for (char c : size_s) {
            int h = hexval(c);
            if (h < 0) return ReadStatus::Malformed;
            chunk = (chunk << 4) | static_cast<std::size_t>(h);
        }

        if (chunk == 0) {
            // Trailer section: discard fields up to the empty line.
            while (true) {
                st = read_line(line, 8192);
                if (st != ReadStatus::Ok) return st;
                if (line.empty()) return ReadStatus::Ok;
            }
        }

        if (chunk > max_body || out.size() > max_body - chunk) return ReadStatus::TooLarge;
        st = read_exact(chunk, out);
        if (st != ReadStatus::Ok) return st;
        st = read_line(line, 2);
        if (st == ReadStatus::TooLarge || (st == ReadStatus::Ok && !line.empty())) {
            return ReadStatus::Malformed;
        }
        if (st != ReadStatus::Ok) return st;
    }
}

ReadStatus StreamReader::read_body(BodyFraming framing, std::size_t length,
                                   std::size_t max_body, std::string& out)
{
    out.clear();
    switch (framing) {
    case BodyFraming::None:
        return ReadStatus::Ok;
    case BodyFraming::Length:
        if (length > max_body) return ReadStatus::TooLarge;
        return read_exact(length, out);
    case BodyFraming::Chunked:
        return read_chunked(out, max_body);
    case BodyFraming::UntilClose:
        return read_to_close(out, max_body);
    }
    return ReadStatus::Malformed;
}

namespace {

// Shared Content-Length / Transfer-Encoding rules (RFC 9112 6.3).
ReadStatus framing_from_headers(const kg::HeaderList& headers, BodyFraming& framing,
                                std::size_t& length, BodyFraming no_length_default)
{
    std::string te;
    bool have_te = false;
    bool have_cl = false;
    std::size_t cl = 0;
    for (const auto& kv : headers) {
        if (iequals(kv.first, "Transfer-Encoding")) {
            if (have_te) te += ", ";
            te += kv.second;
            have_te = true;
        } else if (iequals(kv.first, "Content-Length")) {
            std::size_t v = 0;
            if (!parse_size(kv.second, v)) return ReadStatus::Malformed;
            if (have_cl && v != cl) return ReadStatus::Malformed;
            cl = v;
            have_cl = true;
        }
    }

    if (have_te) {
        if (have_cl) return ReadStatus::Malformed; // request smuggling guard
        std::string last = te.substr(te.rfind(',') == std::string::npos ? 0 : te.rfind(',') + 1);
        trim_inplace(last);
        if (!iequals(last, "chunked")) {
            if (no_length_default == BodyFraming::UntilClose) {
                framing = BodyFraming::UntilClose;
                return ReadStatus::Ok;
            }
            return ReadStatus::Malformed;
        }
        framing = BodyFraming::Chunked;
        return ReadStatus::Ok;
    }
    if (have_cl) {
        framing = cl ? BodyFraming::Length : BodyFraming::None;
        length  = cl;
        return ReadStatus::Ok;
    }
    framing = no_length_default;
    return ReadStatus::Ok;
}

} // namespace

ReadStatus request_framing(const kg::HeaderList& headers, BodyFraming& framing,
                           std::size_t& length)
{
    length = 0;
    return framing_from_headers(headers, framing, length, BodyFraming::None);
}

ReadStatus response_framing(const std::string& method, int status_code,
                            const kg::HeaderList& headers, BodyFraming& framing,
                            std::size_t& length)
{
    length = 0;
    if (method == "HEAD" || (status_code >= 100 && status_code < 200) ||
        status_code == 204 || status_code == 304) {
        framing = BodyFraming::None;
        return ReadStatus::Ok;
    }
    return framing_from_headers(headers, framing, length, BodyFraming::UntilClose);
}

bool write_response(Stream& s, const kg::HttpResponse& r, bool keep_alive,
                    const std::string& extra, bool head_only)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << r.status_code << " "
        << (r.status_text.empty() ? reason_phrase(r.status_code) : r.status_text) << "\r\n";
    // A relayed HEAD carries no body; its Content-Length describes the GET entity.
    std::string head_length;
    if (head_only && r.body.empty()) {
        for (const auto& kv : r.headers) {
            if (iequals(kv.first, "Content-Length")) head_length = kv.second;
        }
    }
    for (const auto& kv : r.headers) {
        if (iequals(kv.first, "Content-Length") || iequals(kv.first, "Transfer-Encoding") ||
            iequals(kv.first, "Connection") || iequals(kv.first, "Keep-Alive")) {
            continue;
        }
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << extra;
    const bool bodiless = (r.status_code >= 100 && r.status_code < 200) ||
                          r.status_code == 204 || r.status_code == 304;
    if (!bodiless) {
        if (!head_length.empty()) {
            oss << "Content-Length: " << head_length << "\r\n";
        } else if (!head_only || !r.body.empty()) {
            oss << "Content-Length: " << r.body.size() << "\r\n";
        }
    }
    oss << (keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
    oss << "\r\n";
    const std::string h = oss.str();
    if (!s.write_all(h.data(), h.size())) return false;
    if (head_only || bodiless || r.body.empty()) return true;
    return s.write_all(r.body.data(), r.body.size());
}

bool write_request(Stream& s, const std::string& method, const std::string& target,
                   const kg::HeaderList& headers, const std::string& body)
{
    std::ostringstream oss;
    oss << method << " " << target << " HTTP/1.1\r\n";
    for (const auto& kv : headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    if (!body.empty() || (method != "GET" && method != "HEAD" && method != "DELETE" &&
                          method != "OPTIONS")) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }
    oss << "\r\n";
    const std::string h = oss.str();
    if (!s.write_all(h.data(), h.size())) return false;
    if (body.empty()) return true;
    return s.write_all(body.data(), body.size());
}

} // namespace kg::internal
