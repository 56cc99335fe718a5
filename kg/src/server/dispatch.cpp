/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/internal/dispatch.hpp"
#include "kg/internal/http_parser.hpp"
#include "kg/internal/utils.hpp"
#include "kg/log.hpp"

#include <cstdio>
#include <exception>

namespace kg::internal {

// Longest accepted request head (request line + headers).
static constexpr std::size_t kMaxHead = 64 * 1024;

// --- HTTP/1.1 keep-alive helpers ---

static bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

static bool should_keep_alive(const kg::HttpRequest& R) {
    const std::string conn = hdr_ci(R, "Connection");
    if (is_http11(R.httpver)) {
        return !has_token_ci(conn, "close");
    }
    return has_token_ci(conn, "keep-alive");
}

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    return out;
}

std::string make_error_body(const kg::GatewayConfig& cfg, const std::string& reason,
                            const std::string& detail)
{
    if (cfg.redact_errors) return R"({"status":"ERROR"})";
    std::string body = std::string(R"({"status":"ERROR","reason":")") + reason + "\"";
    if (!detail.empty()) body += R"(,"detail":")" + json_escape(detail) + "\"";
    return body + "}";
}

static kg::HttpResponse json_response(int sc, std::string body) {
    kg::HttpResponse r;
    r.status_code = sc;
    r.status_text = reason_phrase(sc);
    r.headers.emplace_back("Content-Type", "application/json");
    r.body = std::move(body);
    return r;
}

static const char* failure_reason(kg::TransportError kind) {
    switch (kind) {
    case kg::TransportError::Timeout:  return "UPSTREAM_TIMEOUT";
    case kg::TransportError::Protocol: return "UPSTREAM_PROTOCOL";
    default:                           return "UPSTREAM_CONNECT";
    }
}

// "/proxy" and "/proxy/..." belong to prefix "/proxy"; "/proxyx" does not.
static bool match_prefix(const std::string& path, std::string prefix, std::string& sub) {
    while (prefix.size() > 1 && prefix.back() == '/') prefix.pop_back();
    if (prefix == "/") {
        sub = path;
        return true;
    }
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    if (path.size() > prefix.size() && path[prefix.size()] != '/') return false;
    sub = path.substr(prefix.size());
    return true;
}

// --- Per-request dispatcher ---

kg::HttpResponse dispatch_request(const kg::GatewayConfig& cfg,
                                  const std::string& peer_ip,
                                  const kg::HttpRequest& R,
                                  kg::ForwardingGateway& gateway)
{
    if (R.path == "/health" && (R.method == "GET" || R.method == "HEAD")) {
        return json_response(200, R"({"status":"OK"})");
    }

    std::string sub;
    if (!match_prefix(R.path, cfg.route_prefix, sub)) {
        return json_response(404, make_error_body(cfg, "NOT_FOUND"));
    }

    kg::ForwardResult res;
    try {
        res = gateway.forward(R, sub);
    } catch (const std::exception& e) {
        kg::log_line(std::string("[500] ip=") + peer_ip + " " + R.method + " " + R.path +
                     " error=" + e.what());
        return json_response(500, make_error_body(cfg, "INTERNAL_ERROR"));
    }

    switch (res.kind) {
    case kg::ForwardResult::Kind::Relayed:
        kg::log_line("[" + std::to_string(res.response.status_code) + "] ip=" + peer_ip + " " +
                     R.method + " " + R.path + " key=" + kg::key_fingerprint(res.key));
        return std::move(res.response);

    case kg::ForwardResult::Kind::RateLimited: {
        const long long wait = static_cast<long long>(res.retry_after.count());
        kg::log_line("[429] ip=" + peer_ip + " " + R.method + " " + R.path +
                     " reason=ALL_KEYS_RATE_LIMITED retry_after=" + std::to_string(wait) + "s");
        kg::HttpResponse r = json_response(429, make_error_body(cfg, "ALL_KEYS_RATE_LIMITED"));
        r.headers.emplace_back("Retry-After", std::to_string(wait));
        return r;
    }

    case kg::ForwardResult::Kind::UpstreamError: {
        const int sc = res.failure.kind == kg::TransportError::Timeout ? 504 : 502;
        const char* reason = failure_reason(res.failure.kind);
        kg::log_line("[" + std::to_string(sc) + "] ip=" + peer_ip + " " + R.method + " " + R.path +
                     " key=" + kg::key_fingerprint(res.key) + " reason=" + reason);
        return json_response(sc, make_error_body(cfg, reason, res.failure.detail));
    }
    }
    return json_response(500, make_error_body(cfg, "INTERNAL_ERROR"));
}

// --- Connection loop ---

static void send_error_and_close(Stream& s, const kg::GatewayConfig& cfg,
                                 int sc, const char* reason)
{
    (void)write_response(s, json_response(sc, make_error_body(cfg, reason)),
                         /*keep_alive=*/false, std::string(), /*head_only=*/false);
}

void serve_stream(Stream& s, const kg::GatewayConfig& cfg,
                  const std::string& peer_ip, kg::ForwardingGateway& gateway)
{
    StreamReader reader(s);
    int served = 0;
    while (served < cfg.ka_max) {
        std::string head;
        ReadStatus st = reader.read_head(head, kMaxHead);
        if (st == ReadStatus::TooLarge) {
            kg::log_line("[431] ip=" + peer_ip + " reason=HEADERS_TOO_LARGE");
            send_error_and_close(s, cfg, 431, "HEADERS_TOO_LARGE");
            return;
        }
        if (st != ReadStatus::Ok) return; // closed, idle timeout or socket error

        kg::HttpRequest R;
        if (!parse_request_head(head, R)) {
            kg::log_line("[400] ip=" + peer_ip + " reason=BAD_REQUEST");
            send_error_and_close(s, cfg, 400, "BAD_REQUEST");
            return;
        }

        BodyFraming framing = BodyFraming::None;
        std::size_t length = 0;
        if (request_framing(R.headers, framing, length) != ReadStatus::Ok) {
            kg::log_line("[400] ip=" + peer_ip + " reason=BAD_FRAMING");
            send_error_and_close(s, cfg, 400, "BAD_FRAMING");
            return;
        }
        if (framing == BodyFraming::Length && length > cfg.max_body) {
            kg::log_line("[413] ip=" + peer_ip + " reason=BODY_TOO_LARGE");
            send_error_and_close(s, cfg, 413, "BODY_TOO_LARGE");
            return;
        }

        if (framing != BodyFraming::None && is_http11(R.httpver) &&
            has_token_ci(hdr_ci(R, "Expect"), "100-continue")) {
            static const char kContinue[] = "HTTP/1.1 100 Continue\r\n\r\n";
            if (!s.write_all(kContinue, sizeof(kContinue) - 1)) return;
        }

        st = reader.read_body(framing, length, cfg.max_body, R.body);
        if (st == ReadStatus::TooLarge) {
            kg::log_line("[413] ip=" + peer_ip + " reason=BODY_TOO_LARGE");
            send_error_and_close(s, cfg, 413, "BODY_TOO_LARGE");
            return;
        }
        if (st == ReadStatus::Malformed) {
            kg::log_line("[400] ip=" + peer_ip + " reason=BAD_BODY");
            send_error_and_close(s, cfg, 400, "BAD_BODY");
            return;
        }
        if (st != ReadStatus::Ok) return;

        ++served;
        const bool ka = should_keep_alive(R) && served < cfg.ka_max;
        const kg::HttpResponse resp = dispatch_request(cfg, peer_ip, R, gateway);

        std::string extra;
        if (ka) {
            extra = "Keep-Alive: timeout=" + std::to_string(cfg.ka_timeout_sec) +
                    ", max=" + std::to_string(cfg.ka_max - served) + "\r\n";
        }
        if (!write_response(s, resp, ka, extra, R.method == "HEAD")) return;
        if (!ka) return;
    }
}

} // namespace kg::internal
