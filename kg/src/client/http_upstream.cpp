/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/upstream.hpp"
#include "kg/gateway_config.hpp"
#include "kg/log.hpp"

#include "kg/internal/http_io.hpp"
#include "kg/internal/http_parser.hpp"
#include "kg/internal/tcp_conn.hpp"
#include "kg/internal/tls_cli_ctx.hpp"
#include "kg/internal/url.hpp"
#include "kg/internal/utils.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <limits>
#include <mutex>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>

namespace {

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

// TLS handshake on a non-blocking socket with a bounded deadline.
// Handles WANT_READ/WANT_WRITE; anything else is a hard failure.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec,
                                             kg::UpstreamFailure& err)
{
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(std::max(1, timeout_sec));
    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) return true;

        const int ssl_err = ::SSL_get_error(ssl, rc);
        const bool want_io = ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE ||
                             (ssl_err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EINTR));
        if (!want_io) {
            const std::string why = kg::internal::log_openssl_errors("SSL_connect");
            err.kind   = kg::TransportError::Connect;
            err.detail = "TLS handshake failed" + (why.empty() ? std::string() : ": " + why);
            return false;
        }

        const int ms = remaining_ms(deadline);
        if (ms <= 0) {
            err.kind   = kg::TransportError::Timeout;
            err.detail = "TLS handshake timed out";
            return false;
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = (ssl_err == SSL_ERROR_WANT_WRITE) ? POLLOUT : POLLIN;
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, ms);
        } while (pr < 0 && errno == EINTR);
        if (pr == 0) {
            err.kind   = kg::TransportError::Timeout;
            err.detail = "TLS handshake timed out";
            return false;
        }
        if (pr < 0) {
            err.kind   = kg::TransportError::Connect;
            err.detail = std::string("poll: ") + std::strerror(errno);
            return false;
        }
    }
}

} // namespace

namespace kg {

namespace {

// One upstream connection, plain or TLS.
class UpstreamConn final : public internal::Stream {
public:
    ~UpstreamConn() override { close(); }

    bool open(const internal::Url& url, const UpstreamOptions& opt,
              internal::TlsClientContext* tls, UpstreamFailure& err)
    {
        if (!_tcp.open(url.host, url.port, opt.connect_timeout_sec, opt.io_timeout_sec,
                       err.kind, err.detail)) {
            return false;
        }
        if (!url.tls) return true;

        SSL* s = SSL_new(tls->ctx());
        if (!s) {
            err.kind   = TransportError::Connect;
            err.detail = "SSL_new failed";
            _tcp.close();
            return false;
        }
        _ssl.reset(s);
        SSL_set_fd(s, _tcp.fd());
        SSL_set_tlsext_host_name(s, url.host.c_str());

        // Chain validation alone does not check the name; configure it explicitly.
        if (tls->verify_peer()) {
            unsigned char tmp[16];
            const bool is_ip = ::inet_pton(AF_INET, url.host.c_str(), tmp) == 1 ||
                               ::inet_pton(AF_INET6, url.host.c_str(), tmp) == 1;
            const int ok = is_ip ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(s), url.host.c_str())
                                 : SSL_set1_host(s, url.host.c_str());
            if (ok != 1) {
                err.kind   = TransportError::Connect;
                err.detail = "cannot configure TLS peer name check";
                close();
                return false;
            }
        }

        const int fd = _tcp.fd();
        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            err.kind   = TransportError::Connect;
            err.detail = "fcntl(O_NONBLOCK) failed";
            close();
            return false;
        }
        const bool hs_ok = ssl_connect_with_deadline(s, fd, opt.connect_timeout_sec, err);
        (void)::fcntl(fd, F_SETFL, old_flags);
        if (!hs_ok) {
            close();
            return false;
        }

        if (tls->verify_peer()) {
            const long vr = SSL_get_verify_result(s);
            if (vr != X509_V_OK) {
                err.kind   = TransportError::Connect;
                err.detail = std::string("TLS verify failed: ") + X509_verify_cert_error_string(vr);
                close();
                return false;
            }
        }
        return true;
    }

    void close() {
        if (_ssl) {
            SSL_shutdown(_ssl.get());
            _ssl.reset();
        }
        _tcp.close();
    }

    long read_some(char* d, std::size_t len) override {
        if (!_ssl) return _tcp.recv_some(d, len);
        _ssl_timeout = false;
        ::ERR_clear_error();
        int n = SSL_read(_ssl.get(), d, static_cast<int>(std::min<std::size_t>(len, 1u << 30)));
        if (n > 0) return n;
        const int e = SSL_get_error(_ssl.get(), n);
        if (e == SSL_ERROR_ZERO_RETURN) return 0;
        _ssl_timeout = (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_SYSCALL) &&
                       (errno == EAGAIN || errno == EWOULDBLOCK);
        // Peer closed without close_notify: treat as EOF.
        if (e == SSL_ERROR_SYSCALL && !_ssl_timeout && n == 0) return 0;
        return -1;
    }

    bool write_all(const char* d, std::size_t len) override {
        if (!_ssl) return _tcp.send_all(d, len);
        _ssl_timeout = false;
        std::size_t off = 0;
        while (off < len) {
            ::ERR_clear_error();
            int n = SSL_write(_ssl.get(), d + off, static_cast<int>(std::min<std::size_t>(len - off, 1u << 30)));
            if (n <= 0) {
                const int e = SSL_get_error(_ssl.get(), n);
                _ssl_timeout = (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_SYSCALL) &&
                               (errno == EAGAIN || errno == EWOULDBLOCK);
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

    bool timed_out() const override { return _ssl ? _ssl_timeout : _tcp.timed_out(); }

    int served = 0;

private:
    internal::TcpConn _tcp;
    std::unique_ptr<SSL, void(*)(SSL*)> _ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};
    bool _ssl_timeout = false;
};

TransportError classify(internal::ReadStatus st) {
    return st == internal::ReadStatus::Timeout ? TransportError::Timeout : TransportError::Protocol;
}

const char* describe(internal::ReadStatus st) {
    switch (st) {
    case internal::ReadStatus::Closed:    return "upstream closed the connection";
    case internal::ReadStatus::Timeout:   return "upstream read timed out";
    case internal::ReadStatus::TooLarge:  return "upstream response too large";
    case internal::ReadStatus::Malformed: return "malformed upstream response";
    default:                              return "upstream read failed";
    }
}

} // namespace

struct HttpUpstream::Impl {
    UpstreamOptions opt;
    internal::Url   url;
    std::unique_ptr<internal::TlsClientContext> tls; // only for https

    mutable std::mutex mtx;
    std::deque<std::unique_ptr<UpstreamConn>> idle;

    std::unique_ptr<UpstreamConn> acquire(bool& reused, UpstreamFailure& err) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (!idle.empty()) {
                auto c = std::move(idle.front());
                idle.pop_front();
                reused = true;
                return c;
            }
        }
        reused = false;
        auto c = std::make_unique<UpstreamConn>();
        if (!c->open(url, opt, tls.get(), err)) return nullptr;
        return c;
    }

    void release(std::unique_ptr<UpstreamConn> c) {
        std::lock_guard<std::mutex> lk(mtx);
        if (static_cast<int>(idle.size()) < opt.pool_size) {
            idle.push_back(std::move(c));
        }
        // else: dropped and closed here
    }

    // One request/response on `c`. `received` reports bytes read from the
    // upstream, `keep` whether `c` may be reused.
    bool exchange(UpstreamConn& c, const OutboundRequest& req, HttpResponse& out,
                  UpstreamFailure& err, std::size_t& received, bool& keep)
    {
        keep = false;
        received = 0;

        HeaderList headers = req.headers;
        internal::set_header_ci(headers, "Host", url.host_header());

        if (!internal::write_request(c, req.method, req.target, headers, req.body)) {
            err.kind   = c.timed_out() ? TransportError::Timeout : TransportError::Connect;
            err.detail = c.timed_out() ? "upstream write timed out" : "upstream write failed";
            return false;
        }

        internal::StreamReader reader(c);
        std::string head;
        while (true) {
            internal::ReadStatus st = reader.read_head(head, 64 * 1024);
            received = reader.total_received();
            if (st != internal::ReadStatus::Ok) {
                err.kind   = classify(st);
                err.detail = describe(st);
                return false;
            }
            out = HttpResponse{};
            if (!internal::parse_response_head(head, out)) {
                err.kind   = TransportError::Protocol;
                err.detail = "malformed upstream status line or headers";
                return false;
            }
            // Skip interim responses (100 Continue, 103 Early Hints).
            if (out.status_code >= 200 || out.status_code == 101) break;
        }

        internal::BodyFraming framing = internal::BodyFraming::None;
        std::size_t length = 0;
        if (internal::response_framing(req.method, out.status_code, out.headers,
                                       framing, length) != internal::ReadStatus::Ok) {
            err.kind   = TransportError::Protocol;
            err.detail = "invalid upstream Content-Length / Transfer-Encoding";
            return false;
        }
        internal::ReadStatus st = reader.read_body(framing, length, opt.max_body, out.body);
        received = reader.total_received();
        if (st != internal::ReadStatus::Ok) {
            err.kind   = classify(st);
            err.detail = describe(st);
            return false;
        }

        ++c.served;
        keep = framing != internal::BodyFraming::UntilClose &&
               !internal::has_token_ci(internal::hdr_ci(out.headers, "Connection"), "close") &&
               c.served < opt.ka_max;
        return true;
    }
};

HttpUpstream::HttpUpstream(const UpstreamOptions& opt)
    : _p(std::make_unique<Impl>())
{
    _p->opt = opt;
    if (!internal::parse_url(opt.url, _p->url)) {
        throw ConfigError("upstream URL is not an absolute http(s) URL: " + opt.url);
    }
    if (_p->url.tls) {
        _p->tls = std::make_unique<internal::TlsClientContext>(opt.tls_verify_peer, opt.tls_ca_file);
    }
}

HttpUpstream::~HttpUpstream() = default;

bool HttpUpstream::send(const OutboundRequest& req, HttpResponse& out, UpstreamFailure& err) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        err = UpstreamFailure{};
        bool reused = false;
        auto conn = _p->acquire(reused, err);
        if (!conn) return false;

        std::size_t received = 0;
        bool keep = false;
        if (_p->exchange(*conn, req, out, err, received, keep)) {
            if (keep) _p->release(std::move(conn));
            return true;
        }
        // Only a pooled connection the upstream already closed (no byte of
        // response seen) is replaced; the request is sent once more.
        if (!reused || received > 0 || err.kind == TransportError::Timeout) return false;
        kg::log_line("[UPSTREAM] stale keep-alive connection (" + err.detail + "), reconnecting");
    }
    return false;
}

std::size_t HttpUpstream::idle_connections() const {
    std::lock_guard<std::mutex> lk(_p->mtx);
    return _p->idle.size();
}

} // namespace kg
