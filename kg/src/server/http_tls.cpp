/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/gateway_config.hpp"
#include "kg/forwarding_gateway.hpp"
#include "kg/log.hpp"
#include "kg/internal/dispatch.hpp"
#include "kg/internal/http_io.hpp"
#include "kg/internal/tls_ctx.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>

namespace kg::internal {

namespace {

// Server-side TLS session over a blocking socket with kernel timeouts.
class TlsStream final : public Stream {
public:
    explicit TlsStream(SSL* ssl) : _ssl(ssl) {}

    long read_some(char* d, std::size_t len) override {
        _timed_out = false;
        ERR_clear_error();
        int n = SSL_read(_ssl, d, static_cast<int>(std::min<std::size_t>(len, 1u << 30)));
        if (n > 0) return n;
        const int e = SSL_get_error(_ssl, n);
        if (e == SSL_ERROR_ZERO_RETURN) return 0;
        _timed_out = (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_SYSCALL) &&
                     (errno == EAGAIN || errno == EWOULDBLOCK);
        if (e == SSL_ERROR_SYSCALL && !_timed_out && n == 0) return 0;
        return -1;
    }

    bool write_all(const char* d, std::size_t len) override {
        _timed_out = false;
        std::size_t off = 0;
        while (off < len) {
            ERR_clear_error();
            int n = SSL_write(_ssl, d + off, static_cast<int>(std::min<std::size_t>(len - off, 1u << 30)));
            if (n <= 0) {
                const int e = SSL_get_error(_ssl, n);
                _timed_out = (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_SYSCALL) &&
                             (errno == EAGAIN || errno == EWOULDBLOCK);
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

    bool timed_out() const override { return _timed_out; }

private:
    SSL* _ssl;
    bool _timed_out = false;
};

} // namespace

// --- Exported entry point for server.cpp ---

void handle_connection_tls(int fd,
                           const kg::GatewayConfig& cfg,
                           const std::string& peer_ip,
                           kg::internal::TlsContext& tls,
                           kg::ForwardingGateway& gateway)
{
    // Kernel timeouts also bound the handshake.
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    SSL* ssl = SSL_new(tls.ctx());
    if (!ssl) { ::close(fd); return; }
    SSL_set_fd(ssl, fd);

    ERR_clear_error();
    if (SSL_accept(ssl) <= 0) {
        unsigned long e = ERR_peek_last_error();
        char buf[256] = {0};
        if (e) ERR_error_string_n(e, buf, sizeof(buf));
        ERR_clear_error();
        kg::log_line(std::string("[TLS] handshake failed ip=") + peer_ip +
                     (e ? std::string(" ") + buf : std::string()));
        SSL_free(ssl);
        ::close(fd);
        return;
    }

    TlsStream s(ssl);
    serve_stream(s, cfg, peer_ip, gateway);

    SSL_shutdown(ssl);
    SSL_free(ssl);
    ::close(fd);
}

} // namespace kg::internal
