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
#include "kg/internal/dispatch.hpp"
#include "kg/internal/http_io.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>

namespace kg::internal {

namespace {

// Accepted TCP socket; deadlines come from SO_RCVTIMEO / SO_SNDTIMEO.
class PlainStream final : public Stream {
public:
    explicit PlainStream(int fd) : _fd(fd) {}

    long read_some(char* d, std::size_t len) override {
        _timed_out = false;
        while (true) {
            ssize_t n = ::recv(_fd, d, len, 0);
            if (n >= 0) return static_cast<long>(n);
            if (errno == EINTR) continue;
            _timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
            return -1;
        }
    }

    bool write_all(const char* d, std::size_t len) override {
        _timed_out = false;
        std::size_t off = 0;
        while (off < len) {
            ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                _timed_out = (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK));
                return false;
            }
            off += static_cast<std::size_t>(n);
        }
        return true;
    }

    bool timed_out() const override { return _timed_out; }

private:
    int  _fd;
    bool _timed_out = false;
};

} // namespace

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const kg::GatewayConfig& cfg,
                             const std::string& peer_ip,
                             kg::ForwardingGateway& gateway)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    PlainStream s(fd);
    serve_stream(s, cfg, peer_ip, gateway);
    ::close(fd);
}

} // namespace kg::internal
