/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <cstdint>
#include "kg/gateway_config.hpp"
#include "kg/key_selector.hpp"
#include "kg/rate_limiter.hpp"
#include "kg/upstream.hpp"
#include "kg/forwarding_gateway.hpp"
#include "kg/internal/tls_ctx.hpp"

namespace kg {

// Key-rotating HTTP(S) gateway: owns the rotation, the limiter, the upstream
// client and the listening socket.
class Server {
public:
    // Throws ConfigError if the core components cannot be built.
    explicit Server(const GatewayConfig& cfg);

    // Same, with a caller-supplied upstream (must outlive the server).
    Server(const GatewayConfig& cfg, UpstreamClient& upstream);

    // Stops accepting and waits for in-flight connections to finish.
    ~Server();

    // Blocking run: create socket, listen and accept until stop().
    void run();

    // Unblocks accept(); safe to call from another thread or a signal-driven loop.
    void stop();

    // Bound port once listening (useful with port 0), else 0.
    std::uint16_t port() const { return _bound_port.load(); }

private:
    GatewayConfig _cfg;
    KeySelector   _keys;      // refers to _cfg.credentials
    RateLimiter   _limiter;
    std::unique_ptr<HttpUpstream> _own_upstream;
    UpstreamClient& _upstream;
    ForwardingGateway _gateway;
    std::unique_ptr<internal::TlsContext> _tls; // only when cert + key are set

    std::atomic<bool> _stop{false};
    std::atomic<int>  _listen_fd{-1};
    std::atomic<std::uint16_t> _bound_port{0};

    std::mutex _conn_mtx;
    std::condition_variable _conn_cv;
    int _active = 0;

    Server(const GatewayConfig& cfg, std::unique_ptr<HttpUpstream> own,
           UpstreamClient* upstream);

    static std::unique_ptr<HttpUpstream> make_upstream(const GatewayConfig& cfg);

    // helpers
    int create_listen_socket();
    void accept_loop(int srv);
};

} // namespace kg
