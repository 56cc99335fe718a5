/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/server.hpp"
#include "kg/log.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <chrono>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

// Forward declarations of per-connection handlers provided by http_* modules.
namespace kg::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
void handle_connection_plain(int fd,
                             const kg::GatewayConfig& cfg,
                             const std::string& peer_ip,
                             kg::ForwardingGateway& gateway);

// Handles a single HTTPS connection (keep-alive is managed inside).
void handle_connection_tls(int fd,
                           const kg::GatewayConfig& cfg,
                           const std::string& peer_ip,
                           kg::internal::TlsContext& tls,
                           kg::ForwardingGateway& gateway);

} // namespace kg::internal

namespace kg {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

static const char* injection_name(KeyInjection k) {
    return k == KeyInjection::Query ? "query" : "header";
}

// ---------- Server impl ----------

std::unique_ptr<HttpUpstream> Server::make_upstream(const GatewayConfig& cfg) {
    UpstreamOptions opt;
    opt.url                 = cfg.target_url;
    opt.connect_timeout_sec = cfg.upstream_connect_timeout_sec;
    opt.io_timeout_sec      = cfg.upstream_timeout_sec;
    opt.pool_size           = cfg.upstream_pool_size;
    opt.tls_verify_peer     = cfg.tls_verify_upstream;
    opt.tls_ca_file         = cfg.tls_ca_file;
    return std::make_unique<HttpUpstream>(opt);
}

Server::Server(const GatewayConfig& cfg)
    : Server(cfg, make_upstream(cfg), nullptr)
{}

Server::Server(const GatewayConfig& cfg, UpstreamClient& upstream)
    : Server(cfg, nullptr, &upstream)
{}

Server::Server(const GatewayConfig& cfg, std::unique_ptr<HttpUpstream> own,
               UpstreamClient* upstream)
    : _cfg(cfg),
      _keys(_cfg.credentials),
      _limiter(_cfg.credentials, _cfg.ceiling, std::chrono::seconds(_cfg.window_sec)),
      _own_upstream(std::move(own)),
      _upstream(upstream ? *upstream : *_own_upstream),
      _gateway(_cfg, _keys, _limiter, _upstream)
{
    if (!_cfg.tls_cert_file.empty() && !_cfg.tls_key_file.empty()) {
        _tls = std::make_unique<internal::TlsContext>(_cfg.tls_cert_file, _cfg.tls_key_file);
    }
}

Server::~Server() {
    stop();
    std::unique_lock<std::mutex> lk(_conn_mtx);
    _conn_cv.wait(lk, [this] { return _active == 0; });
}

void Server::stop() {
    // Set stop flag and wake accept(); run() closes the socket on its way out.
    _stop.store(true);
    const int fd = _listen_fd.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        kg::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(_cfg.port);

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        kg::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed on port " + std::to_string(_cfg.port));
    }
    if (listen(srv, 512) < 0) {
        kg::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }

    sockaddr_in bound{};
    socklen_t bl = sizeof(bound);
    if (::getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &bl) == 0) {
        _bound_port.store(ntohs(bound.sin_port));
    } else {
        _bound_port.store(_cfg.port);
    }
    return srv;
}

void Server::run() {
    // Basic boot log
    kg::log_line("[INFO] KeyGate starting...");
    kg::log_line("[INFO] Target: " + _cfg.target_url + " prefix=" + _cfg.route_prefix);
    kg::log_line("[INFO] Keys: " + std::to_string(_keys.size()) +
                 ", limit=" + std::to_string(_cfg.ceiling) +
                 " per " + std::to_string(_cfg.window_sec) + "s each");
    if (_cfg.inject == KeyInjection::Header) {
        kg::log_line(std::string("[INFO] Key injection: ") + injection_name(_cfg.inject) +
                     " " + _cfg.key_header);
    } else {
        kg::log_line(std::string("[INFO] Key injection: ") + injection_name(_cfg.inject) +
                     " ?" + _cfg.key_param + "=");
    }
    if (!_cfg.tls_verify_upstream) {
        kg::log_line("[WARN] Upstream TLS verification DISABLED");
    }
    if (_cfg.redact_errors) {
        kg::log_line("[INFO] Error redaction: ENABLED");
    }
    kg::log_line("[INFO] KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));

    int srv = create_listen_socket();
    _listen_fd.store(srv);
    kg::log_line(std::string("[INFO] Listening ") + (_tls ? "HTTPS" : "HTTP") +
                 " on :" + std::to_string(_bound_port.load()));

    // stop() may have run before the fd was published.
    if (!_stop.load()) {
        accept_loop(srv);
    }

    _listen_fd.store(-1);
    ::close(srv);
    _bound_port.store(0);
    kg::log_line("[INFO] KeyGate stopped");
}

void Server::accept_loop(int srv) {
    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            // transient error (EMFILE, ECONNABORTED, ...); keep serving
            kg::log_line(std::string("[TCP] accept() failed: ") + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        {
            std::lock_guard<std::mutex> lk(_conn_mtx);
            ++_active;
        }
        // Detach a per-connection handler; it closes the fd.
        try {
            std::thread([this, fd, peer]() {
                if (_tls) {
                    internal::handle_connection_tls(fd, _cfg, peer, *_tls, _gateway);
                } else {
                    internal::handle_connection_plain(fd, _cfg, peer, _gateway);
                }
                std::lock_guard<std::mutex> lk(_conn_mtx);
                if (--_active == 0) _conn_cv.notify_all();
            }).detach();
        } catch (const std::system_error& e) {
            // No handler thread: drop this connection and keep accepting.
            ::close(fd);
            kg::log_line(std::string("[TCP] cannot start handler for ") + peer + ": " + e.what());
            std::lock_guard<std::mutex> lk(_conn_mtx);
            if (--_active == 0) _conn_cv.notify_all();
        }
    }
}

} // namespace kg
