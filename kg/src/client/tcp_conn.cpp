/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/internal/tcp_conn.hpp"
#include "kg/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace kg::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   int connect_timeout_sec, int io_timeout_sec,
                   kg::TransportError& err, std::string& detail)
{
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err    = kg::TransportError::Connect;
        detail = std::string("getaddrinfo: ") + gai_strerror(rc);
        kg::log_line("[TCP] " + detail);
        return false;
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    bool any_timeout = false;
    int last_errno = 0;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0) { last_errno = errno; ::close(s); continue; }
        if (fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) { last_errno = errno; ::close(s); continue; }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd      = s;
            pfd.events  = POLLOUT;
            pfd.revents = 0;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr == 0) {
                any_timeout = true;
                ::close(s);
                continue;
            }
            if (pr < 0 || !(pfd.revents & (POLLOUT | POLLERR | POLLHUP))) {
                last_errno = errno;
                ::close(s);
                continue;
            }
            // Check the actual connect() status
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr ? soerr : errno;
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{io_timeout_sec, 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        if (any_timeout && last_errno == 0) {
            err    = kg::TransportError::Timeout;
            detail = "connect to " + host + ":" + std::to_string(port) + " timed out";
        } else {
            err    = kg::TransportError::Connect;
            detail = "connect to " + host + ":" + std::to_string(port) + " failed: " +
                     (last_errno ? std::strerror(last_errno) : "timed out");
        }
        kg::log_line("[TCP] " + detail);
        return false;
    }

    _fd = s_ok;
    _timed_out = false;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            _timed_out = (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK));
            return false;
        }
        off += (std::size_t)n;
    }
    return true;
}

long TcpConn::recv_some(char* d, std::size_t len) {
    while (true) {
        ssize_t n = ::recv(_fd, d, len, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) _timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
        return static_cast<long>(n);
    }
}

} // namespace kg::internal
