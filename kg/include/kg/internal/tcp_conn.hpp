/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include "kg/types.hpp"

namespace kg::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    // Open TCP connection to host:port with bounded connect time and
    // per-operation I/O timeouts. On failure `err`/`detail` say why.
    bool open(const std::string& host, std::uint16_t port,
              int connect_timeout_sec, int io_timeout_sec,
              kg::TransportError& err, std::string& detail);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    long recv_some(char* d, std::size_t len);

    // errno of the last failed send/recv was EAGAIN (SO_*TIMEO expired).
    bool timed_out() const { return _timed_out; }

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

private:
    int  _fd = -1;
    bool _timed_out = false;
};

} // namespace kg::internal
