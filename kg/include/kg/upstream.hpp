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
#include <memory>
#include <cstddef>
#include "kg/types.hpp"
#include "kg/http_response.hpp"

namespace kg {

// Request as it leaves the gateway. `target` is origin-form ("/v1/x?y=1");
// the client adds Host and Content-Length.
struct OutboundRequest {
    std::string method;
    std::string target;
    HeaderList  headers;
    std::string body;
};

struct UpstreamFailure {
    TransportError kind = TransportError::None;
    std::string    detail;
};

// Capability used by the gateway to reach the upstream.
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;

    // true: `out` holds whatever the upstream answered (any status).
    // false: transport failure, described by `err`.
    virtual bool send(const OutboundRequest& req, HttpResponse& out,
                      UpstreamFailure& err) = 0;
};

struct UpstreamOptions {
    std::string url;                   // absolute http(s) URL; only scheme/host/port are used
    int         connect_timeout_sec = 10;
    int         io_timeout_sec      = 180;
    int         pool_size           = 16;   // idle keep-alive connections kept
    int         ka_max              = 100;  // requests per connection before re-open
    std::size_t max_body            = 64*1024*1024;
    bool        tls_verify_peer     = true;
    std::string tls_ca_file;
};

// HTTP/1.1 client over plain TCP or TLS (OpenSSL) with a keep-alive pool.
// Thread-safe; concurrent send() calls use distinct connections.
class HttpUpstream : public UpstreamClient {
public:
    // Throws ConfigError if the URL is unusable or the TLS context fails.
    explicit HttpUpstream(const UpstreamOptions& opt);
    ~HttpUpstream() override;

    bool send(const OutboundRequest& req, HttpResponse& out,
              UpstreamFailure& err) override;

    // Idle pooled connections (for tests).
    std::size_t idle_connections() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace kg
