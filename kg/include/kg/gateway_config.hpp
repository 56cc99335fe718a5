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
#include <vector>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include "kg/types.hpp"

namespace kg {

// Raised while building the gateway from an unusable configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct GatewayConfig {
    // Core
    std::vector<std::string> credentials;   // non-empty, rotation order
    std::string target_url;                 // "https://host[:port]/base"
    int ceiling    = 15;                    // requests per key per window
    int window_sec = 60;

    // Listener
    uint16_t    port = 8000;
    std::string route_prefix = "/proxy";    // forwarded paths live under this
    std::string tls_cert_file;              // both set -> HTTPS listener
    std::string tls_key_file;
    size_t      max_body = 8*1024*1024;
    int         ka_timeout_sec = 5;
    int         ka_max         = 100;
    bool        redact_errors  = false;

    // Credential injection
    KeyInjection inject = KeyInjection::Header;
    std::string  key_header = "Authorization";
    std::string  key_prefix = "Bearer ";
    std::string  key_param  = "key";

    // Upstream client
    int         upstream_connect_timeout_sec = 10;
    int         upstream_timeout_sec         = 180;
    int         upstream_pool_size           = 16;   // idle keep-alive connections
    bool        tls_verify_upstream = true;
    std::string tls_ca_file;                         // empty: system trust store

    // Logging
    std::string log_file = "gateway.log";
};

} // namespace kg
