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
#include <chrono>
#include "kg/gateway_config.hpp"
#include "kg/http_request.hpp"
#include "kg/http_response.hpp"
#include "kg/key_selector.hpp"
#include "kg/rate_limiter.hpp"
#include "kg/upstream.hpp"

namespace kg {

struct ForwardResult {
    enum class Kind {
        Relayed,          // upstream answered; `response` is verbatim
        RateLimited,      // every credential saturated; upstream not contacted
        UpstreamError     // transport failure after admission
    };

    Kind         kind = Kind::Relayed;
    HttpResponse response;            // Relayed only
    std::string  key;                 // admitted credential (Relayed / UpstreamError)
    UpstreamFailure failure;          // UpstreamError only
    std::chrono::seconds retry_after{0}; // RateLimited only
};

// Admission + forwarding for one inbound request:
// up to N rotation slots are tried against the limiter, the first admitted
// credential is injected and the request is sent upstream exactly once.
class ForwardingGateway {
public:
    // References must outlive the gateway. Throws ConfigError on a bad target URL.
    ForwardingGateway(const GatewayConfig& cfg, KeySelector& keys,
                      RateLimiter& limiter, UpstreamClient& upstream);

    // `sub_path` is the part of the inbound path below the route prefix.
    ForwardResult forward(const HttpRequest& in, const std::string& sub_path);

    // Forward with the inbound path taken as-is.
    ForwardResult forward(const HttpRequest& in) { return forward(in, in.path); }

    // Outbound request for `in` carrying `key` (exposed for tests).
    OutboundRequest build_outbound(const HttpRequest& in, const std::string& sub_path,
                                   const std::string& key) const;

private:
    const GatewayConfig& _cfg;
    KeySelector&    _keys;
    RateLimiter&    _limiter;
    UpstreamClient& _upstream;
    std::string     _base_path;
    std::string     _base_query;
};

} // namespace kg
