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
#include "kg/gateway_config.hpp"
#include "kg/http_request.hpp"
#include "kg/http_response.hpp"
#include "kg/forwarding_gateway.hpp"
#include "kg/internal/http_io.hpp"

namespace kg::internal {

// {"status":"ERROR","reason":...[,"detail":...]}; reason/detail dropped when redacting.
std::string make_error_body(const kg::GatewayConfig& cfg, const std::string& reason,
                            const std::string& detail = std::string());

// Route one parsed inbound request: /health, the forwarding prefix, or 404.
kg::HttpResponse dispatch_request(const kg::GatewayConfig& cfg,
                                  const std::string& peer_ip,
                                  const kg::HttpRequest& R,
                                  kg::ForwardingGateway& gateway);

// Keep-alive request loop on an accepted connection. Returns when the peer
// closes, times out, sends something unusable, or the per-connection limit is hit.
void serve_stream(Stream& s, const kg::GatewayConfig& cfg,
                  const std::string& peer_ip, kg::ForwardingGateway& gateway);

} // namespace kg::internal
