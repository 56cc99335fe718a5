/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/forwarding_gateway.hpp"
#include "kg/log.hpp"
#include "kg/internal/http_parser.hpp"
#include "kg/internal/url.hpp"

namespace kg {

ForwardingGateway::ForwardingGateway(const GatewayConfig& cfg, KeySelector& keys,
                                     RateLimiter& limiter, UpstreamClient& upstream)
    : _cfg(cfg), _keys(keys), _limiter(limiter), _upstream(upstream)
{
    internal::Url u;
    if (!internal::parse_url(cfg.target_url, u)) {
        throw ConfigError("target URL is not an absolute http(s) URL: " + cfg.target_url);
    }
    _base_path  = u.path;
    _base_query = u.query;
}

OutboundRequest ForwardingGateway::build_outbound(const HttpRequest& in,
                                                  const std::string& sub_path,
                                                  const std::string& key) const
{
    OutboundRequest out;
    out.method  = in.method;
    out.headers = in.headers;
    out.body    = in.body;
    internal::strip_hop_by_hop(out.headers);

    std::string query = _base_query;
    if (!in.query.empty()) {
        query = query.empty() ? in.query : query + "&" + in.query;
    }

    if (_cfg.inject == KeyInjection::Header) {
        internal::set_header_ci(out.headers, _cfg.key_header, _cfg.key_prefix + key);
    } else {
        query = internal::set_query_param(query, _cfg.key_param, key);
    }

    out.target = internal::join_path(_base_path, sub_path);
    if (!query.empty()) out.target += "?" + query;
    return out;
}

ForwardResult ForwardingGateway::forward(const HttpRequest& in, const std::string& sub_path) {
    ForwardResult r;

    const std::string* admitted = nullptr;
    for (std::size_t attempt = 0; attempt < _keys.size(); ++attempt) {
        const std::string& candidate = _keys.next();
        if (_limiter.try_admit(candidate)) {
            admitted = &candidate;
            break;
        }
    }

    if (!admitted) {
        r.kind        = ForwardResult::Kind::RateLimited;
        r.retry_after = _limiter.retry_after();
        return r;
    }

    r.key = *admitted;
    const OutboundRequest out = build_outbound(in, sub_path, r.key);

    // One upstream attempt per inbound request; quota already consumed stays consumed.
    if (!_upstream.send(out, r.response, r.failure)) {
        r.kind     = ForwardResult::Kind::UpstreamError;
        r.response = HttpResponse{};
        kg::log_line("[UPSTREAM] " + in.method + " " + out.target.substr(0, out.target.find('?')) +
                     " key=" + key_fingerprint(r.key) + " failed: " + r.failure.detail);
        return r;
    }
    r.kind = ForwardResult::Kind::Relayed;
    return r;
}

} // namespace kg
