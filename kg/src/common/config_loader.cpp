/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/config_loader.hpp"
#include "kg/internal/url.hpp"
#include "kg/internal/utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kg {

namespace {

const char* const kKnownVars[] = {
    "API_KEYS", "TARGET_API_URL", "RATE_LIMIT", "LISTEN_PORT", "ROUTE_PREFIX",
    "KEY_INJECTION", "KEY_HEADER", "KEY_PREFIX", "KEY_PARAM",
    "UPSTREAM_CONNECT_TIMEOUT", "UPSTREAM_TIMEOUT", "TLS_VERIFY_UPSTREAM",
    "TLS_CA_FILE", "LOG_FILE"
};

int to_int(const std::string& name, const std::string& v) {
    std::size_t n = 0;
    std::string t = v;
    internal::trim_inplace(t);
    if (!internal::parse_size(t, n) || n > 0x7fffffff) {
        throw ConfigError(name + ": expected a non-negative integer, got '" + v + "'");
    }
    return static_cast<int>(n);
}

bool to_bool(const std::string& name, const std::string& v) {
    const std::string l = internal::lower_copy(v);
    if (l == "1" || l == "true" || l == "yes" || l == "on")  return true;
    if (l == "0" || l == "false" || l == "no" || l == "off") return false;
    throw ConfigError(name + ": expected a boolean, got '" + v + "'");
}

} // namespace

void parse_dotenv(const std::string& text, EnvMap& out) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        internal::trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) {
            line.erase(0, 7);
            internal::trim_inplace(line);
        }
        std::size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string k = line.substr(0, eq), v = line.substr(eq + 1);
        internal::trim_inplace(k);
        internal::trim_inplace(v);
        if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
            v = v.substr(1, v.size() - 2);
        } else {
            // Unquoted: strip an inline " #comment"
            std::size_t hash = v.find(" #");
            if (hash != std::string::npos) {
                v.erase(hash);
                internal::trim_inplace(v);
            }
        }
        out.emplace(k, v);
    }
}

bool load_dotenv(const std::string& path, EnvMap& out) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    parse_dotenv(ss.str(), out);
    return true;
}

EnvMap process_env() {
    EnvMap env;
    for (const char* name : kKnownVars) {
        if (const char* v = std::getenv(name)) env[name] = v;
    }
    return env;
}

std::vector<std::string> split_credentials(const std::string& s) {
    std::vector<std::string> keys;
    std::size_t p = 0;
    while (p <= s.size()) {
        std::size_t semi = s.find(';', p);
        if (semi == std::string::npos) semi = s.size();
        std::string k = s.substr(p, semi - p);
        internal::trim_inplace(k);
        if (!k.empty()) keys.push_back(k);
        p = semi + 1;
    }
    return keys;
}

void apply_env(const EnvMap& env, GatewayConfig& cfg) {
    auto get = [&](const char* name, std::string& v) {
        auto it = env.find(name);
        if (it == env.end()) return false;
        v = it->second;
        return true;
    };

    std::string v;
    if (get("API_KEYS", v))        cfg.credentials = split_credentials(v);
    if (get("TARGET_API_URL", v))  { internal::trim_inplace(v); cfg.target_url = v; }
    if (get("RATE_LIMIT", v))      cfg.ceiling = to_int("RATE_LIMIT", v);
    if (get("LISTEN_PORT", v)) {
        int p = to_int("LISTEN_PORT", v);
        if (p < 1 || p > 65535) throw ConfigError("LISTEN_PORT: out of range");
        cfg.port = static_cast<uint16_t>(p);
    }
    if (get("ROUTE_PREFIX", v))    cfg.route_prefix = v;
    if (get("KEY_INJECTION", v)) {
        const std::string m = internal::lower_copy(v);
        if (m == "header")     cfg.inject = KeyInjection::Header;
        else if (m == "query") cfg.inject = KeyInjection::Query;
        else throw ConfigError("KEY_INJECTION: expected 'header' or 'query', got '" + v + "'");
    }
    if (get("KEY_HEADER", v))      cfg.key_header = v;
    if (get("KEY_PREFIX", v))      cfg.key_prefix = v;
    if (get("KEY_PARAM", v))       cfg.key_param = v;
    if (get("UPSTREAM_CONNECT_TIMEOUT", v)) cfg.upstream_connect_timeout_sec = to_int("UPSTREAM_CONNECT_TIMEOUT", v);
    if (get("UPSTREAM_TIMEOUT", v))         cfg.upstream_timeout_sec = to_int("UPSTREAM_TIMEOUT", v);
    if (get("TLS_VERIFY_UPSTREAM", v))      cfg.tls_verify_upstream = to_bool("TLS_VERIFY_UPSTREAM", v);
    if (get("TLS_CA_FILE", v))     cfg.tls_ca_file = v;
    if (get("LOG_FILE", v))        cfg.log_file = v;
}

void validate_config(const GatewayConfig& cfg) {
    if (cfg.credentials.empty()) {
        throw ConfigError("no API keys configured (API_KEYS, ';'-separated)");
    }
    for (const auto& k : cfg.credentials) {
        if (k.empty()) throw ConfigError("empty API key in credential list");
    }
    if (cfg.target_url.empty()) {
        throw ConfigError("target URL not configured (TARGET_API_URL)");
    }
    internal::Url u;
    if (!internal::parse_url(cfg.target_url, u)) {
        throw ConfigError("target URL is not an absolute http(s) URL: " + cfg.target_url);
    }
    if (cfg.ceiling <= 0)    throw ConfigError("rate limit must be > 0");
    if (cfg.window_sec <= 0) throw ConfigError("rate window must be > 0");
    if (cfg.route_prefix.empty() || cfg.route_prefix[0] != '/') {
        throw ConfigError("route prefix must start with '/'");
    }
    if (cfg.inject == KeyInjection::Header && cfg.key_header.empty()) {
        throw ConfigError("key header name is empty");
    }
    if (cfg.inject == KeyInjection::Query && cfg.key_param.empty()) {
        throw ConfigError("key query parameter name is empty");
    }
    if (cfg.tls_cert_file.empty() != cfg.tls_key_file.empty()) {
        throw ConfigError("TLS listener needs both a certificate and a key");
    }
    if (cfg.upstream_timeout_sec <= 0 || cfg.upstream_connect_timeout_sec <= 0) {
        throw ConfigError("upstream timeouts must be > 0");
    }
    if (cfg.ka_max <= 0 || cfg.ka_timeout_sec <= 0) {
        throw ConfigError("keep-alive limits must be > 0");
    }
}

} // namespace kg
