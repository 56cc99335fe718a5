/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/internal/tls_cli_ctx.hpp"
#include "kg/gateway_config.hpp"
#include "kg/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace kg::internal {

std::string log_openssl_errors(const char* where) {
    std::string last;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        last = buf;
        kg::log_line(std::string("[TLS] error at ") + where + ": " + buf);
    }
    return last;
}

TlsClientContext::TlsClientContext(bool verify_peer, const std::string& ca_file)
    : _verify(verify_peer)
{
    OPENSSL_init_ssl(0, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) {
        log_openssl_errors("SSL_CTX_new");
        throw ConfigError("TLS client context could not be created");
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        log_openssl_errors("set_min_proto");
    }

    // Trust store
    if (!ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, ca_file.c_str(), nullptr) != 1) {
            log_openssl_errors("load_verify_locations(CA)");
            SSL_CTX_free(_ctx);
            _ctx = nullptr;
            throw ConfigError("cannot load CA file: " + ca_file);
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_openssl_errors("set_default_verify_paths");
        }
    }

    SSL_CTX_set_verify(_ctx, _verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    // Enable client session cache for resumption
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

} // namespace kg::internal
