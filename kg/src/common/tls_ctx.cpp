/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#include "kg/internal/tls_ctx.hpp"
#include "kg/internal/tls_cli_ctx.hpp"
#include "kg/gateway_config.hpp"
#include <openssl/err.h>

namespace kg::internal {

TlsContext::TlsContext(const std::string& cert_file, const std::string& key_file) {
    OPENSSL_init_ssl(0, nullptr);

    _ctx = SSL_CTX_new(TLS_server_method());
    if (!_ctx) fail("SSL_CTX_new");

    // TLS1.2+
    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) fail("set_min_proto");

    if (SSL_CTX_use_certificate_chain_file(_ctx, cert_file.c_str()) != 1) {
        fail("use_certificate_chain_file");
    }
    if (SSL_CTX_use_PrivateKey_file(_ctx, key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        fail("use_privatekey_file");
    }
    if (SSL_CTX_check_private_key(_ctx) != 1) fail("check_private_key");

    // session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_SERVER);
    const unsigned char sid_ctx[] = "kg_gateway_sid_ctx_v1";
    SSL_CTX_set_session_id_context(_ctx, sid_ctx, (unsigned int)sizeof(sid_ctx));
}

TlsContext::~TlsContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsContext::fail(const char* where) {
    std::string why = log_openssl_errors(where);
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
    throw kg::ConfigError(std::string("TLS listener setup failed at ") + where +
                          (why.empty() ? "" : ": " + why));
}

} // namespace kg::internal
