/*
 * Part of the KeyGate (KG) project.
 *
 * SPDX-FileCopyrightText: 2025 KeyGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of KeyGate (KG). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>

namespace kg::internal {

// Minimal TLS client context for upstream connections. Loads the system CA
// store or a custom CA file; peer verification can be switched off.
class TlsClientContext {
public:
    TlsClientContext(bool verify_peer, const std::string& ca_file);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool verify_peer() const { return _verify; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool     _verify = true;
};

// Drain the OpenSSL error queue into the log; returns the last error text.
std::string log_openssl_errors(const char* where);

} // namespace kg::internal
