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
#include <openssl/ssl.h>

namespace kg::internal {

// RAII wrapper over the listener's SSL_CTX.
class TlsContext {
public:
    // Throws ConfigError if the certificate or key cannot be loaded.
    TlsContext(const std::string& cert_file, const std::string& key_file);
    ~TlsContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;

    [[noreturn]] void fail(const char* where);
};

} // namespace kg::internal
