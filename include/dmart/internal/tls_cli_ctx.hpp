/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "dmart/client_config.hpp"

namespace dmart::internal {

// TLS client context shared by every pooled connection. Loads system CA or
// custom CA and (optionally) an mTLS client certificate.
class TlsClientContext {
public:
    explicit TlsClientContext(const PoolConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    void log_last_error(const char* where);
};

} // namespace dmart::internal
