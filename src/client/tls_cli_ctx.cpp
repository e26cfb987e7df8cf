/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/internal/tls_cli_ctx.hpp"
#include "dmart/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace dmart::internal {

TlsClientContext::TlsClientContext(const PoolConfig& cfg) {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);

    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        log_last_error("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        log_last_error("set_min_proto");
    }

    // Trust store
    if (!cfg.tls_ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            log_last_error("load_verify_locations(CA)");
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_last_error("set_default_verify_paths");
        }
    }

    // Optional mTLS
    if (!cfg.tls_client_cert_file.empty() && !cfg.tls_client_key_file.empty()) {
        if (SSL_CTX_use_certificate_file(_ctx, cfg.tls_client_cert_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            log_last_error("use_certificate_file(client)");
        }
        if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_client_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
            log_last_error("use_privatekey_file(client)");
        }
        if (SSL_CTX_check_private_key(_ctx) != 1) {
            log_last_error("check_private_key(client)");
        }
    }

    SSL_CTX_set_verify(_ctx, cfg.tls_verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    // Enable client session cache for resumption
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::log_last_error(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        dmart::log_line(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
}

} // namespace dmart::internal
