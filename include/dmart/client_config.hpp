/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstddef>

namespace dmart {

// Settings of the process-wide connection pool. Only the configuration
// passed to the first SessionPool::acquire() takes effect.
struct PoolConfig {
    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect + TLS handshake
    int io_timeout_sec      = 30;  // recv/send timeout
    int ka_max              = 100; // max requests per connection before re-open

    // Upper bound on connections open at once (idle + in use), all hosts.
    std::size_t max_connections = 16;

    // TLS (https:// targets)
    bool tls_verify_peer = true;       // verify server certificate + hostname
    std::string tls_ca_file;           // optional CA file path
    std::string tls_client_cert_file;  // optional mTLS
    std::string tls_client_key_file;   // optional mTLS

    std::string user_agent = "dmart-cpp/1";
};

// Per-client settings: backend target and credentials.
struct ClientConfig {
    std::string url;       // e.g. "https://api.example.com" or "http://127.0.0.1:8282/dmart"
    std::string username;
    std::string password;

    // Logging
    std::string log_file = "dmart_client.log";
    bool log_stdout = true;
};

} // namespace dmart
