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
#include <cstdint>

namespace dmart::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to host:port with a bounded connect and per-op I/O timeouts.
    bool open(const std::string& host, std::uint16_t port,
              int connect_timeout_sec, int io_timeout_sec);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    // Appends up to max bytes; returns bytes read, 0 on orderly close, -1 on error/timeout.
    long recv_some(std::string& out, std::size_t max);

    // True when an idle connection has pending input or EOF, i.e. the peer
    // closed it (or sent something unsolicited) and it must not be reused.
    bool idle_unusable() const;

private:
    int _fd = -1;
};

} // namespace dmart::internal
