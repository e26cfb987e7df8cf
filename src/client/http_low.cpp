/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/internal/http_low.hpp"
#include "dmart/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace dmart::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   int connect_timeout_sec, int io_timeout_sec) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        dmart::log_line(std::string("[TCP] getaddrinfo failed for ") + host + ": " + gai_strerror(rc));
        return false;
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0) { ::close(s); continue; }
        if (fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) { ::close(s); continue; }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret == 0) {
            // Connected immediately
        } else if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd     = s;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr <= 0 || !(pfd.revents & POLLOUT)) {
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                ::close(s);
                continue;
            }
        } else {
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{std::max(1, io_timeout_sec), 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        dmart::log_line("[TCP] connect to " + host + ":" + std::to_string(port) +
                        " failed (timed out or refused)");
        return false;
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

long TcpConn::recv_some(std::string& out, std::size_t max) {
    char buf[4096];
    ssize_t n = 0;
    do {
        n = ::recv(_fd, buf, std::min(sizeof(buf), max), 0);
    } while (n < 0 && errno == EINTR);
    if (n > 0) out.append(buf, buf + n);
    return (long)n;
}

bool TcpConn::idle_unusable() const {
    if (_fd < 0) return true;
    pollfd pfd{};
    pfd.fd = _fd;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, 0);
    if (pr < 0) return true;
    return pr > 0;
}

} // namespace dmart::internal
