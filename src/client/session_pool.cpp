/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/session_pool.hpp"
#include "dmart/log.hpp"

#include "dmart/internal/utils.hpp"
#include "dmart/internal/http_parser.hpp"
#include "dmart/internal/tls_cli_ctx.hpp"
#include "dmart/internal/http_low.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <limits>
#include <utility>

#include <poll.h>
#include <cerrno>
#include <fcntl.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>

namespace {

constexpr std::size_t k_max_head_bytes = 1u << 20;
constexpr std::size_t k_max_body_bytes = 256u << 20;

std::once_flag g_pool_once;
std::shared_ptr<dmart::SessionPool> g_pool;
std::atomic<std::size_t> g_pools_created{0};

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

// Drain OpenSSL error stack into logs.
inline void log_openssl_errors(const char* where) {
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        dmart::log_line(std::string("[POOL] ") + where + ": " + buf);
    }
}

[[nodiscard]] bool wait_fd(int fd, short ev, std::chrono::steady_clock::time_point deadline) {
    const int ms = remaining_ms(deadline);
    if (ms <= 0) return false;
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = ev;
    int pr = 0;
    do {
        pr = ::poll(&pfd, 1, ms);
    } while (pr < 0 && errno == EINTR);
    return pr > 0;
}

// TLS handshake that handles WANT_READ/WANT_WRITE under a bounded deadline.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec) {
    if (!ssl || fd < 0) return false;

    const int effective_timeout = std::max(1, timeout_sec);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);

        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            const short ev = (ssl_err == SSL_ERROR_WANT_READ) ? POLLIN : POLLOUT;
            if (!wait_fd(fd, ev, deadline)) {
                dmart::log_line("[POOL] SSL_connect timeout");
                return false;
            }
            continue;
        }

        if (ssl_err == SSL_ERROR_SYSCALL) {
            const int e = errno;
            if (e == EINTR) {
                continue;
            }
            if (e == EAGAIN || e == EWOULDBLOCK) {
                if (!wait_fd(fd, POLLIN, deadline)) {
                    dmart::log_line("[POOL] SSL_connect timeout (EAGAIN)");
                    return false;
                }
                continue;
            }

            dmart::log_line(std::string("[POOL] SSL_connect syscall error: errno=") + std::to_string(e) +
                            " (" + std::strerror(e) + ")");
            log_openssl_errors("SSL_connect");
            return false;
        }

        dmart::log_line(std::string("[POOL] SSL_connect failed: ssl_error=") + std::to_string(ssl_err));
        log_openssl_errors("SSL_connect");
        return false;
    }
}

bool parse_content_length(const std::string& v, std::size_t& out) {
    if (v.empty() || v.size() > 19) return false;
    std::size_t n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') return false;
        n = n * 10 + (std::size_t)(c - '0');
    }
    out = n;
    return true;
}

std::string pool_key(const dmart::HttpRequest& req) {
    return std::string(req.tls ? "https://" : "http://") + req.host + ":" + std::to_string(req.port);
}

} // namespace

namespace dmart {

struct SessionPool::Conn {
    internal::TcpConn tcp;
    std::unique_ptr<SSL, void(*)(SSL*)> ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};
    int served = 0;

    ~Conn() { close(); }

    void close() {
        if (ssl) {
            SSL_shutdown(ssl.get());
            ssl.reset(nullptr);
        }
        tcp.close();
    }

    bool send_all(const std::string& data) {
        if (!ssl) return tcp.send_all(data.data(), data.size());
        std::size_t off = 0;
        while (off < data.size()) {
            const int chunk = (int)std::min<std::size_t>(data.size() - off, 1u << 30);
            int n = SSL_write(ssl.get(), data.data() + off, chunk);
            if (n <= 0) { (void)SSL_get_error(ssl.get(), n); return false; }
            off += (std::size_t)n;
        }
        return true;
    }

    long recv_some(std::string& out, std::size_t max) {
        if (!ssl) return tcp.recv_some(out, max);
        char buf[4096];
        int n = SSL_read(ssl.get(), buf, (int)std::min(sizeof(buf), max));
        if (n > 0) {
            out.append(buf, buf + n);
            return n;
        }
        return SSL_get_error(ssl.get(), n) == SSL_ERROR_ZERO_RETURN ? 0 : -1;
    }

    bool idle_unusable() const {
        if (ssl && SSL_pending(ssl.get()) > 0) return true;
        return tcp.idle_unusable();
    }

    // Reads one response. reusable is cleared when the connection cannot
    // carry another request (Connection: close, body delimited by EOF).
    bool read_response(const std::string& method, HttpResponse& out, bool& reusable) {
        std::string buf;
        std::size_t hdr_end_off = 0;

        for (;;) {
            while (buf.find("\r\n\r\n") == std::string::npos) {
                if (recv_some(buf, 4096) <= 0) return false;
                if (buf.size() > k_max_head_bytes) return false;
            }
            if (!internal::parse_http_response(buf, hdr_end_off, out.status_code,
                                               out.status_text, out.headers)) {
                return false;
            }
            // Interim 1xx responses precede the final one.
            if (out.status_code >= 100 && out.status_code < 200 && out.status_code != 101) {
                buf.erase(0, hdr_end_off);
                continue;
            }
            break;
        }

        std::string rest = buf.substr(hdr_end_off);
        out.body.clear();

        const std::string te = internal::lower_copy(internal::hdr_ci(out.headers, "Transfer-Encoding"));
        const std::string cl = internal::hdr_ci(out.headers, "Content-Length");

        if (method == "HEAD" || out.status_code == 204 || out.status_code == 304) {
            // no body
        } else if (te.find("chunked") != std::string::npos) {
            internal::ChunkCursor cursor;
            for (;;) {
                std::size_t consumed = 0;
                const auto st = internal::decode_chunked(rest, out.body, consumed, cursor);
                if (st == internal::ChunkState::Complete) break;
                if (st == internal::ChunkState::Invalid) return false;
                if (recv_some(rest, 4096) <= 0) return false;
                if (rest.size() > k_max_body_bytes) return false;
            }
        } else if (!cl.empty()) {
            std::size_t content_len = 0;
            if (!parse_content_length(cl, content_len) || content_len > k_max_body_bytes) return false;
            while (rest.size() < content_len) {
                if (recv_some(rest, content_len - rest.size()) <= 0) return false;
            }
            rest.resize(content_len);
            out.body.swap(rest);
        } else {
            // Delimited by connection close.
            for (;;) {
                const long n = recv_some(rest, 4096);
                if (n == 0) break;
                if (n < 0) return false;
                if (rest.size() > k_max_body_bytes) return false;
            }
            out.body.swap(rest);
            reusable = false;
        }

        const std::string conn = internal::lower_copy(internal::hdr_ci(out.headers, "Connection"));
        if (conn == "close") reusable = false;
        return true;
    }
};

std::shared_ptr<SessionPool> SessionPool::acquire(const PoolConfig& cfg) {
    std::call_once(g_pool_once, [&cfg]() {
        g_pool.reset(new SessionPool(cfg));
        g_pools_created.fetch_add(1, std::memory_order_relaxed);
    });
    return g_pool;
}

std::size_t SessionPool::instances_created() {
    return g_pools_created.load(std::memory_order_relaxed);
}

SessionPool::SessionPool(const PoolConfig& cfg)
    : _cfg(cfg) {
    if (_cfg.max_connections == 0) _cfg.max_connections = 1;
    if (_cfg.ka_max <= 0) _cfg.ka_max = 1;
    _tls = std::make_unique<internal::TlsClientContext>(_cfg);
    dmart::log_line("[POOL] created: max_connections=" + std::to_string(_cfg.max_connections) +
                    " ka_max=" + std::to_string(_cfg.ka_max) +
                    " verify_peer=" + (_cfg.tls_verify_peer ? "1" : "0"));
}

SessionPool::~SessionPool() {
    std::lock_guard<std::mutex> lk(_mtx);
    _idle.clear();
}

std::size_t SessionPool::idle_connections() const {
    std::lock_guard<std::mutex> lk(_mtx);
    std::size_t n = 0;
    for (const auto& kv : _idle) n += kv.second.size();
    return n;
}

std::unique_ptr<SessionPool::Conn> SessionPool::checkout(const HttpRequest& req, const std::string& key) {
    {
        std::unique_lock<std::mutex> lk(_mtx);
        for (;;) {
            auto it = _idle.find(key);
            while (it != _idle.end() && !it->second.empty()) {
                std::unique_ptr<Conn> c = std::move(it->second.back());
                it->second.pop_back();
                if (!c->idle_unusable()) return c;
                --_open;  // closed by peer while idle
            }

            if (_open < _cfg.max_connections) break;

            // At the limit: retire an idle connection to another host, if any.
            bool evicted = false;
            for (auto& kv : _idle) {
                if (!kv.second.empty()) {
                    kv.second.pop_front();
                    --_open;
                    evicted = true;
                    break;
                }
            }
            if (evicted) break;
            _cv.wait(lk);
        }
        ++_open;
    }

    std::unique_ptr<Conn> c = open_conn(req);
    if (!c) {
        {
            std::lock_guard<std::mutex> lk(_mtx);
            --_open;
        }
        _cv.notify_one();
    }
    return c;
}

std::unique_ptr<SessionPool::Conn> SessionPool::open_conn(const HttpRequest& req) {
    auto c = std::make_unique<Conn>();
    if (!c->tcp.open(req.host, req.port, _cfg.connect_timeout_sec, _cfg.io_timeout_sec)) {
        return nullptr;
    }
    if (!req.tls) return c;

    if (!_tls || !_tls->ctx()) {
        dmart::log_line("[POOL] TLS ctx not ready");
        return nullptr;
    }
    SSL* s = SSL_new(_tls->ctx());
    if (!s) {
        dmart::log_line("[POOL] SSL_new failed");
        return nullptr;
    }
    c->ssl.reset(s);
    SSL_set_fd(s, c->tcp.fd());

    unsigned char tmp[16];
    const bool is_ipv4 = (::inet_pton(AF_INET, req.host.c_str(), tmp) == 1);
    const bool is_ipv6 = (!is_ipv4 && (::inet_pton(AF_INET6, req.host.c_str(), tmp) == 1));
    if (!is_ipv4 && !is_ipv6) {
        SSL_set_tlsext_host_name(s, req.host.c_str());
    }

    // Chain validation alone does not check the name; bind it to the host.
    if (_cfg.tls_verify_peer) {
        X509_VERIFY_PARAM* param = SSL_get0_param(s);
        if (!param) {
            dmart::log_line("[POOL] SSL_get0_param failed");
            return nullptr;
        }
        if (is_ipv4 || is_ipv6) {
            if (X509_VERIFY_PARAM_set1_ip_asc(param, req.host.c_str()) != 1) {
                dmart::log_line("[POOL] X509_VERIFY_PARAM_set1_ip_asc failed");
                return nullptr;
            }
        } else {
            if (SSL_set1_host(s, req.host.c_str()) != 1) {
                dmart::log_line("[POOL] SSL_set1_host failed");
                return nullptr;
            }
        }
    }

    // Handshake in non-blocking mode with a bounded deadline.
    const int fd = c->tcp.fd();
    const int old_flags = ::fcntl(fd, F_GETFL, 0);
    if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
        dmart::log_line("[POOL] fcntl(O_NONBLOCK) failed");
        return nullptr;
    }

    const bool hs_ok = ssl_connect_with_deadline(s, fd, _cfg.connect_timeout_sec);

    // Restore original socket flags (back to blocking mode).
    (void)::fcntl(fd, F_SETFL, old_flags);

    if (!hs_ok) {
        c->ssl.reset(nullptr);
        return nullptr;
    }

    if (_cfg.tls_verify_peer) {
        const long vr = SSL_get_verify_result(s);
        if (vr != X509_V_OK) {
            dmart::log_line(std::string("[POOL] TLS verify failed for ") + req.host + ": " +
                            X509_verify_cert_error_string(vr));
            return nullptr;
        }
    }
    return c;
}

void SessionPool::checkin(const std::string& key, std::unique_ptr<Conn> c) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _idle[key].push_back(std::move(c));
    }
    _cv.notify_one();
}

void SessionPool::discard(std::unique_ptr<Conn> c) {
    c.reset();
    {
        std::lock_guard<std::mutex> lk(_mtx);
        --_open;
    }
    _cv.notify_one();
}

bool SessionPool::perform(const HttpRequest& req, HttpResponse& out) {
    const std::string key = pool_key(req);

    HttpRequest wire_req = req;
    wire_req.headers.emplace("User-Agent", _cfg.user_agent);
    wire_req.headers.emplace("Accept", "*/*");
    wire_req.headers["Connection"] = "keep-alive";

    std::unique_ptr<Conn> c = checkout(req, key);
    if (!c) {
        dmart::log_line("[POOL] no connection to " + key);
        return false;
    }

    bool reusable = true;
    const bool ok = c->send_all(internal::serialize_request(wire_req)) &&
                    c->read_response(req.method, out, reusable);
    if (!ok) {
        dmart::log_line("[POOL] " + req.method + " " + key + " failed (I/O or framing error)");
        discard(std::move(c));
        return false;
    }

    ++c->served;
    if (!reusable || c->served >= _cfg.ka_max) {
        discard(std::move(c));
    } else {
        checkin(key, std::move(c));
    }
    return true;
}

} // namespace dmart
