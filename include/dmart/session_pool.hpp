/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "dmart/client_config.hpp"
#include "dmart/transport.hpp"

namespace dmart {

namespace internal { class TlsClientContext; }

// Process-wide pool of keep-alive HTTP(S) connections, keyed by
// scheme://host:port. Thread-safe; bounded by PoolConfig::max_connections.
class SessionPool final : public HttpTransport {
public:
    // Returns the single pool of this process, creating it on the first call.
    // Later calls (concurrent ones included) get the same instance and their
    // cfg is ignored.
    static std::shared_ptr<SessionPool> acquire(const PoolConfig& cfg = PoolConfig{});

    // Number of pools ever constructed by acquire() (0 or 1).
    static std::size_t instances_created();

    ~SessionPool() override;

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    bool perform(const HttpRequest& req, HttpResponse& out) override;

    const PoolConfig& config() const { return _cfg; }
    std::size_t idle_connections() const;

private:
    explicit SessionPool(const PoolConfig& cfg);

    struct Conn;

    std::unique_ptr<Conn> checkout(const HttpRequest& req, const std::string& key);
    std::unique_ptr<Conn> open_conn(const HttpRequest& req);
    void checkin(const std::string& key, std::unique_ptr<Conn> c);
    void discard(std::unique_ptr<Conn> c);

    PoolConfig _cfg;
    std::unique_ptr<internal::TlsClientContext> _tls;

    mutable std::mutex _mtx;
    std::condition_variable _cv;
    std::size_t _open = 0;   // idle + checked out
    std::unordered_map<std::string, std::deque<std::unique_ptr<Conn>>> _idle;
};

} // namespace dmart
