/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dmart/transport.hpp"

namespace dmart::testing {

// Scripted HttpTransport: replays queued responses in order and records
// every request it receives. An empty queue behaves like a dead network.
class FakeTransport : public HttpTransport {
public:
    void queue_response(int status, std::string body,
                        std::unordered_map<std::string, std::string> headers = {}) {
        std::lock_guard<std::mutex> lk(_mtx);
        Scripted s;
        s.ok = true;
        s.resp.status_code = status;
        s.resp.status_text = status == 200 ? "OK" : "Error";
        s.resp.headers = std::move(headers);
        s.resp.body = std::move(body);
        _script.push_back(std::move(s));
    }

    void queue_failure() {
        std::lock_guard<std::mutex> lk(_mtx);
        _script.push_back(Scripted{});
    }

    bool perform(const HttpRequest& req, HttpResponse& out) override {
        std::lock_guard<std::mutex> lk(_mtx);
        _requests.push_back(req);
        if (_script.empty()) return false;
        Scripted s = std::move(_script.front());
        _script.pop_front();
        if (!s.ok) return false;
        out = std::move(s.resp);
        return true;
    }

    std::size_t request_count() const {
        std::lock_guard<std::mutex> lk(_mtx);
        return _requests.size();
    }

    HttpRequest request(std::size_t i) const {
        std::lock_guard<std::mutex> lk(_mtx);
        return _requests.at(i);
    }

    HttpRequest last_request() const {
        std::lock_guard<std::mutex> lk(_mtx);
        return _requests.back();
    }

private:
    struct Scripted {
        bool ok = false;
        HttpResponse resp;
    };

    mutable std::mutex _mtx;
    std::deque<Scripted> _script;
    std::vector<HttpRequest> _requests;
};

inline const char* login_ok_body() {
    return R"({"status":"success","records":[{"resource_type":"user","shortname":"dmart",)"
           R"("subpath":"users","attributes":{"access_token":"tok-123","type":"web"}}]})";
}

} // namespace dmart::testing
