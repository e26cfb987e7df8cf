/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/dispatcher.hpp"
#include "dmart/error.hpp"
#include "dmart/log.hpp"

#include "dmart/internal/http_parser.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace {

dmart::Error make_error(const char* type, int code, std::string message) {
    dmart::Error e;
    e.type = type;
    e.code = code;
    e.message = std::move(message);
    return e;
}

// Error member of a rejection body, or a generic one built from the status.
dmart::Error rejection_error(const nlohmann::json& body, const dmart::HttpResponse& resp) {
    if (body.is_object()) {
        auto it = body.find("error");
        if (it != body.end() && it->is_object()) {
            try {
                return it->get<dmart::Error>();
            } catch (const nlohmann::json::exception& ex) {
                dmart::log_line(std::string("[DISPATCH] unusable error object: ") + ex.what());
            }
        }
    }
    return make_error("http", resp.status_code,
                      resp.status_text.empty() ? "request rejected" : resp.status_text);
}

} // namespace

namespace dmart {

Dispatcher::Dispatcher(std::shared_ptr<HttpTransport> transport, const AuthState& auth)
    : _transport(std::move(transport)), _auth(auth) {
    if (!_transport) throw std::invalid_argument("Dispatcher requires a transport");
}

bool Dispatcher::set_base_url(const std::string& url) {
    internal::Endpoint ep;
    if (!internal::parse_base_url(url, ep)) return false;
    std::lock_guard<std::mutex> lk(_mtx);
    _endpoint = std::move(ep);
    return true;
}

bool Dispatcher::has_base_url() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _endpoint.has_value();
}

nlohmann::json Dispatcher::send(const ApiCall& call) {
    std::optional<std::string> token;
    if (call.auth == Auth::Bearer) {
        token = _auth.token();
        if (!token) {
            throw DmartException(ErrorKind::Unauthenticated, 401,
                                 make_error("login", 10, "Not authenticated Dmart user"));
        }
    }

    internal::Endpoint ep;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        if (!_endpoint) {
            throw DmartException(ErrorKind::Transport, 0,
                                 make_error("transport", 0, "no backend URL configured"));
        }
        ep = *_endpoint;
    }

    HttpRequest req;
    req.method = to_string(call.method);
    req.tls = ep.tls;
    req.host = ep.host;
    req.port = ep.port;
    req.target = ep.base_path + call.endpoint;
    if (!call.query.empty()) req.target += "?" + internal::encode_query(call.query);

    if (call.json) {
        req.headers["Content-Type"] = "application/json";
        req.body = call.json->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else if (call.form) {
        req.headers["Content-Type"] = call.form->content_type();
        req.body = call.form->encode();
    }
    if (token) {
        req.headers["Authorization"] = "Bearer " + *token;
    }

    const auto t0 = std::chrono::steady_clock::now();
    HttpResponse resp;
    const bool ok = _transport->perform(req, resp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    if (!ok) {
        log_line("[DISPATCH] " + req.method + " " + call.endpoint + " -> no response (" +
                 std::to_string(ms) + " ms)");
        throw DmartException(ErrorKind::Transport, 0,
                             make_error("transport", 0, "no response from " + ep.host));
    }
    log_line("[DISPATCH] " + req.method + " " + call.endpoint + " -> " +
             std::to_string(resp.status_code) + " (" + std::to_string(ms) + " ms)");

    nlohmann::json body = nlohmann::json::parse(resp.body, nullptr, false);

    if (resp.status_code != 200) {
        if (body.is_discarded()) {
            throw DmartException(ErrorKind::Transport, resp.status_code,
                                 make_error("transport", resp.status_code,
                                            "non-JSON response: " + resp.status_text));
        }
        throw DmartException(ErrorKind::BackendRejected, resp.status_code,
                             rejection_error(body, resp));
    }

    if (body.is_discarded()) {
        throw DmartException(ErrorKind::Transport, resp.status_code,
                             make_error("transport", resp.status_code, "response body is not JSON"));
    }
    return body;
}

Response Dispatcher::call(const ApiCall& call) {
    const nlohmann::json body = send(call);
    try {
        return Response::parse(body);
    } catch (const nlohmann::json::exception& ex) {
        throw DmartException(ErrorKind::Transport, 200,
                             make_error("transport", 200, std::string("malformed envelope: ") + ex.what()));
    } catch (const std::invalid_argument& ex) {
        throw DmartException(ErrorKind::Transport, 200,
                             make_error("transport", 200, std::string("malformed envelope: ") + ex.what()));
    }
}

} // namespace dmart
