/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "dmart/auth_state.hpp"
#include "dmart/models.hpp"
#include "dmart/multipart.hpp"
#include "dmart/transport.hpp"
#include "dmart/types.hpp"
#include "dmart/internal/url.hpp"

namespace dmart {

enum class Auth {
    Bearer,  // token required; attached as "Authorization: Bearer <token>"
    None     // login only
};

// One backend call. json and form are mutually exclusive.
struct ApiCall {
    RequestMethod method = RequestMethod::Get;
    std::string endpoint;   // path below the base URL, percent-encoded
    std::vector<std::pair<std::string, std::string>> query;
    std::optional<nlohmann::json> json;
    std::optional<MultipartForm> form;
    Auth auth = Auth::Bearer;
};

// The single path from an operation to the wire: attaches headers, runs the
// request through the shared transport and maps every failure to a
// DmartException.
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<HttpTransport> transport, const AuthState& auth);

    // Returns false (and keeps the previous target) for a malformed URL.
    bool set_base_url(const std::string& url);
    bool has_base_url() const;

    // Decoded JSON body of a 200 response.
    nlohmann::json send(const ApiCall& call);

    // Decoded response envelope.
    Response call(const ApiCall& call);

private:
    std::shared_ptr<HttpTransport> _transport;
    const AuthState& _auth;

    mutable std::mutex _mtx;
    std::optional<internal::Endpoint> _endpoint;
};

} // namespace dmart
