/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include "dmart/http_request.hpp"
#include "dmart/http_response.hpp"

namespace dmart {

// The HTTP-call boundary. Implementations must be safe for concurrent use.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Executes one request. Returns false when no HTTP response could be
    // obtained (resolve, connect, TLS, I/O or framing failure).
    virtual bool perform(const HttpRequest& req, HttpResponse& out) = 0;
};

} // namespace dmart
