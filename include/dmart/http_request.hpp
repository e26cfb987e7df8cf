/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace dmart {

// Outgoing HTTP/1.1 request as handed to an HttpTransport.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    bool        tls = false;
    std::string host;
    std::uint16_t port = 80;
    std::string target;   // "/base/user/login?x=1", already percent-encoded
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

} // namespace dmart
