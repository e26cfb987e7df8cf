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

namespace dmart::internal {

// Backend base URL split into its parts.
struct Endpoint {
    bool          tls = false;
    std::string   host;        // IPv6 literals without brackets
    std::uint16_t port = 80;
    std::string   base_path;   // "" or "/prefix" (no trailing '/')
};

// Accepts "http[s]://host[:port][/prefix]". Returns false for anything else
// (other schemes, userinfo, query/fragment, empty host, bad port).
bool parse_base_url(const std::string& url, Endpoint& out);

} // namespace dmart::internal
