/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/internal/url.hpp"
#include "dmart/internal/utils.hpp"

namespace dmart::internal {

bool parse_base_url(const std::string& url, Endpoint& out) {
    const std::string lower = lower_copy(url);
    std::size_t pos = 0;
    if (lower.compare(0, 8, "https://") == 0) { out.tls = true;  out.port = 443; pos = 8; }
    else if (lower.compare(0, 7, "http://") == 0) { out.tls = false; out.port = 80; pos = 7; }
    else return false;

    if (url.find_first_of("?#", pos) != std::string::npos) return false;

    const std::size_t slash = url.find('/', pos);
    const std::string authority = url.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (authority.empty() || authority.find('@') != std::string::npos) return false;

    std::string port_str;
    if (authority[0] == '[') {
        const std::size_t close = authority.find(']');
        if (close == std::string::npos || close == 1) return false;
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return false;
            port_str = authority.substr(close + 2);
            if (port_str.empty()) return false;
        }
    } else {
        const std::size_t colon = authority.find(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_str = authority.substr(colon + 1);
            if (port_str.empty()) return false;
        }
        if (out.host.empty()) return false;
    }

    if (!port_str.empty()) {
        if (port_str.size() > 5) return false;
        unsigned long p = 0;
        for (char c : port_str) {
            if (c < '0' || c > '9') return false;
            p = p * 10 + (unsigned long)(c - '0');
        }
        if (p == 0 || p > 65535) return false;
        out.port = (std::uint16_t)p;
    }

    out.base_path.clear();
    if (slash != std::string::npos) {
        out.base_path = url.substr(slash);
        while (!out.base_path.empty() && out.base_path.back() == '/') out.base_path.pop_back();
    }
    return true;
}

} // namespace dmart::internal
