/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include <catch2/catch.hpp>

#include "dmart/internal/url.hpp"

using dmart::internal::Endpoint;
using dmart::internal::parse_base_url;

TEST_CASE("plain and TLS base URLs", "[url]") {
    Endpoint ep;
    REQUIRE(parse_base_url("http://localhost:8282", ep));
    CHECK_FALSE(ep.tls);
    CHECK(ep.host == "localhost");
    CHECK(ep.port == 8282);
    CHECK(ep.base_path.empty());

    REQUIRE(parse_base_url("HTTPS://api.example.org/dmart/", ep));
    CHECK(ep.tls);
    CHECK(ep.host == "api.example.org");
    CHECK(ep.port == 443);
    CHECK(ep.base_path == "/dmart");
}

TEST_CASE("IPv6 literals", "[url]") {
    Endpoint ep;
    REQUIRE(parse_base_url("http://[::1]:9000/api", ep));
    CHECK(ep.host == "::1");
    CHECK(ep.port == 9000);
    CHECK(ep.base_path == "/api");
    CHECK_FALSE(parse_base_url("http://[::1", ep));
    CHECK_FALSE(parse_base_url("http://[]:80", ep));
}

TEST_CASE("rejected base URLs", "[url]") {
    Endpoint ep;
    CHECK_FALSE(parse_base_url("", ep));
    CHECK_FALSE(parse_base_url("ftp://host", ep));
    CHECK_FALSE(parse_base_url("localhost:8282", ep));
    CHECK_FALSE(parse_base_url("http://", ep));
    CHECK_FALSE(parse_base_url("http://user:pw@host", ep));
    CHECK_FALSE(parse_base_url("http://host?x=1", ep));
    CHECK_FALSE(parse_base_url("http://host#frag", ep));
    CHECK_FALSE(parse_base_url("http://host:", ep));
    CHECK_FALSE(parse_base_url("http://host:0", ep));
    CHECK_FALSE(parse_base_url("http://host:70000", ep));
    CHECK_FALSE(parse_base_url("http://host:80a", ep));
}
