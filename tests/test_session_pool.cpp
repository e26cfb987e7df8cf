/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include <catch2/catch.hpp>

#include "dmart/session_pool.hpp"

#include "fakes/loopback_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace dmart;
using dmart::testing::LoopbackServer;
using dmart::testing::loopback_get;

TEST_CASE("concurrent acquire yields one pool", "[pool]") {
    std::vector<std::shared_ptr<SessionPool>> got(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < got.size(); ++i) {
        threads.emplace_back([&got, i] { got[i] = SessionPool::acquire(); });
    }
    for (auto& t : threads) t.join();

    REQUIRE(got[0] != nullptr);
    for (const auto& p : got) CHECK(p.get() == got[0].get());
    CHECK(SessionPool::acquire().get() == got[0].get());
    CHECK(SessionPool::instances_created() == 1);
}

TEST_CASE("keep-alive connection is reused", "[pool]") {
    LoopbackServer srv({
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 33\r\n\r\n"
        "{\"status\":\"success\",\"records\":[]}",
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\n{\"a\":\r\n2\r\n1}\r\n0\r\n\r\n",
    });
    REQUIRE(srv.ok());
    auto pool = SessionPool::acquire();

    HttpResponse r1;
    REQUIRE(pool->perform(loopback_get(srv.port(), "/user/profile"), r1));
    CHECK(r1.status_code == 200);
    CHECK(r1.body == "{\"status\":\"success\",\"records\":[]}");
    CHECK(pool->idle_connections() >= 1);

    HttpResponse r2;
    REQUIRE(pool->perform(loopback_get(srv.port(), "/user/profile"), r2));
    CHECK(r2.body == "{\"a\":1}");
    CHECK(srv.accepted() == 1);
}

TEST_CASE("Connection: close retires the socket", "[pool]") {
    LoopbackServer srv({
        "HTTP/1.1 404 Not Found\r\nConnection: close\r\nContent-Length: 2\r\n\r\n{}",
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok",
    });
    REQUIRE(srv.ok());
    auto pool = SessionPool::acquire();

    HttpResponse r1;
    REQUIRE(pool->perform(loopback_get(srv.port(), "/a"), r1));
    CHECK(r1.status_code == 404);
    CHECK(r1.status_text == "Not Found");

    HttpResponse r2;
    REQUIRE(pool->perform(loopback_get(srv.port(), "/b"), r2));
    CHECK(r2.body == "ok");
    CHECK(srv.accepted() == 2);
}

TEST_CASE("unreachable peer is a transport failure", "[pool]") {
    // Reserve a port, then release it so nothing listens there.
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(fd, (sockaddr*)&sa, sizeof(sa)) == 0);
    socklen_t len = sizeof(sa);
    REQUIRE(::getsockname(fd, (sockaddr*)&sa, &len) == 0);
    const std::uint16_t port = ntohs(sa.sin_port);
    ::close(fd);

    HttpResponse r;
    CHECK_FALSE(SessionPool::acquire()->perform(loopback_get(port, "/"), r));
}
