/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include <catch2/catch.hpp>

#include "cli_args.hpp"

#include <string>
#include <vector>

namespace {

bool parse(std::vector<std::string> words, CliArgs& out) {
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(&w[0]);
    argv.push_back(nullptr);
    return parse_cli_args((int)words.size(), argv.data(), out);
}

std::vector<std::string> base() {
    return {"dmart_cli", "--url", "http://localhost:8282", "--user", "dmart", "--password", "pw"};
}

} // namespace

TEST_CASE("cli flags fill both configs", "[cli]") {
    auto words = base();
    for (const char* w : {"--insecure", "1", "--quiet", "1", "--io_timeout", "7",
                          "--connect_timeout", "0", "read", "news", "posts", "e1", "--attachments"}) {
        words.push_back(w);
    }
    CliArgs a;
    REQUIRE(parse(words, a));
    CHECK(a.cfg.url == "http://localhost:8282");
    CHECK(a.cfg.username == "dmart");
    CHECK_FALSE(a.pool.tls_verify_peer);
    CHECK_FALSE(a.cfg.log_stdout);
    CHECK(a.pool.io_timeout_sec == 7);
    CHECK(a.pool.connect_timeout_sec == 1);
    CHECK(a.attachments);
    CHECK(a.args == std::vector<std::string>{"read", "news", "posts", "e1"});
}

TEST_CASE("malformed numbers are usage errors", "[cli]") {
    for (const char* flag : {"--insecure", "--quiet", "--io_timeout", "--connect_timeout"}) {
        auto words = base();
        words.push_back(flag);
        words.push_back("x");
        words.push_back("profile");
        CliArgs a;
        CHECK_FALSE(parse(words, a));
    }

    auto words = base();
    words.push_back("--io_timeout");
    words.push_back("99999999999999999999");
    words.push_back("profile");
    CliArgs a;
    CHECK_FALSE(parse(words, a));
}

TEST_CASE("missing settings or unknown flags", "[cli]") {
    CliArgs a;
    CHECK_FALSE(parse(base(), a));  // no command

    CliArgs b;
    CHECK_FALSE(parse({"dmart_cli", "--url", "http://h", "profile"}, b));

    auto words = base();
    words.push_back("--verbose");
    words.push_back("profile");
    CliArgs c;
    CHECK_FALSE(parse(words, c));
}
