/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include <catch2/catch.hpp>

#include "dmart/auth_state.hpp"

#include <atomic>
#include <thread>
#include <vector>

using dmart::AuthState;

TEST_CASE("token lifecycle", "[auth]") {
    AuthState auth;
    CHECK_FALSE(auth.present());
    CHECK_FALSE(auth.token().has_value());

    auth.set("tok-1");
    REQUIRE(auth.present());
    CHECK(*auth.token() == "tok-1");

    auth.set("tok-2");
    CHECK(*auth.token() == "tok-2");

    auth.clear();
    CHECK_FALSE(auth.present());
    auth.clear();
    CHECK_FALSE(auth.present());
}

TEST_CASE("clear is seen by concurrent readers", "[auth]") {
    AuthState auth;
    auth.set("tok");

    std::atomic<bool> cleared{false};
    std::atomic<int> stale_after_clear{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            for (int n = 0; n < 2000; ++n) {
                const bool was_cleared = cleared.load();
                const bool has = auth.present();
                if (was_cleared && has) ++stale_after_clear;
            }
        });
    }
    auth.clear();
    cleared.store(true);
    for (auto& t : readers) t.join();

    CHECK(stale_after_clear.load() == 0);
    CHECK_FALSE(auth.present());
}
