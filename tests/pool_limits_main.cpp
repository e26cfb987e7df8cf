/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "dmart/log.hpp"
#include "dmart/session_pool.hpp"

// The pool of this process is created here, before any test runs, so the
// tests in this binary see max_connections = 1 and ka_max = 2.
int main(int argc, char* argv[]) {
    dmart::set_log_stdout(false);
    dmart::set_log_file("dmart_tests.log");

    dmart::PoolConfig cfg;
    cfg.max_connections = 1;
    cfg.ka_max = 2;
    cfg.io_timeout_sec = 5;
    dmart::SessionPool::acquire(cfg);

    return Catch::Session().run(argc, argv);
}
