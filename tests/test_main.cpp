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

int main(int argc, char* argv[]) {
    dmart::set_log_stdout(false);
    dmart::set_log_file("dmart_tests.log");
    return Catch::Session().run(argc, argv);
}
