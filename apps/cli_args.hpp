// SPDX-License-Identifier: Apache-2.0
// Part of dmart-cpp project.
// apps/cli_args.hpp

#pragma once
#include <string>
#include <vector>

#include "dmart/client_config.hpp"

struct CliArgs {
    dmart::ClientConfig cfg;
    dmart::PoolConfig pool;
    std::vector<std::string> args;   // command and its positional arguments
    bool attachments = false;
};

// Fills out from argv. Returns false on an unknown flag, a malformed number,
// or when url, credentials or the command are missing.
bool parse_cli_args(int argc, char** argv, CliArgs& out);
