/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <string>

namespace dmart {

// Thread-safe logging (to file + stdout).
void set_log_file(const std::string& path);
void set_log_stdout(bool enabled);
void log_line(const std::string& line);

} // namespace dmart
