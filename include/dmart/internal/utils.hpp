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
#include <cstddef>
#include <cstdint>

namespace dmart::internal {

void trim_inplace(std::string& s);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);
std::string lower_copy(std::string s);
void secure_wipe(std::string& s);

// Random hex nonce of n bytes -> 2n hex chars (using OpenSSL RAND_bytes).
std::string random_hex(std::size_t n);

// Percent-encodes every byte outside [A-Za-z0-9-._~]; '/' is kept when keep_slash.
std::string percent_encode(const std::string& s, bool keep_slash);

} // namespace dmart::internal
