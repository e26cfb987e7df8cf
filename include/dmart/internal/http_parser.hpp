/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dmart/http_request.hpp"

namespace dmart::internal {

// "a=1&b=x%20y" in the given order.
std::string encode_query(const std::vector<std::pair<std::string,std::string>>& params);

// Case-insensitive header lookup in a response-hash (utility)
std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name);

// Request line + headers + body. Adds Host and Content-Length; caller
// headers are written as given.
std::string serialize_request(const HttpRequest& req);

// Parse status line and headers of an HTTP/1.1 response.
// hdr_end_off receives the offset of the first body byte.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

enum class ChunkState { Complete, NeedMore, Invalid };

// Resume point of an incremental chunked decode: offset of the first
// unconsumed byte in raw, and whether the last-chunk was already seen.
struct ChunkCursor {
    std::size_t pos = 0;
    bool in_trailer = false;
};

// Decode a chunked body held in raw (bytes after the header block).
// Only complete chunks are appended to body; raw may grow between calls and
// decoding resumes at cur, so each byte is examined once.
// On Complete, consumed is the number of bytes used, trailers included.
ChunkState decode_chunked(const std::string& raw, std::string& body, std::size_t& consumed,
                          ChunkCursor& cur);

// One-shot form: clears body and decodes raw from the start.
ChunkState decode_chunked(const std::string& raw, std::string& body, std::size_t& consumed);

} // namespace dmart::internal
