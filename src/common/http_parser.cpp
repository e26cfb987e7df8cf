/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/internal/http_parser.hpp"
#include <sstream>
#include <strings.h> // strcasecmp
#include "dmart/internal/utils.hpp"

namespace dmart::internal {

std::string encode_query(const std::vector<std::pair<std::string,std::string>>& params){
    std::ostringstream oss;
    bool first=true;
    for(const auto& kv: params){
        if(!first) oss << '&';
        first=false;
        oss << percent_encode(kv.first, false) << '=' << percent_encode(kv.second, false);
    }
    return oss.str();
}

std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

std::string serialize_request(const HttpRequest& req){
    const bool v6 = req.host.find(':') != std::string::npos;
    std::string host = v6 ? "[" + req.host + "]" : req.host;
    const bool default_port = (req.tls && req.port == 443) || (!req.tls && req.port == 80);
    if (!default_port) host += ":" + std::to_string(req.port);

    std::ostringstream oss;
    oss << req.method << " " << (req.target.empty() ? "/" : req.target) << " HTTP/1.1\r\n";
    oss << "Host: " << host << "\r\n";
    for (const auto& kv : req.headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << req.body.size() << "\r\n";
    oss << "\r\n";
    oss << req.body;
    return oss.str();
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            headers[k] = v;
        }
    }
    return true;
}

ChunkState decode_chunked(const std::string& raw, std::string& body, std::size_t& consumed,
                          ChunkCursor& cur){
    for (;;) {
        if (cur.in_trailer) {
            // Trailer section ends with an empty line.
            for (;;) {
                const std::size_t t = raw.find("\r\n", cur.pos);
                if (t == std::string::npos) return ChunkState::NeedMore;
                const bool empty = (t == cur.pos);
                cur.pos = t + 2;
                if (empty) {
                    consumed = cur.pos;
                    return ChunkState::Complete;
                }
            }
        }

        const std::size_t eol = raw.find("\r\n", cur.pos);
        if (eol == std::string::npos) {
            if (raw.size() - cur.pos > 1024) return ChunkState::Invalid;  // runaway size line
            return ChunkState::NeedMore;
        }

        // chunk-size [; extensions]
        std::string size_line = raw.substr(cur.pos, eol - cur.pos);
        const std::size_t semi = size_line.find(';');
        if (semi != std::string::npos) size_line.resize(semi);
        trim_inplace(size_line);
        if (size_line.empty() || size_line.size() > 15) return ChunkState::Invalid;

        std::size_t n = 0;
        for (char c : size_line) {
            int v = -1;
            if (c >= '0' && c <= '9') v = c - '0';
            else if (c >= 'a' && c <= 'f') v = 10 + (c - 'a');
            else if (c >= 'A' && c <= 'F') v = 10 + (c - 'A');
            if (v < 0) return ChunkState::Invalid;
            n = (n << 4) | (std::size_t)v;
        }
        const std::size_t data = eol + 2;

        if (n == 0) {
            cur.pos = data;
            cur.in_trailer = true;
            continue;
        }

        // Wait for the whole chunk; cur stays on its size line.
        if (raw.size() < data + n + 2) return ChunkState::NeedMore;
        if (raw.compare(data + n, 2, "\r\n") != 0) return ChunkState::Invalid;
        body.append(raw, data, n);
        cur.pos = data + n + 2;
    }
}

ChunkState decode_chunked(const std::string& raw, std::string& body, std::size_t& consumed){
    body.clear();
    ChunkCursor cur;
    return decode_chunked(raw, body, consumed, cur);
}

} // namespace dmart::internal
