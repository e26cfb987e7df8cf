/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/multipart.hpp"
#include "dmart/internal/utils.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

// Quoted-string parameter value; '"', CR and LF are percent-escaped.
std::string quote_param(const std::string& v) {
    std::string out = "\"";
    for (char c : v) {
        if (c == '"') out += "%22";
        else if (c == '\r') out += "%0D";
        else if (c == '\n') out += "%0A";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

namespace dmart {

MultipartForm::MultipartForm()
    : _boundary("----dmart" + internal::random_hex(16)) {
    if (_boundary.size() <= 9) {
        throw std::runtime_error("RAND_bytes failed while generating a multipart boundary");
    }
}

MultipartForm::MultipartForm(std::string boundary)
    : _boundary(std::move(boundary)) {
    if (_boundary.empty() || _boundary.size() > 70) {
        throw std::invalid_argument("multipart boundary must be 1..70 characters");
    }
}

void MultipartForm::add_file(const std::string& name,
                             const std::string& filename,
                             const std::string& content_type,
                             std::string data) {
    _parts.push_back(Part{name, filename,
                          content_type.empty() ? "application/octet-stream" : content_type,
                          std::move(data)});
}

void MultipartForm::add_field(const std::string& name, std::string value) {
    _parts.push_back(Part{name, std::nullopt, "", std::move(value)});
}

std::string MultipartForm::content_type() const {
    return "multipart/form-data; boundary=" + _boundary;
}

std::string MultipartForm::encode() const {
    std::ostringstream oss;
    for (const auto& p : _parts) {
        oss << "--" << _boundary << "\r\n";
        oss << "Content-Disposition: form-data; name=" << quote_param(p.name);
        if (p.filename) oss << "; filename=" << quote_param(*p.filename);
        oss << "\r\n";
        if (!p.content_type.empty()) oss << "Content-Type: " << p.content_type << "\r\n";
        oss << "\r\n";
        oss << p.data << "\r\n";
    }
    oss << "--" << _boundary << "--\r\n";
    return oss.str();
}

} // namespace dmart
