/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace dmart {

// multipart/form-data body (RFC 7578).
class MultipartForm {
public:
    MultipartForm();                          // random boundary
    explicit MultipartForm(std::string boundary);

    void add_file(const std::string& name,
                  const std::string& filename,
                  const std::string& content_type,
                  std::string data);
    void add_field(const std::string& name, std::string value);

    const std::string& boundary() const { return _boundary; }
    std::string content_type() const;         // header value incl. boundary
    std::string encode() const;
    bool empty() const { return _parts.empty(); }

private:
    struct Part {
        std::string name;
        std::optional<std::string> filename;
        std::string content_type;
        std::string data;
    };

    std::string _boundary;
    std::vector<Part> _parts;
};

} // namespace dmart
