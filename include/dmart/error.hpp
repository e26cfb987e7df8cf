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
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dmart {

// Error object as reported by the backend ("error" member of an envelope).
struct Error {
    std::string type;
    int         code = 0;
    std::string message;
    std::optional<std::vector<nlohmann::json>> info;  // list of objects
};

void to_json(nlohmann::json& j, const Error& e);
void from_json(const nlohmann::json& j, Error& e);

enum class ErrorKind {
    Unauthenticated,   // no token; never sent over the wire
    Connection,        // login failed
    BackendRejected,   // non-200 status with the backend's own error
    Transport          // no response, or body not decodable
};

const char* to_string(ErrorKind k);

// Raised by every public operation that cannot return a typed success.
class DmartException : public std::runtime_error {
public:
    DmartException(ErrorKind kind, int status_code, Error error);

    ErrorKind    kind() const noexcept { return _kind; }
    int          status_code() const noexcept { return _status_code; }  // 0 when no response
    const Error& error() const noexcept { return _error; }

private:
    ErrorKind _kind;
    int       _status_code;
    Error     _error;
};

} // namespace dmart
