/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/error.hpp"

#include <utility>

namespace {

std::string describe(dmart::ErrorKind kind, int status, const dmart::Error& e) {
    std::string s = std::string("dmart ") + dmart::to_string(kind);
    if (status != 0) s += " (HTTP " + std::to_string(status) + ")";
    s += ": ";
    if (!e.type.empty()) s += "[" + e.type + "/" + std::to_string(e.code) + "] ";
    s += e.message;
    return s;
}

} // namespace

namespace dmart {

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"type", e.type}, {"code", e.code}, {"message", e.message}};
    if (e.info) j["info"] = *e.info;
}

void from_json(const nlohmann::json& j, Error& e) {
    j.at("type").get_to(e.type);
    j.at("code").get_to(e.code);
    j.at("message").get_to(e.message);
    e.info.reset();
    auto it = j.find("info");
    if (it != j.end() && !it->is_null()) {
        e.info = it->get<std::vector<nlohmann::json>>();
    }
}

const char* to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::Unauthenticated: return "unauthenticated";
    case ErrorKind::Connection:      return "connection";
    case ErrorKind::BackendRejected: return "backend_rejected";
    case ErrorKind::Transport:       return "transport";
    }
    return "unknown";
}

DmartException::DmartException(ErrorKind kind, int status_code, Error error)
    : std::runtime_error(describe(kind, status_code, error)),
      _kind(kind),
      _status_code(status_code),
      _error(std::move(error)) {}

} // namespace dmart
