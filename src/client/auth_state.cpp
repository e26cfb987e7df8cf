/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/auth_state.hpp"
#include "dmart/internal/utils.hpp"

#include <utility>

namespace dmart {

AuthState::~AuthState() {
    clear();
}

void AuthState::set(std::string token) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_token) internal::secure_wipe(*_token);
    _token = std::move(token);
}

void AuthState::clear() {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_token) internal::secure_wipe(*_token);
    _token.reset();
}

std::optional<std::string> AuthState::token() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _token;
}

bool AuthState::present() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _token.has_value();
}

} // namespace dmart
