/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <mutex>
#include <optional>
#include <string>

namespace dmart {

// Bearer token of one client: absent until a successful login, absent again
// after logout. Synchronized so a clear is seen by every later dispatch.
class AuthState {
public:
    AuthState() = default;
    ~AuthState();

    AuthState(const AuthState&) = delete;
    AuthState& operator=(const AuthState&) = delete;

    void set(std::string token);
    void clear();

    std::optional<std::string> token() const;
    bool present() const;

private:
    mutable std::mutex _mtx;
    std::optional<std::string> _token;
};

} // namespace dmart
