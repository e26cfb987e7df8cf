/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/identifier.hpp"

#include <mutex>
#include <utility>

namespace {

std::mutex g_alpha_mtx;

dmart::IdentifierAlphabet& default_slot() {
    static dmart::IdentifierAlphabet a = dmart::IdentifierAlphabet::arabic();
    return a;
}

// Decode one UTF-8 sequence at s[i]; advances i. Rejects overlong forms,
// surrogates and code points above U+10FFFF.
bool next_code_point(const std::string& s, std::size_t& i, char32_t& cp) {
    const auto b0 = (unsigned char)s[i];
    std::size_t len = 0;
    char32_t min = 0;
    if (b0 < 0x80)              { cp = b0;        len = 1; min = 0; }
    else if ((b0 & 0xE0) == 0xC0) { cp = b0 & 0x1F; len = 2; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { cp = b0 & 0x0F; len = 3; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { cp = b0 & 0x07; len = 4; min = 0x10000; }
    else return false;

    if (i + len > s.size()) return false;
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = (unsigned char)s[i + k];
        if ((b & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
    return true;
}

bool in_ranges(const std::vector<dmart::CodeRange>& ranges, char32_t cp) {
    for (const auto& r : ranges) {
        if (cp >= r.first && cp <= r.last) return true;
    }
    return false;
}

bool is_ident_char(char32_t cp, const dmart::IdentifierAlphabet& a) {
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) return true;
    if (cp >= '0' && cp <= '9') return true;
    if (cp == '_') return true;
    return in_ranges(a.letters, cp) || in_ranges(a.digits, cp);
}

bool matches(const std::string& s, const dmart::IdentifierAlphabet& a,
             std::size_t max_len, bool allow_slash) {
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        char32_t cp = 0;
        if (!next_code_point(s, i, cp)) return false;
        if (!(is_ident_char(cp, a) || (allow_slash && cp == '/'))) return false;
        if (++count > max_len) return false;
    }
    return count >= 1;
}

} // namespace

namespace dmart {

IdentifierAlphabet IdentifierAlphabet::arabic() {
    IdentifierAlphabet a;
    a.letters.push_back({0x0621, 0x064A});
    a.digits.push_back({0x0660, 0x0669});
    return a;
}

IdentifierAlphabet IdentifierAlphabet::latin() {
    return IdentifierAlphabet{};
}

void set_default_alphabet(IdentifierAlphabet alphabet) {
    std::lock_guard<std::mutex> lk(g_alpha_mtx);
    default_slot() = std::move(alphabet);
}

IdentifierAlphabet default_alphabet() {
    std::lock_guard<std::mutex> lk(g_alpha_mtx);
    return default_slot();
}

bool is_valid_shortname(const std::string& utf8, const IdentifierAlphabet& alphabet) {
    return matches(utf8, alphabet, k_shortname_max, false);
}

bool is_valid_subpath(const std::string& utf8, const IdentifierAlphabet& alphabet) {
    return matches(utf8, alphabet, k_subpath_max, true);
}

bool is_valid_shortname(const std::string& utf8) {
    return is_valid_shortname(utf8, default_alphabet());
}

bool is_valid_subpath(const std::string& utf8) {
    return is_valid_subpath(utf8, default_alphabet());
}

} // namespace dmart
