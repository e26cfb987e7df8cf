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
#include <vector>

namespace dmart {

// Inclusive code-point range.
struct CodeRange {
    char32_t first;
    char32_t last;
};

// Locale data for identifiers: the non-Latin letters and native digits
// accepted next to [A-Za-z0-9_]. Shortnames allow 1..64 code points,
// subpaths 1..128 and additionally '/'.
struct IdentifierAlphabet {
    std::vector<CodeRange> letters;
    std::vector<CodeRange> digits;

    // Arabic letters U+0621..U+064A, Arabic-Indic digits U+0660..U+0669.
    static IdentifierAlphabet arabic();
    // ASCII only.
    static IdentifierAlphabet latin();
};

constexpr std::size_t k_shortname_max = 64;
constexpr std::size_t k_subpath_max   = 128;

// Process-wide alphabet used when none is passed explicitly. Defaults to arabic().
void set_default_alphabet(IdentifierAlphabet alphabet);
IdentifierAlphabet default_alphabet();

bool is_valid_shortname(const std::string& utf8, const IdentifierAlphabet& alphabet);
bool is_valid_subpath(const std::string& utf8, const IdentifierAlphabet& alphabet);

bool is_valid_shortname(const std::string& utf8);
bool is_valid_subpath(const std::string& utf8);

} // namespace dmart
