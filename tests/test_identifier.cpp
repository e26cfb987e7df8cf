/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include <catch2/catch.hpp>

#include "dmart/identifier.hpp"

#include <string>

using namespace dmart;

namespace {

// Restores the process-wide alphabet when a test swaps it.
struct AlphabetGuard {
    IdentifierAlphabet saved = default_alphabet();
    ~AlphabetGuard() { set_default_alphabet(saved); }
};

} // namespace

TEST_CASE("shortname character class", "[identifier]") {
    CHECK(is_valid_shortname("my_entry_01"));
    CHECK(is_valid_shortname(u8"مقال"));        // Arabic letters
    CHECK(is_valid_shortname(u8"post_١٢"));               // Arabic-Indic digits
    CHECK_FALSE(is_valid_shortname(""));
    CHECK_FALSE(is_valid_shortname("bad-name"));
    CHECK_FALSE(is_valid_shortname("with space"));
    CHECK_FALSE(is_valid_shortname("a/b"));
    CHECK_FALSE(is_valid_shortname(u8"été"));
}

TEST_CASE("shortname length is counted in code points", "[identifier]") {
    CHECK(is_valid_shortname(std::string(64, 'a')));
    CHECK_FALSE(is_valid_shortname(std::string(65, 'a')));

    std::string arabic;
    for (int i = 0; i < 64; ++i) arabic += u8"ب";
    CHECK(arabic.size() == 128);
    CHECK(is_valid_shortname(arabic));
}

TEST_CASE("subpath accepts separators", "[identifier]") {
    CHECK(is_valid_subpath("/"));
    CHECK(is_valid_subpath("/posts/2024/"));
    CHECK(is_valid_subpath(std::string(128, 'x')));
    CHECK_FALSE(is_valid_subpath(std::string(129, 'x')));
    CHECK_FALSE(is_valid_subpath("posts/../etc"));
    CHECK_FALSE(is_valid_subpath(""));
}

TEST_CASE("malformed UTF-8 is rejected", "[identifier]") {
    CHECK_FALSE(is_valid_shortname("\xC0\xAF"));          // overlong '/'
    CHECK_FALSE(is_valid_shortname("\xED\xA0\x80"));      // surrogate
    CHECK_FALSE(is_valid_shortname("\xD8"));              // truncated
}

TEST_CASE("alphabet is replaceable", "[identifier]") {
    IdentifierAlphabet cyrillic;
    cyrillic.letters.push_back({0x0410, 0x044F});

    const std::string word = u8"запись";
    CHECK(is_valid_shortname(word, cyrillic));
    CHECK_FALSE(is_valid_shortname(word, IdentifierAlphabet::arabic()));
    CHECK_FALSE(is_valid_shortname(u8"م", IdentifierAlphabet::latin()));

    AlphabetGuard guard;
    set_default_alphabet(cyrillic);
    CHECK(is_valid_shortname(word));
    CHECK_FALSE(is_valid_shortname(u8"م"));
}
