/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include "dmart/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace dmart::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

std::string random_hex(std::size_t n_bytes){
    std::string b; b.resize(n_bytes);
    if (RAND_bytes((unsigned char*)b.data(), (int)b.size()) != 1) return {};
    return bytes_to_hex((const unsigned char*)b.data(), b.size());
}

std::string percent_encode(const std::string& s, bool keep_slash){
    static const char* H="0123456789ABCDEF";
    std::string out; out.reserve(s.size()*3);
    for(unsigned char c: s){
        const bool unreserved = std::isalnum(c) || c=='-' || c=='.' || c=='_' || c=='~';
        if(unreserved || (keep_slash && c=='/')) out.push_back((char)c);
        else { out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]); }
    }
    return out;
}

} // namespace dmart::internal
