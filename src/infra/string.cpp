/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "repodb/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace repodb::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note `static_cast<unsigned char>` keeps `std::isspace` defined for bytes
 * with the high bit set (UTF-8 continuation bytes in signed `char` builds).
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string String::join_path(const std::string& base, const std::string& leaf)
{
    if (base.empty())
        return leaf;

    std::string left = base;
    while (!left.empty() && left.back() == '/')
        left.pop_back();

    size_t skip = 0;
    while (skip < leaf.size() && leaf[skip] == '/')
        skip++;

    if (left.empty())
        return leaf.substr(skip);
    return left + "/" + leaf.substr(skip);
}

} // namespace repodb::infra
