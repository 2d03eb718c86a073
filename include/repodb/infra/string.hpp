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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless helpers used when sanitizing configuration values (tokens read
 * from the environment, level names) and when composing remote paths.
 */

#pragma once

#include <string>

namespace repodb::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content; empty if `s` is blank.
     *
     * @code
     * std::string token = repodb::infra::String::trim("  ghp_abc\n"); // "ghp_abc"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-casing.
    static std::string to_lower(std::string s);

    /**
     * @brief Joins two path segments with exactly one `/` between them.
     *
     * Leading/trailing slashes on the joint are collapsed; an empty `base`
     * yields `leaf` unchanged.
     */
    static std::string join_path(const std::string& base, const std::string& leaf);
};

} // namespace repodb::infra
