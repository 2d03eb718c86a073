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
 * @file base64.hpp
 * @brief Text-safe transport encoding for document payloads.
 *
 * @details
 * The contents API carries file bodies as base64. Documents are UTF-8 JSON, and
 * `std::string` already holds those bytes verbatim, so encoding the raw bytes
 * round-trips any Unicode text without a separate transcoding step.
 */

#pragma once

#include <string>

namespace repodb::infra {

/**
 * @class Base64
 * @brief Standard-alphabet (RFC 4648) base64 codec backed by OpenSSL's EVP block API.
 */
class Base64 {
  public:
    /// @brief Encodes raw bytes; output has no line breaks.
    static std::string encode(const std::string& bytes);

    /**
     * @brief Decodes base64 text.
     *
     * ASCII whitespace (the contents API wraps at 60 columns) is ignored.
     *
     * @throws std::invalid_argument on characters outside the alphabet or a
     * length that is not a multiple of four after whitespace removal.
     */
    static std::string decode(const std::string& text);
};

} // namespace repodb::infra
