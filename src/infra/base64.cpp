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
 * @file base64.cpp
 * @brief Base64 codec over `EVP_EncodeBlock` / `EVP_DecodeBlock`.
 *
 * @details
 * The EVP block functions work on whole 3-byte / 4-char groups and do not strip
 * padding from decoded output, so the decoder trims one byte per trailing `=`.
 */

#include "repodb/infra/base64.hpp"

#include <cctype>
#include <openssl/evp.h>
#include <stdexcept>
#include <vector>

namespace repodb::infra {

std::string Base64::encode(const std::string& bytes)
{
    if (bytes.empty()) {
        return "";
    }

    // 4 output chars per 3 input bytes, plus the terminating NUL EVP writes.
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::string Base64::decode(const std::string& text)
{
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }

    if (compact.empty()) {
        return "";
    }
    if (compact.size() % 4 != 0) {
        throw std::invalid_argument("base64: input length is not a multiple of 4");
    }

    size_t padding = 0;
    if (compact[compact.size() - 1] == '=')
        padding++;
    if (compact[compact.size() - 2] == '=')
        padding++;

    std::vector<unsigned char> out(3 * (compact.size() / 4));
    int written =
        EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
                        static_cast<int>(compact.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        throw std::invalid_argument("base64: invalid character in input");
    }

    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written) - padding);
}

} // namespace repodb::infra
