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
 * @file id_generator.hpp
 * @brief Record key generation: global surrogate keys and per-collection sequence ids.
 *
 * @details
 * Every record carries two keys. The `uid` is a Version 4 UUID and is unique
 * across all collections. The `id` is a decimal string that continues the
 * collection's own sequence (highest existing numeric id plus one).
 */

#pragma once

#include <cJSON.h>
#include <string>

namespace repodb::infra {

/**
 * @class IdGenerator
 * @brief A static utility for generating record keys.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random Version 4 UUID string.
     *
     * Canonical textual representation `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`,
     * where `y` is one of `{8, 9, a, b}`.
     *
     * @return std::string The generated UUID (36 characters).
     */
    static std::string generate();

    /**
     * @brief Computes the next sequence id for a collection array.
     *
     * Scans every element's `id` field. Both string ids ("12") and numeric ids
     * (12) are honoured; anything that is not a positive integer counts as 0.
     *
     * @param records A JSON array of records (may be `nullptr` or empty).
     * @return std::string The decimal representation of `max(id) + 1`.
     * @throws std::overflow_error When the highest id already is the largest 64-bit value.
     */
    static std::string next_sequence_id(const cJSON* records);
};

} // namespace repodb::infra
