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
 * @file id_generator.cpp
 * @brief Implementation of the record key generators.
 */

#include "repodb/infra/id_generator.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace repodb::infra {

namespace {

constexpr uint64_t kMaxSequence = std::numeric_limits<uint64_t>::max();

/// Interprets one `id` node as a sequence number; 0 when it is not one.
/// Values beyond the 64-bit range saturate at `kMaxSequence`.
uint64_t sequence_value(const cJSON* id)
{
    if (cJSON_IsNumber(id)) {
        // 2^64 as a double; anything at or above it cannot be converted.
        constexpr double kLimit = 18446744073709551616.0;
        if (!(id->valuedouble > 0)) {
            return 0;
        }
        if (id->valuedouble >= kLimit) {
            return kMaxSequence;
        }
        return static_cast<uint64_t>(std::floor(id->valuedouble));
    }
    if (!cJSON_IsString(id) || id->valuestring == nullptr || *id->valuestring == '\0') {
        return 0;
    }

    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(id->valuestring, &end, 10);
    if (end == id->valuestring || *end != '\0' || id->valuestring[0] == '-') {
        return 0;
    }
    if (errno == ERANGE) {
        return kMaxSequence;
    }
    return static_cast<uint64_t>(value);
}

} // namespace

/**
 * @brief Generates an RFC 4122 compliant Version 4 UUID.
 *
 * Each thread owns its Mersenne Twister engine, seeded from `std::random_device`,
 * so concurrent inserts generate keys without lock contention.
 */
std::string IdGenerator::generate()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t p1 = dis(gen);
    uint64_t p2 = dis(gen);

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << static_cast<uint32_t>(p1 >> 32) << "-"
       << std::setw(4) << static_cast<uint16_t>((p1 >> 16) & 0xFFFF) << "-"
       // Version 4 (random).
       << std::setw(4) << ((p1 & 0x0FFF) | 0x4000) << "-"
       // Variant 1 (RFC 4122).
       << std::setw(4) << (((p2 >> 48) & 0x3FFF) | 0x8000) << "-"
       << std::setw(12) << (p2 & 0xFFFFFFFFFFFF);

    return ss.str();
}

std::string IdGenerator::next_sequence_id(const cJSON* records)
{
    uint64_t highest = 0;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, records)
    {
        uint64_t value = sequence_value(cJSON_GetObjectItemCaseSensitive(item, "id"));
        if (value > highest)
            highest = value;
    }
    if (highest == kMaxSequence) {
        throw std::overflow_error("IdGenerator: Sequence ids exhausted");
    }
    return std::to_string(highest + 1);
}

} // namespace repodb::infra
