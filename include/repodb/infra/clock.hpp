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
 * @file clock.hpp
 * @brief Wall-clock helpers for record stamps and audit entries.
 */

#pragma once

#include <cstdint>
#include <string>

namespace repodb::infra {

class Clock {
  public:
    /// @brief Milliseconds since the Unix epoch.
    static int64_t epoch_millis();

    /**
     * @brief Current UTC time as ISO-8601 with millisecond precision.
     *
     * Example: `2026-02-14T09:30:12.045Z`.
     */
    static std::string iso8601_now();
};

} // namespace repodb::infra
