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
 * @file config.hpp
 * @brief JSON configuration file loader.
 *
 * @details
 * Example:
 * @code
 * {
 *   "store": { "owner": "acme", "repo": "data", "branch": "main", "base_path": "db" },
 *   "queue": { "max_attempts": 5, "backoff_base_ms": 250, "backoff_factor": 2,
 *              "backoff_cap_ms": 5000, "write_deadline_ms": 0 },
 *   "write_policy": "rebase",
 *   "log_level": "info",
 *   "schemas": { "users": { "required": ["email"], "types": { "email": "string" } } }
 * }
 * @endcode
 *
 * The access token is read from `store.token`, or from the `REPODB_TOKEN`
 * environment variable when the file leaves it empty.
 */

#pragma once

#include "repodb/infra/logger.hpp"
#include "repodb/storage/db.hpp"
#include "repodb/storage/errors.hpp"
#include "repodb/storage/schema.hpp"

#include <map>
#include <string>

namespace repodb::config {

/// @brief Raised for unreadable files, malformed JSON and out-of-range values.
class ConfigError : public storage::DbError {
  public:
    using DbError::DbError;

    const char* kind() const noexcept override
    {
        return "config";
    }
};

/**
 * @struct Config
 * @brief Parsed configuration.
 */
struct Config {
    storage::DbOptions db;
    infra::LogLevel log_level = infra::LogLevel::INFO;
    std::map<std::string, storage::Schema> schemas;

    /// @throws ConfigError
    static Config from_file(const std::string& path);

    /// @throws ConfigError
    static Config from_json(const std::string& text);

    /// @brief Registers every configured schema on `db`.
    void apply_schemas(storage::Db& db) const;
};

} // namespace repodb::config
