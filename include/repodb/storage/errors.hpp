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
 * @file errors.hpp
 * @brief Exception taxonomy of the data-access layer.
 *
 * @details
 * | Type                    | Raised when                                   | Handling            |
 * |-------------------------|-----------------------------------------------|---------------------|
 * | `NetworkError`          | transport failure or unexpected HTTP status   | propagates as-is    |
 * | `NotFoundError`         | remote path or record is absent               | auto-init on read   |
 * | `ConflictError`         | conditional PUT rejected (stale sha)          | retried by queue    |
 * | `SchemaValidationError` | required field missing / wrong kind           | fatal, pre-network  |
 * | `QueueExhaustedError`   | retry budget or deadline exhausted            | surfaced to caller  |
 */

#pragma once

#include <stdexcept>
#include <string>

namespace repodb::storage {

/// @brief Root of every error raised by RepoDB.
class DbError : public std::runtime_error {
  public:
    explicit DbError(const std::string& message) : std::runtime_error(message) {}

    /// @brief Stable machine-readable category ("network", "not_found", ...).
    virtual const char* kind() const noexcept
    {
        return "internal";
    }
};

class NetworkError : public DbError {
  public:
    /**
     * @param status HTTP status code, or 0 when the request never completed.
     */
    NetworkError(const std::string& message, long status = 0) : DbError(message), status_(status)
    {
    }

    long status() const noexcept
    {
        return status_;
    }

    const char* kind() const noexcept override
    {
        return "network";
    }

  private:
    long status_;
};

class NotFoundError : public DbError {
  public:
    using DbError::DbError;

    const char* kind() const noexcept override
    {
        return "not_found";
    }
};

class ConflictError : public DbError {
  public:
    using DbError::DbError;

    const char* kind() const noexcept override
    {
        return "conflict";
    }
};

class SchemaValidationError : public DbError {
  public:
    SchemaValidationError(const std::string& message, std::string field)
        : DbError(message), field_(std::move(field))
    {
    }

    /// @brief The offending field name.
    const std::string& field() const noexcept
    {
        return field_;
    }

    const char* kind() const noexcept override
    {
        return "schema_validation";
    }

  private:
    std::string field_;
};

class QueueExhaustedError : public DbError {
  public:
    QueueExhaustedError(const std::string& message, int attempts)
        : DbError(message), attempts_(attempts)
    {
    }

    /// @brief PUT attempts made before giving up.
    int attempts() const noexcept
    {
        return attempts_;
    }

    const char* kind() const noexcept override
    {
        return "queue_exhausted";
    }

  private:
    int attempts_;
};

} // namespace repodb::storage
