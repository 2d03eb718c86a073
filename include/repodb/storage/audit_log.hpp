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
 * @file audit_log.hpp
 * @brief Bounded in-memory trail of committed actions, for debugging.
 */

#pragma once

#include "repodb/infra/json.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace repodb::storage {

struct AuditEntry {
    std::string action;     ///< "insert", "update" or "delete".
    infra::JsonPtr record;  ///< The record as committed (as removed, for deletes).
    int64_t timestamp_ms{}; ///< Milliseconds since the Unix epoch.

    AuditEntry() = default;
    AuditEntry(std::string action, infra::JsonPtr record, int64_t timestamp_ms);
    AuditEntry(const AuditEntry& other);
    AuditEntry& operator=(const AuditEntry& other);
    AuditEntry(AuditEntry&&) = default;
    AuditEntry& operator=(AuditEntry&&) = default;
};

/**
 * @class AuditLog
 * @brief Per-collection ring buffer; the oldest entry falls off at capacity.
 */
class AuditLog {
  public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit AuditLog(size_t capacity = kDefaultCapacity);

    void record(const std::string& collection, const std::string& action, const cJSON* record);

    /// @brief Entries of `collection`, oldest first.
    std::vector<AuditEntry> entries(const std::string& collection) const;

    size_t capacity() const
    {
        return capacity_;
    }

  private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<AuditEntry>> trails_;
};

} // namespace repodb::storage
