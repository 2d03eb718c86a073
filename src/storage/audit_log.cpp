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
 * @file audit_log.cpp
 * @brief Ring-buffer bookkeeping for the audit trail.
 */

#include "repodb/storage/audit_log.hpp"

#include "repodb/infra/clock.hpp"

namespace repodb::storage {

using infra::Json;

AuditEntry::AuditEntry(std::string action, infra::JsonPtr record, int64_t timestamp_ms)
    : action(std::move(action)), record(std::move(record)), timestamp_ms(timestamp_ms)
{
}

AuditEntry::AuditEntry(const AuditEntry& other)
    : action(other.action), record(Json::clone(other.record.get())),
      timestamp_ms(other.timestamp_ms)
{
}

AuditEntry& AuditEntry::operator=(const AuditEntry& other)
{
    if (this != &other) {
        action = other.action;
        record = Json::clone(other.record.get());
        timestamp_ms = other.timestamp_ms;
    }
    return *this;
}

AuditLog::AuditLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void AuditLog::record(const std::string& collection, const std::string& action,
                      const cJSON* record)
{
    AuditEntry entry(action, Json::clone(record), infra::Clock::epoch_millis());

    std::lock_guard<std::mutex> lock(mutex_);
    auto& trail = trails_[collection];
    trail.push_back(std::move(entry));
    while (trail.size() > capacity_) {
        trail.pop_front();
    }
}

std::vector<AuditEntry> AuditLog::entries(const std::string& collection) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = trails_.find(collection);
    if (it == trails_.end()) {
        return {};
    }
    return std::vector<AuditEntry>(it->second.begin(), it->second.end());
}

} // namespace repodb::storage
