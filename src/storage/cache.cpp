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
 * @file cache.cpp
 * @brief Collection snapshot storage and conditional fetch.
 */

#include "repodb/storage/cache.hpp"

#include "repodb/infra/logger.hpp"
#include "repodb/storage/errors.hpp"

namespace repodb::storage {

using infra::Json;
using infra::JsonPtr;
using infra::LogLevel;
using infra::Logger;

CollectionCache::CollectionCache(remote::ContentClient& client) : client_(client) {}

bool CollectionCache::contains(const std::string& collection) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(collection) > 0;
}

JsonPtr CollectionCache::records(const std::string& collection) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(collection);
    if (it == entries_.end()) {
        return nullptr;
    }
    return Json::clone(it->second.records.get());
}

std::string CollectionCache::etag(const std::string& collection) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(collection);
    return it == entries_.end() ? "" : it->second.etag;
}

std::string CollectionCache::sha(const std::string& collection) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(collection);
    return it == entries_.end() ? "" : it->second.sha;
}

FetchResult CollectionCache::fetch(const std::string& collection) const
{
    const std::string path = client_.path_for(collection);
    remote::RemoteDocument doc = client_.get(path, etag(collection));

    FetchResult result;
    if (doc.not_modified) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(collection);
        if (it != entries_.end()) {
            result.records = Json::clone(it->second.records.get());
            result.etag = it->second.etag;
            result.sha = it->second.sha;
            result.not_modified = true;
            Logger::log(LogLevel::TRACE, "Cache: " + collection + " unchanged (304)");
            return result;
        }
        // The entry vanished between sending the ETag and the answer; the
        // 304 carries nothing usable, so fall back to a plain read.
        doc = client_.get(path);
    }

    result.records = Json::parse(doc.content);
    if (!result.records || !cJSON_IsArray(result.records.get())) {
        throw NetworkError("Cache: " + path + " does not hold a JSON array");
    }
    result.etag = std::move(doc.etag);
    result.sha = std::move(doc.sha);
    return result;
}

void CollectionCache::store(const std::string& collection, JsonPtr records, std::string etag,
                            std::string sha)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CacheEntry& entry = entries_[collection];
    entry.records = std::move(records);
    entry.etag = std::move(etag);
    entry.sha = std::move(sha);
}

void CollectionCache::replace_records(const std::string& collection, JsonPtr records)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CacheEntry& entry = entries_[collection];
    entry.records = std::move(records);
    // The ETag no longer describes these records; a 304 must not resurrect them.
    entry.etag.clear();
}

} // namespace repodb::storage
