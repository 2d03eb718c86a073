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
 * @file cache.hpp
 * @brief In-process snapshot of every collection the process has touched.
 *
 * @details
 * Each entry holds the decoded record array together with the validators of
 * the remote version it came from (`etag` for conditional reads, `sha` for
 * conditional writes). The cache itself never decides *when* to refresh;
 * `Db` owns that policy and uses `fetch()` / `store()` under its own locks.
 */

#pragma once

#include "repodb/infra/json.hpp"
#include "repodb/remote/content_client.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace repodb::storage {

/**
 * @struct CacheEntry
 * @brief One collection's cached state.
 */
struct CacheEntry {
    infra::JsonPtr records; ///< JSON array of records.
    std::string etag;       ///< Validator of the last fetched remote version.
    std::string sha;        ///< Version tag of the last fetched remote version.
};

/**
 * @struct FetchResult
 * @brief Outcome of a conditional read against the store.
 */
struct FetchResult {
    infra::JsonPtr records;
    std::string etag;
    std::string sha;

    /// @brief True when the store answered 304; `records` is then the cached copy.
    bool not_modified = false;
};

/**
 * @class CollectionCache
 * @brief Thread-safe collection -> `CacheEntry` map.
 *
 * Every accessor hands out deep copies so callers can never alias the cached
 * tree while another thread replaces it.
 */
class CollectionCache {
  public:
    explicit CollectionCache(remote::ContentClient& client);

    CollectionCache(const CollectionCache&) = delete;
    CollectionCache& operator=(const CollectionCache&) = delete;

    bool contains(const std::string& collection) const;

    /// @brief Copy of the cached records; empty handle when the collection was never loaded.
    infra::JsonPtr records(const std::string& collection) const;

    std::string etag(const std::string& collection) const;
    std::string sha(const std::string& collection) const;

    /**
     * @brief Conditional GET of the collection document.
     *
     * Sends the cached ETag (if any). Does not modify the cache.
     *
     * @throws NotFoundError when the document does not exist.
     * @throws NetworkError on transport failure or when the document is not a JSON array.
     */
    FetchResult fetch(const std::string& collection) const;

    /// @brief Replaces the whole entry with freshly fetched remote state.
    void store(const std::string& collection, infra::JsonPtr records, std::string etag,
               std::string sha);

    /**
     * @brief Replaces the records with optimistic local state.
     *
     * Keeps the sha and drops the ETag, so the next `fetch()` is unconditional.
     */
    void replace_records(const std::string& collection, infra::JsonPtr records);

    const remote::ContentClient& client() const
    {
        return client_;
    }

  private:
    remote::ContentClient& client_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
};

} // namespace repodb::storage
