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
 * @file db.hpp
 * @brief High-level CRUD controller over repository-backed collections.
 *
 * @details
 * This header defines the `Db` class, the orchestration layer of RepoDB. Each
 * collection is one JSON array document in a remote repository. `Db` serves
 * reads from the `CollectionCache`, validates writes against the
 * `SchemaRegistry`, applies them optimistically to the cache, hands them to the
 * `WriteQueue` for conditional commits, and fans change notifications out
 * through the `EventBus`.
 */

#pragma once

#include "repodb/infra/json.hpp"
#include "repodb/infra/scheduler.hpp"
#include "repodb/remote/content_client.hpp"
#include "repodb/storage/audit_log.hpp"
#include "repodb/storage/cache.hpp"
#include "repodb/storage/event_bus.hpp"
#include "repodb/storage/schema.hpp"
#include "repodb/storage/write_queue.hpp"

#include <cJSON.h>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace repodb::storage {

/**
 * @struct DbOptions
 * @brief Everything `Db` needs besides the transport.
 */
struct DbOptions {
    remote::StoreConfig store;
    QueueOptions queue;

    /// @brief Worker threads used by `initialize_all()`.
    size_t pool_threads = 4;
};

/**
 * @class Db
 * @brief The central controller for cached, conflict-safe collection access.
 *
 * @details
 * **Core Responsibilities:**
 * - **Reads:** Served from the cache; a miss or a forced read fetches the
 *   document, a missing document is created as `[]` first.
 * - **Writes:** Validated before any network traffic, applied optimistically,
 *   then committed through the collection's write lane.
 * - **Concurrency Control:** A per-collection mutex makes "read cache, derive
 *   the new snapshot, publish it, enqueue the write" atomic, so concurrent
 *   inserts always receive distinct ids.
 *
 * Records are handed out as deep copies (`infra::JsonPtr`); the caller owns them.
 */
class Db {
  public:
    using Predicate = std::function<bool(const cJSON* record)>;

    /**
     * @param http Transport; must outlive the `Db`.
     * @param options Repository coordinates and write-queue tuning.
     */
    Db(remote::HttpClient& http, DbOptions options);

    /**
     * @brief Destructor.
     *
     * Blocks until every queued write has been committed or rejected.
     */
    ~Db();

    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    // ========================================================================
    //  READ OPERATIONS
    // ========================================================================

    /**
     * @brief Returns a collection's records.
     *
     * @param collection The collection name.
     * @param force Bypass the cache and fetch the remote document.
     * @return infra::JsonPtr A JSON array (copy).
     *
     * @throws NetworkError when the store cannot be reached.
     */
    infra::JsonPtr load(const std::string& collection, bool force = false);

    /**
     * @brief Looks a record up by `id` or `uid`.
     *
     * @return infra::JsonPtr The record, or an empty handle when absent.
     */
    infra::JsonPtr find_by_id(const std::string& collection, const std::string& key);

    /**
     * @brief Linear scan for records whose fields equal every member of `filters`.
     *
     * @param filters JSON object; `nullptr` or `{}` matches every record.
     * @return infra::JsonPtr A JSON array of matching records.
     */
    infra::JsonPtr find(const std::string& collection, const cJSON* filters);

    /// @brief Linear scan with an arbitrary predicate.
    infra::JsonPtr find(const std::string& collection, const Predicate& predicate);

    // ========================================================================
    //  WRITE OPERATIONS
    // ========================================================================

    /**
     * @brief Inserts a record and waits for the commit.
     *
     * Schema defaults are applied, then `id` (next sequence number) and `uid`
     * (UUID v4) are generated; caller-supplied keys are overwritten.
     *
     * @return infra::JsonPtr The record as committed.
     *
     * @throws SchemaValidationError before any network call.
     * @throws QueueExhaustedError when the conflict budget is spent.
     */
    infra::JsonPtr insert(const std::string& collection, const cJSON* partial);

    /**
     * @brief Merges `partial` into the record matching `key` and waits for the commit.
     *
     * `id` and `uid` are never changed; `updated_at` is stamped.
     *
     * @throws NotFoundError when no record matches `key`.
     */
    infra::JsonPtr update(const std::string& collection, const std::string& key,
                          const cJSON* partial);

    /**
     * @brief Deletes every record matching `key` and waits for the commit.
     *
     * @throws NotFoundError when no record matches `key`.
     */
    void remove(const std::string& collection, const std::string& key);

    /// @brief `insert()` without waiting: the future resolves on commit.
    std::future<WriteResult> insert_async(const std::string& collection, const cJSON* partial);

    /// @brief `update()` without waiting.
    std::future<WriteResult> update_async(const std::string& collection, const std::string& key,
                                          const cJSON* partial);

    /// @brief `remove()` without waiting; the result's record is the array of removed records.
    std::future<WriteResult> remove_async(const std::string& collection, const std::string& key);

    // ========================================================================
    //  ADMINISTRATIVE OPERATIONS
    // ========================================================================

    void register_schema(const std::string& collection, Schema schema);

    const SchemaRegistry& schemas() const
    {
        return schemas_;
    }

    /**
     * @brief Loads every collection with a registered schema, concurrently.
     *
     * Missing documents are created. Rethrows the first failure after every
     * load has finished.
     */
    void initialize_all();

    /**
     * @brief Registers a callback receiving the record array on every change.
     *
     * @warning Callbacks may run on a collection's write lane. Blocking on a
     * write of the same collection from inside one deadlocks; use the
     * `*_async` variants and drop the future instead.
     */
    Subscription subscribe(const std::string& collection, EventBus::Callback callback);

    /// @brief The last (at most 100) committed actions, oldest first.
    std::vector<AuditEntry> audit_trail(const std::string& collection) const;

    /// @brief Writes queued for `collection`, including the one in flight.
    size_t pending_writes(const std::string& collection) const;

  private:
    /// @brief Per-collection serialisation of optimistic updates.
    struct CollectionState {
        std::mutex mutex;

        /// @brief Bumped on every write completion; a fetch that straddles one is stale.
        uint64_t generation = 0;
    };

    remote::ContentClient client_;
    SchemaRegistry schemas_;
    CollectionCache cache_;
    EventBus bus_;
    AuditLog audit_;
    infra::Scheduler scheduler_;

    mutable std::mutex states_mutex_;
    std::unordered_map<std::string, std::unique_ptr<CollectionState>> states_;

    /// @brief Declared last: its destructor drains the lanes while the rest is alive.
    WriteQueue queue_;

    // --- Internal Logic ---

    CollectionState& state_for(const std::string& collection);

    /// @brief Fetches the document and publishes it unless writes are pending.
    infra::JsonPtr fetch_and_publish(const std::string& collection);

    /// @brief Creates `[]` through the collection's lane; idempotent.
    void initialize_collection(const std::string& collection);

    void ensure_loaded(const std::string& collection);

    /// @brief Enqueues the write, publishes the derived snapshot, releases `lock`, notifies.
    std::future<WriteResult> stage(std::unique_lock<std::mutex>& lock,
                                   const std::string& collection, infra::JsonPtr records,
                                   WriteRequest request);

    /// @brief Lane-side completion: audit, then refresh once the lane is idle.
    void on_write_complete(const WriteRequest& request, const WriteResult* result);
};

} // namespace repodb::storage
