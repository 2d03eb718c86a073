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
 * @file write_queue.hpp
 * @brief Serialised, conflict-retrying writer for collection documents.
 *
 * @details
 * Every collection owns one FIFO lane drained by one dedicated worker thread,
 * so at most one PUT per remote path is in flight at any time. Each attempt
 * re-reads the document to obtain its current version tag, then issues a
 * conditional PUT. A version conflict keeps the item at the head of its lane
 * and retries after an exponential backoff; every other failure rejects the
 * item's future immediately and the lane moves on.
 */

#pragma once

#include "repodb/infra/json.hpp"
#include "repodb/remote/content_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace repodb::storage {

/**
 * @enum WritePolicy
 * @brief What a retried write puts on top of the newer remote version.
 */
enum class WritePolicy {
    /// Re-apply the request's mutation to the freshly fetched document.
    REBASE,
    /// PUT the snapshot computed at call time with the fresh sha (last writer wins).
    SNAPSHOT
};

/// @brief Parses "rebase" / "snapshot". @throws std::invalid_argument otherwise.
WritePolicy parse_write_policy(const std::string& name);

const char* write_policy_name(WritePolicy policy);

/**
 * @struct QueueOptions
 * @brief Retry budget and backoff curve.
 */
struct QueueOptions {
    int max_attempts = 5;
    long backoff_base_ms = 250;
    double backoff_factor = 2.0;
    long backoff_cap_ms = 5000;

    /// @brief Wall-clock budget per write, measured from enqueue; 0 disables it.
    /// Checked before every attempt, the first included.
    long write_deadline_ms = 0;

    WritePolicy policy = WritePolicy::REBASE;
};

/**
 * @brief Applies a logical change to the current record array in place.
 *
 * @return The affected record (or an array of records for deletes), copied.
 * @throws NotFoundError when the target no longer exists.
 */
using Mutation = std::function<infra::JsonPtr(cJSON* records)>;

/**
 * @struct WriteRequest
 * @brief One queued write.
 */
struct WriteRequest {
    std::string collection;
    std::string action;  ///< "insert", "update", "delete" or "init".
    std::string message; ///< Commit message.

    /// @brief Full document computed at call time (used by `SNAPSHOT`).
    infra::JsonPtr snapshot;

    /// @brief Record(s) affected at call time (reported by `SNAPSHOT`).
    infra::JsonPtr affected;

    /// @brief Logical change (used by `REBASE`).
    Mutation mutation;

    /// @brief Create the document as `[]` if absent; a conflict means it already exists.
    bool create_only = false;
};

/**
 * @struct WriteResult
 * @brief Outcome of a committed write.
 */
struct WriteResult {
    std::string sha;        ///< Version tag of the committed document.
    infra::JsonPtr record;  ///< Affected record(s) as committed.
    infra::JsonPtr records; ///< Full committed document (empty for `create_only`).
    int attempts = 0;       ///< PUTs issued, including the successful one.
    bool created = true;    ///< False when a `create_only` write found the document present.
};

/**
 * @class WriteQueue
 * @brief Per-collection lanes with bounded conflict retries.
 *
 * A lane and its worker thread are created on the first write to a
 * collection and live until the queue is destroyed; idle lanes are not
 * retired. Thread count therefore equals the number of distinct
 * collections ever written through this queue.
 */
class WriteQueue {
  public:
    /**
     * @brief Runs on the lane worker after an item left its lane and before its
     * future is resolved.
     *
     * @param result The committed result, or `nullptr` when the write was rejected.
     */
    using CompletionHook =
        std::function<void(const WriteRequest& request, const WriteResult* result)>;

    WriteQueue(remote::ContentClient& client, QueueOptions options, CompletionHook hook = nullptr);

    /**
     * @brief Stops accepting work, lets every lane drain, then joins the workers.
     */
    ~WriteQueue();

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    /**
     * @brief Appends `request` to its collection's lane.
     *
     * The future resolves once the write is committed, or holds one of:
     * `QueueExhaustedError` (conflict budget or deadline spent), `NetworkError`,
     * `NotFoundError`, `SchemaValidationError`.
     *
     * @throws DbError when the queue is shutting down.
     */
    std::future<WriteResult> enqueue(WriteRequest request);

    /// @brief Items queued for `collection`, including the one being written.
    size_t pending(const std::string& collection) const;

    /// @brief Lanes (and worker threads) opened so far.
    size_t lane_count() const;

    /// @brief `min(base * factor^(attempt - 1), cap)`.
    std::chrono::milliseconds backoff_delay(int attempt) const;

    const QueueOptions& options() const
    {
        return options_;
    }

  private:
    struct Item {
        WriteRequest request;
        std::promise<WriteResult> promise;
        std::chrono::steady_clock::time_point enqueued_at;
    };

    struct Lane {
        std::string collection;
        std::deque<Item> items;
        std::mutex mutex;
        std::condition_variable condition;
        std::thread worker;
    };

    remote::ContentClient& client_;
    QueueOptions options_;
    CompletionHook hook_;

    mutable std::mutex lanes_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Lane>> lanes_;
    std::atomic<bool> stop_;

    Lane& lane_for(const std::string& collection);
    void drain(Lane& lane);
    void process(Lane& lane, Item& item);
    WriteResult attempt(const WriteRequest& request, const std::string& path, int attempt_no);
    void finish(Lane& lane, WriteResult* result, std::exception_ptr error);
};

} // namespace repodb::storage
