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
 * @file write_queue.cpp
 * @brief Lane workers, retry loop and write policies.
 */

#include "repodb/storage/write_queue.hpp"

#include "repodb/infra/logger.hpp"
#include "repodb/infra/string.hpp"
#include "repodb/storage/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace repodb::storage {

using infra::Json;
using infra::JsonPtr;
using infra::LogLevel;
using infra::Logger;

WritePolicy parse_write_policy(const std::string& name)
{
    const std::string normalized = infra::String::to_lower(infra::String::trim(name));
    if (normalized == "rebase")
        return WritePolicy::REBASE;
    if (normalized == "snapshot")
        return WritePolicy::SNAPSHOT;
    throw std::invalid_argument("unknown write policy '" + name + "'");
}

const char* write_policy_name(WritePolicy policy)
{
    return policy == WritePolicy::SNAPSHOT ? "snapshot" : "rebase";
}

WriteQueue::WriteQueue(remote::ContentClient& client, QueueOptions options, CompletionHook hook)
    : client_(client), options_(options), hook_(std::move(hook)), stop_(false)
{
    options_.max_attempts = std::max(options_.max_attempts, 1);
}

WriteQueue::~WriteQueue()
{
    stop_ = true;

    std::vector<Lane*> lanes;
    {
        std::lock_guard<std::mutex> lock(lanes_mutex_);
        for (auto& [name, lane] : lanes_) {
            lanes.push_back(lane.get());
        }
    }

    for (Lane* lane : lanes) {
        {
            std::lock_guard<std::mutex> lock(lane->mutex);
        }
        lane->condition.notify_all();
    }

    for (Lane* lane : lanes) {
        if (lane->worker.joinable()) {
            lane->worker.join();
        }
    }
}

std::future<WriteResult> WriteQueue::enqueue(WriteRequest request)
{
    if (stop_) {
        throw DbError("Queue: Rejecting write to " + request.collection + ", queue is stopping");
    }

    Lane& lane = lane_for(request.collection);

    Item item;
    item.request = std::move(request);
    item.enqueued_at = std::chrono::steady_clock::now();
    std::future<WriteResult> future = item.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(lane.mutex);
        lane.items.push_back(std::move(item));
    }
    lane.condition.notify_one();

    return future;
}

size_t WriteQueue::pending(const std::string& collection) const
{
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    auto it = lanes_.find(collection);
    if (it == lanes_.end()) {
        return 0;
    }
    std::lock_guard<std::mutex> lane_lock(it->second->mutex);
    return it->second->items.size();
}

size_t WriteQueue::lane_count() const
{
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    return lanes_.size();
}

std::chrono::milliseconds WriteQueue::backoff_delay(int attempt) const
{
    const int exponent = std::max(attempt, 1) - 1;
    const double raw =
        static_cast<double>(options_.backoff_base_ms) * std::pow(options_.backoff_factor, exponent);
    const double capped = std::min(raw, static_cast<double>(options_.backoff_cap_ms));
    return std::chrono::milliseconds(static_cast<long long>(std::max(capped, 0.0)));
}

WriteQueue::Lane& WriteQueue::lane_for(const std::string& collection)
{
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    auto it = lanes_.find(collection);
    if (it != lanes_.end()) {
        return *it->second;
    }

    auto lane = std::make_unique<Lane>();
    lane->collection = collection;
    Lane* raw = lane.get();
    raw->worker = std::thread([this, raw] { drain(*raw); });
    lanes_.emplace(collection, std::move(lane));

    Logger::log(LogLevel::DEBUG, "Queue: Lane opened for " + collection);
    return *raw;
}

void WriteQueue::drain(Lane& lane)
{
    while (true) {
        Item* item = nullptr;

        {
            std::unique_lock<std::mutex> lock(lane.mutex);
            lane.condition.wait(lock, [this, &lane] { return stop_ || !lane.items.empty(); });

            // Exit only once stopping AND drained.
            if (lane.items.empty()) {
                return;
            }

            // The head stays in the lane while it is written so `pending()`
            // keeps counting it; deque references survive push_back.
            item = &lane.items.front();
        }

        process(lane, *item);
    }
}

void WriteQueue::process(Lane& lane, Item& item)
{
    const WriteRequest& request = item.request;
    const std::string path = client_.path_for(request.collection);

    const bool has_deadline = options_.write_deadline_ms > 0;
    const auto deadline = item.enqueued_at + std::chrono::milliseconds(options_.write_deadline_ms);

    auto miss_deadline = [&](int attempts) {
        Logger::log(LogLevel::ERROR, "Queue: Deadline of " +
                                         std::to_string(options_.write_deadline_ms) +
                                         " ms exceeded for " + path);
        finish(lane, nullptr,
               std::make_exception_ptr(QueueExhaustedError(
                   "Write to " + path + " missed its deadline after " +
                       std::to_string(attempts) + " attempts",
                   attempts)));
    };

    for (int attempt_no = 1;; ++attempt_no) {
        // Time spent waiting behind earlier items in the lane counts too.
        if (has_deadline && std::chrono::steady_clock::now() > deadline) {
            miss_deadline(attempt_no - 1);
            return;
        }

        WriteResult result;
        try {
            result = attempt(request, path, attempt_no);
        } catch (const ConflictError&) {
            if (attempt_no >= options_.max_attempts) {
                Logger::log(LogLevel::ERROR, "Queue: Giving up on " + path + " after " +
                                                 std::to_string(attempt_no) +
                                                 " conflicting attempts");
                finish(lane, nullptr,
                       std::make_exception_ptr(QueueExhaustedError(
                           "Write to " + path + " still conflicting after " +
                               std::to_string(attempt_no) + " attempts",
                           attempt_no)));
                return;
            }

            const auto delay = backoff_delay(attempt_no);
            if (has_deadline && std::chrono::steady_clock::now() + delay > deadline) {
                miss_deadline(attempt_no);
                return;
            }

            Logger::log(LogLevel::WARN, "Queue: Conflict on " + path + " (attempt " +
                                            std::to_string(attempt_no) + "/" +
                                            std::to_string(options_.max_attempts) +
                                            "), retrying in " + std::to_string(delay.count()) +
                                            " ms");
            std::this_thread::sleep_for(delay);
            continue;
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR,
                        "Queue: " + request.action + " on " + path + " failed: " + e.what());
            finish(lane, nullptr, std::current_exception());
            return;
        }

        result.attempts = attempt_no;
        finish(lane, &result, nullptr);
        return;
    }
}

WriteResult WriteQueue::attempt(const WriteRequest& request, const std::string& path,
                                int attempt_no)
{
    WriteResult result;

    if (request.create_only) {
        try {
            result.sha = client_.put(path, "[]", "", request.message);
            Logger::log(LogLevel::INFO, "Queue: Created " + path);
        } catch (const ConflictError&) {
            result.created = false;
            Logger::log(LogLevel::DEBUG, "Queue: " + path + " already exists");
        }
        return result;
    }

    Logger::log(LogLevel::TRACE, "Queue: " + request.action + " on " + path + ", attempt " +
                                     std::to_string(attempt_no));

    // Always re-read: the version tag (and, for REBASE, the content) must be
    // the store's current one for the conditional PUT to have a chance.
    remote::RemoteDocument current;
    bool exists = true;
    try {
        current = client_.get(path);
    } catch (const NotFoundError&) {
        exists = false;
    }

    JsonPtr document;
    if (options_.policy == WritePolicy::REBASE && request.mutation) {
        document = exists ? Json::parse(current.content) : Json::array();
        if (!document || !cJSON_IsArray(document.get())) {
            throw NetworkError("Queue: " + path + " does not hold a JSON array");
        }
        result.record = request.mutation(document.get());
    } else {
        document = Json::clone(request.snapshot.get());
        if (!document) {
            throw DbError("Queue: " + request.action + " on " + path + " carries no snapshot");
        }
        result.record = Json::clone(request.affected.get());
    }

    result.sha = client_.put(path, Json::print(document.get(), true), exists ? current.sha : "",
                             request.message);
    result.records = std::move(document);
    return result;
}

void WriteQueue::finish(Lane& lane, WriteResult* result, std::exception_ptr error)
{
    WriteRequest request;
    std::promise<WriteResult> promise;

    {
        std::lock_guard<std::mutex> lock(lane.mutex);
        request = std::move(lane.items.front().request);
        promise = std::move(lane.items.front().promise);
        lane.items.pop_front();
    }

    if (hook_) {
        try {
            hook_(request, result);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR, "Queue: Completion hook for " + lane.collection +
                                             " threw: " + std::string(e.what()));
        } catch (...) {
            // The promise below must still be settled or the writer blocks forever.
            Logger::log(LogLevel::ERROR, "Queue: Completion hook for " + lane.collection +
                                             " threw a non-standard exception");
        }
    }

    if (result) {
        promise.set_value(std::move(*result));
    } else {
        promise.set_exception(error);
    }
}

} // namespace repodb::storage
