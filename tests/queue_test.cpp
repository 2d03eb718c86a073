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
 * @file queue_test.cpp
 * @brief Unit tests for the per-collection write lanes.
 *
 * @details
 * Exercises the queue directly against the in-memory contents API:
 * serialisation per path, bounded conflict retries, immediate rejection of
 * non-conflict failures, deadlines and the completion hook.
 */

#include "fake_contents_api.hpp"
#include "framework.hpp"
#include "repodb/infra/id_generator.hpp"
#include "repodb/infra/json.hpp"
#include "repodb/storage/errors.hpp"
#include "repodb/storage/write_queue.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <vector>

using repodb::infra::Json;
using repodb::infra::JsonPtr;
using repodb::storage::QueueOptions;
using repodb::storage::WritePolicy;
using repodb::storage::WriteQueue;
using repodb::storage::WriteRequest;
using repodb::storage::WriteResult;
using repodb::test::FakeContentsApi;

namespace {

/// Request whose mutation appends `{"id": next, "name": name}`.
WriteRequest append_request(const std::string& collection, const std::string& name)
{
    WriteRequest request;
    request.collection = collection;
    request.action = "insert";
    request.message = "Update " + collection;
    request.mutation = [name](cJSON* records) {
        JsonPtr record = Json::object();
        Json::set_string(record.get(), "id",
                         repodb::infra::IdGenerator::next_sequence_id(records));
        Json::set_string(record.get(), "name", name);
        JsonPtr copy = Json::clone(record.get());
        cJSON_AddItemToArray(records, record.release());
        return copy;
    };
    return request;
}

} // namespace

void test_queue_commits_in_order()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());

    std::vector<std::future<WriteResult>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(queue.enqueue(append_request("users", "user-" + std::to_string(i))));
    }
    for (int i = 0; i < 4; ++i) {
        WriteResult result = futures[i].get();
        ASSERT_EQ(result.attempts, 1);
        ASSERT_EQ(Json::get_string(result.record.get(), "id"), std::to_string(i + 1));
    }

    JsonPtr stored = fake.records("db/users.json");
    ASSERT_EQ(cJSON_GetArraySize(stored.get()), 4);
    ASSERT_EQ(fake.count("PUT"), static_cast<size_t>(4));
    ASSERT_EQ(queue.pending("users"), static_cast<size_t>(0));
}

/**
 * @brief At most one PUT per path is in flight, whatever the submission rate.
 */
void test_queue_serialises_per_path()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    fake.set_put_latency(std::chrono::milliseconds(15));
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());

    std::vector<std::future<WriteResult>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(queue.enqueue(append_request("users", "u")));
        futures.push_back(queue.enqueue(append_request("notes", "n")));
    }
    ASSERT_TRUE(queue.pending("users") > 0);
    for (auto& future : futures) {
        future.get();
    }

    ASSERT_EQ(fake.max_concurrent_puts("db/users.json"), 1);
    ASSERT_EQ(fake.max_concurrent_puts("db/notes.json"), 1);
    ASSERT_EQ(cJSON_GetArraySize(fake.records("db/users.json").get()), 5);
    ASSERT_EQ(cJSON_GetArraySize(fake.records("db/notes.json").get()), 5);
}

/**
 * @brief One lane per collection, kept open after it drains.
 */
void test_queue_lanes_per_collection()
{
    FakeContentsApi fake;
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());
    ASSERT_EQ(queue.lane_count(), static_cast<size_t>(0));

    queue.enqueue(append_request("users", "a")).get();
    queue.enqueue(append_request("notes", "b")).get();
    queue.enqueue(append_request("users", "c")).get();
    ASSERT_EQ(queue.lane_count(), static_cast<size_t>(2));
    ASSERT_EQ(queue.pending("users"), static_cast<size_t>(0));
}

/**
 * @brief A permanent conflict costs exactly `max_attempts` PUTs, then rejects.
 */
void test_queue_bounded_conflict_retries()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    fake.conflict_next_puts(-1);
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());

    auto future = queue.enqueue(append_request("users", "Ada"));
    try {
        future.get();
        ASSERT_TRUE(false);
    } catch (const repodb::storage::QueueExhaustedError& e) {
        ASSERT_EQ(e.attempts(), 5);
        ASSERT_EQ(std::string(e.kind()), std::string("queue_exhausted"));
    }
    ASSERT_EQ(fake.count("PUT", "db/users.json"), static_cast<size_t>(5));
    ASSERT_EQ(fake.content("db/users.json"), std::string("[]"));

    // The lane keeps working once the conflicts stop.
    fake.conflict_next_puts(0);
    WriteResult next = queue.enqueue(append_request("users", "Grace")).get();
    ASSERT_EQ(next.attempts, 1);
}

void test_queue_recovers_from_transient_conflicts()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    fake.conflict_next_puts(2);
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());

    WriteResult result = queue.enqueue(append_request("users", "Ada")).get();
    ASSERT_EQ(result.attempts, 3);
    ASSERT_EQ(fake.count("PUT"), static_cast<size_t>(3));
    // Every attempt re-read the document first.
    ASSERT_EQ(fake.count("GET"), static_cast<size_t>(3));
}

/**
 * @brief Failures other than version conflicts reject without a retry.
 */
void test_queue_rejects_non_conflict_failure_immediately()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    fake.fail_next("PUT", 500, "Server Error");
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());

    auto failed = queue.enqueue(append_request("users", "Ada"));
    auto next = queue.enqueue(append_request("users", "Grace"));

    try {
        failed.get();
        ASSERT_TRUE(false);
    } catch (const repodb::storage::NetworkError& e) {
        ASSERT_EQ(e.status(), 500L);
    }
    ASSERT_EQ(next.get().attempts, 1);
    ASSERT_EQ(fake.count("PUT"), static_cast<size_t>(2));
}

void test_queue_mutation_failure_rejects()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());

    WriteRequest request;
    request.collection = "users";
    request.action = "update";
    request.mutation = [](cJSON*) -> JsonPtr {
        throw repodb::storage::NotFoundError("Record 7 not found in users");
    };

    ASSERT_THROWS(queue.enqueue(std::move(request)).get(), repodb::storage::NotFoundError);
    ASSERT_EQ(fake.count("PUT"), static_cast<size_t>(0));
}

/**
 * @brief A conflict whose backoff would overrun the deadline rejects at once.
 */
void test_queue_deadline()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    fake.conflict_next_puts(-1);
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());

    QueueOptions options = repodb::test::fast_queue();
    options.max_attempts = 100;
    options.backoff_base_ms = 500;
    options.backoff_cap_ms = 500;
    options.write_deadline_ms = 200;
    WriteQueue queue(client, options);

    try {
        queue.enqueue(append_request("users", "Ada")).get();
        ASSERT_TRUE(false);
    } catch (const repodb::storage::QueueExhaustedError& e) {
        ASSERT_EQ(e.attempts(), 1);
    }
    ASSERT_EQ(fake.count("PUT"), static_cast<size_t>(1));
}

/**
 * @brief Waiting behind a slow head item spends the deadline before any PUT.
 */
void test_queue_deadline_covers_lane_wait()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    fake.set_put_latency(std::chrono::milliseconds(400));
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());

    QueueOptions options = repodb::test::fast_queue();
    options.write_deadline_ms = 200;
    WriteQueue queue(client, options);

    auto head = queue.enqueue(append_request("users", "Ada"));
    auto queued = queue.enqueue(append_request("users", "Grace"));

    ASSERT_EQ(head.get().attempts, 1);
    try {
        queued.get();
        ASSERT_TRUE(false);
    } catch (const repodb::storage::QueueExhaustedError& e) {
        ASSERT_EQ(e.attempts(), 0);
    }

    ASSERT_EQ(fake.count("PUT"), static_cast<size_t>(1));
    JsonPtr stored = fake.records("db/users.json");
    ASSERT_EQ(cJSON_GetArraySize(stored.get()), 1);
}

void test_queue_backoff_curve()
{
    FakeContentsApi fake;
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, QueueOptions());

    ASSERT_EQ(queue.backoff_delay(1).count(), 250LL);
    ASSERT_EQ(queue.backoff_delay(2).count(), 500LL);
    ASSERT_EQ(queue.backoff_delay(5).count(), 4000LL);
    ASSERT_EQ(queue.backoff_delay(6).count(), 5000LL);
    ASSERT_EQ(queue.backoff_delay(40).count(), 5000LL);

    QueueOptions zero;
    zero.max_attempts = 0;
    WriteQueue clamped(client, zero);
    ASSERT_EQ(clamped.options().max_attempts, 1);
}

/**
 * @brief `create_only` writes `[]` once; a second one finds the file present.
 */
void test_queue_create_only()
{
    FakeContentsApi fake;
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue());

    auto init_request = [] {
        WriteRequest request;
        request.collection = "users";
        request.action = "init";
        request.message = "Initialize users collection";
        request.create_only = true;
        return request;
    };

    ASSERT_TRUE(queue.enqueue(init_request()).get().created);
    ASSERT_FALSE(queue.enqueue(init_request()).get().created);
    ASSERT_EQ(fake.content("db/users.json"), std::string("[]"));
}

void test_queue_snapshot_policy_writes_call_time_document()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", R"([{"id":"1","name":"Ada"}])");
    fake.conflict_next_puts(1);
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());
    WriteQueue queue(client, repodb::test::fast_queue(WritePolicy::SNAPSHOT));

    WriteRequest request;
    request.collection = "users";
    request.action = "insert";
    request.snapshot = Json::parse(R"([{"id":"9","name":"Only"}])");
    request.affected = Json::parse(R"({"id":"9","name":"Only"})");

    WriteResult result = queue.enqueue(std::move(request)).get();
    ASSERT_EQ(result.attempts, 2);
    ASSERT_EQ(Json::get_string(result.record.get(), "id"), std::string("9"));

    JsonPtr stored = fake.records("db/users.json");
    ASSERT_EQ(cJSON_GetArraySize(stored.get()), 1);
    ASSERT_EQ(Json::get_string(cJSON_GetArrayItem(stored.get(), 0), "name"), std::string("Only"));
}

/**
 * @brief The hook sees every outcome before the caller's future resolves.
 */
void test_queue_completion_hook()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());

    std::atomic<int> committed{0};
    std::atomic<int> rejected{0};
    WriteQueue queue(client, repodb::test::fast_queue(),
                     [&](const WriteRequest&, const WriteResult* result) {
                         if (result) {
                             committed++;
                         } else {
                             rejected++;
                         }
                     });

    queue.enqueue(append_request("users", "Ada")).get();
    ASSERT_EQ(committed.load(), 1);

    fake.fail_next("PUT", 403, "Forbidden");
    ASSERT_THROWS(queue.enqueue(append_request("users", "Eve")).get(),
                  repodb::storage::NetworkError);
    ASSERT_EQ(rejected.load(), 1);
}

/**
 * @brief A hook throwing a non-standard type still settles the future.
 */
void test_queue_completion_hook_throwing_any_type()
{
    FakeContentsApi fake;
    fake.seed("db/users.json", "[]");
    repodb::remote::ContentClient client(fake, repodb::test::fake_store());

    WriteQueue queue(client, repodb::test::fast_queue(),
                     [](const WriteRequest&, const WriteResult*) { throw 42; });

    WriteResult first = queue.enqueue(append_request("users", "Ada")).get();
    ASSERT_EQ(Json::get_string(first.record.get(), "id"), std::string("1"));

    // The lane worker survived and keeps draining.
    WriteResult second = queue.enqueue(append_request("users", "Grace")).get();
    ASSERT_EQ(Json::get_string(second.record.get(), "id"), std::string("2"));
    ASSERT_EQ(cJSON_GetArraySize(fake.records("db/users.json").get()), 2);
}

void test_queue_write_policy_names()
{
    ASSERT_TRUE(repodb::storage::parse_write_policy(" Rebase ") == WritePolicy::REBASE);
    ASSERT_TRUE(repodb::storage::parse_write_policy("snapshot") == WritePolicy::SNAPSHOT);
    ASSERT_THROWS(repodb::storage::parse_write_policy("merge"), std::invalid_argument);
    ASSERT_EQ(std::string(repodb::storage::write_policy_name(WritePolicy::SNAPSHOT)),
              std::string("snapshot"));
}
