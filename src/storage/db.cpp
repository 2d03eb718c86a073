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
 * @file db.cpp
 * @brief Implementation of the RepoDB CRUD controller.
 *
 * @details
 * Locking protocol (outermost first):
 * 1. `CollectionState::mutex` - held while a snapshot is derived from the
 *    cache, published and enqueued, and while the lane refreshes after a commit.
 * 2. `WriteQueue` lane mutexes - taken inside `pending()` / `enqueue()`.
 * 3. `CollectionCache` mutex - leaf.
 *
 * Subscribers are always notified after every lock is released, so a callback
 * may call back into `Db`.
 */

#include "repodb/storage/db.hpp"

#include "repodb/infra/clock.hpp"
#include "repodb/infra/id_generator.hpp"
#include "repodb/infra/logger.hpp"
#include "repodb/storage/errors.hpp"

#include <cmath>
#include <exception>

namespace repodb::storage {

using infra::Json;
using infra::JsonPtr;

namespace {

/// Keys owned by the database; callers can never set or change them.
const char* const kKeyFields[] = {"id", "uid", nullptr};

std::shared_ptr<cJSON> share(JsonPtr node)
{
    return std::shared_ptr<cJSON>(node.release(), infra::JsonDeleter());
}

/// Renders an `id` / `uid` member for comparison; numbers print without a fraction.
std::string key_text(const cJSON* node)
{
    if (cJSON_IsString(node)) {
        return node->valuestring;
    }
    if (cJSON_IsNumber(node)) {
        double value = node->valuedouble;
        if (std::floor(value) == value) {
            return std::to_string(static_cast<long long>(value));
        }
        return Json::print(node);
    }
    return "";
}

bool matches_key(const cJSON* record, const std::string& key)
{
    for (const char* const* field = kKeyFields; *field; ++field) {
        const cJSON* value = cJSON_GetObjectItemCaseSensitive(record, *field);
        if (value && key_text(value) == key) {
            return true;
        }
    }
    return false;
}

cJSON* find_matching(cJSON* records, const std::string& key)
{
    cJSON* record = nullptr;
    cJSON_ArrayForEach(record, records)
    {
        if (matches_key(record, key)) {
            return record;
        }
    }
    return nullptr;
}

/// Detaches every record matching `key`; returns them as an array.
JsonPtr detach_matching(cJSON* records, const std::string& key)
{
    JsonPtr removed = Json::array();
    cJSON* record = records ? records->child : nullptr;
    while (record) {
        cJSON* next = record->next;
        if (matches_key(record, key)) {
            cJSON_AddItemToArray(removed.get(), cJSON_DetachItemViaPointer(records, record));
        }
        record = next;
    }
    return removed;
}

bool uid_taken(const cJSON* records, const std::string& uid)
{
    const cJSON* record = nullptr;
    cJSON_ArrayForEach(record, records)
    {
        if (Json::get_string(record, "uid") == uid) {
            return true;
        }
    }
    return false;
}

/// `{uid, id, ...body}` with the generated keys taking precedence.
JsonPtr build_record(const std::string& id, const std::string& uid, const cJSON* body)
{
    JsonPtr record = Json::object();
    Json::set_string(record.get(), "uid", uid);
    Json::set_string(record.get(), "id", id);
    Json::merge(record.get(), body, kKeyFields);
    return record;
}

/// Appends a freshly keyed copy of `body` to `records`; returns the stored record.
JsonPtr append_record(cJSON* records, const cJSON* body, std::string uid)
{
    while (uid_taken(records, uid)) {
        uid = infra::IdGenerator::generate();
    }
    JsonPtr record = build_record(infra::IdGenerator::next_sequence_id(records), uid, body);
    cJSON_AddItemToArray(records, Json::clone(record.get()).release());
    return record;
}

void apply_update(cJSON* record, const cJSON* partial)
{
    Json::merge(record, partial, kKeyFields);
    Json::set_string(record, "updated_at", infra::Clock::iso8601_now());
}

bool matches_filters(const cJSON* record, const cJSON* filters)
{
    const cJSON* expected = nullptr;
    cJSON_ArrayForEach(expected, filters)
    {
        const cJSON* actual = cJSON_GetObjectItemCaseSensitive(record, expected->string);
        if (!actual || !Json::equals(actual, expected)) {
            return false;
        }
    }
    return true;
}

std::string commit_message(const std::string& collection)
{
    return "Update " + collection + " - " + infra::Clock::iso8601_now();
}

} // namespace

// ============================================================================
//  LIFECYCLE
// ============================================================================

Db::Db(remote::HttpClient& http, DbOptions options)
    : client_(http, std::move(options.store)), cache_(client_), scheduler_(options.pool_threads),
      queue_(client_, options.queue,
             [this](const WriteRequest& request, const WriteResult* result) {
                 on_write_complete(request, result);
             })
{
    const remote::StoreConfig& store = client_.config();
    infra::Logger::log(infra::LogLevel::INFO,
                       "Core: RepoDB online for " + store.owner + "/" + store.repo + "@" +
                           store.branch + " (" + write_policy_name(queue_.options().policy) +
                           " writes)");
}

Db::~Db()
{
    infra::Logger::log(infra::LogLevel::INFO, "Core: Draining write lanes...");
}

Db::CollectionState& Db::state_for(const std::string& collection)
{
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto& state = states_[collection];
    if (!state) {
        state = std::make_unique<CollectionState>();
    }
    return *state;
}

// ============================================================================
//  READ OPERATIONS
// ============================================================================

JsonPtr Db::load(const std::string& collection, bool force)
{
    if (!force) {
        JsonPtr cached = cache_.records(collection);
        if (cached) {
            return cached;
        }
    }

    try {
        return fetch_and_publish(collection);
    } catch (const NotFoundError&) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "CRUD: " + collection + " does not exist yet, initialising");
    }

    initialize_collection(collection);
    return fetch_and_publish(collection);
}

JsonPtr Db::fetch_and_publish(const std::string& collection)
{
    CollectionState& state = state_for(collection);

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        generation = state.generation;
    }

    FetchResult fetched = cache_.fetch(collection);

    JsonPtr published;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (fetched.not_modified) {
            return std::move(fetched.records);
        }
        // Never overwrite optimistic data that has not been committed yet, nor
        // install a read that started before a commit landed.
        if (state.generation == generation && queue_.pending(collection) == 0) {
            cache_.store(collection, Json::clone(fetched.records.get()), fetched.etag, fetched.sha);
            published = Json::clone(fetched.records.get());
        } else {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Cache: Keeping local state of " + collection + " (writes pending)");
        }
    }

    if (published) {
        bus_.notify(collection, published.get());
    }
    return std::move(fetched.records);
}

void Db::initialize_collection(const std::string& collection)
{
    WriteRequest request;
    request.collection = collection;
    request.action = "init";
    request.message = "Initialize " + collection + " collection";
    request.create_only = true;

    WriteResult result = queue_.enqueue(std::move(request)).get();
    if (!result.created) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "CRUD: " + collection + " was created concurrently");
    }
}

void Db::ensure_loaded(const std::string& collection)
{
    if (!cache_.contains(collection)) {
        load(collection, false);
    }
}

JsonPtr Db::find_by_id(const std::string& collection, const std::string& key)
{
    JsonPtr records = load(collection);
    cJSON* record = find_matching(records.get(), key);
    return record ? Json::clone(record) : nullptr;
}

JsonPtr Db::find(const std::string& collection, const cJSON* filters)
{
    if (filters && !cJSON_IsObject(filters)) {
        throw DbError("CRUD: Filters for " + collection + " must be a JSON object");
    }

    JsonPtr records = load(collection);
    JsonPtr result = Json::array();

    const cJSON* record = nullptr;
    cJSON_ArrayForEach(record, records.get())
    {
        if (!filters || matches_filters(record, filters)) {
            cJSON_AddItemToArray(result.get(), Json::clone(record).release());
        }
    }
    return result;
}

JsonPtr Db::find(const std::string& collection, const Predicate& predicate)
{
    JsonPtr records = load(collection);
    JsonPtr result = Json::array();

    const cJSON* record = nullptr;
    cJSON_ArrayForEach(record, records.get())
    {
        if (predicate(record)) {
            cJSON_AddItemToArray(result.get(), Json::clone(record).release());
        }
    }
    return result;
}

// ============================================================================
//  WRITE OPERATIONS
// ============================================================================

std::future<WriteResult> Db::stage(std::unique_lock<std::mutex>& lock,
                                   const std::string& collection, JsonPtr records,
                                   WriteRequest request)
{
    JsonPtr published = Json::clone(records.get());
    request.snapshot = Json::clone(records.get());

    std::future<WriteResult> future = queue_.enqueue(std::move(request));
    cache_.replace_records(collection, std::move(records));
    lock.unlock();

    bus_.notify(collection, published.get());
    return future;
}

std::future<WriteResult> Db::insert_async(const std::string& collection, const cJSON* partial)
{
    if (!cJSON_IsObject(partial)) {
        throw SchemaValidationError("Record for " + collection + " must be a JSON object", "");
    }

    // Validation happens before the first network call.
    JsonPtr body = schemas_.apply_defaults(collection, partial);
    cJSON_DeleteItemFromObjectCaseSensitive(body.get(), "id");
    cJSON_DeleteItemFromObjectCaseSensitive(body.get(), "uid");
    schemas_.validate(collection, body.get());

    ensure_loaded(collection);

    CollectionState& state = state_for(collection);
    std::unique_lock<std::mutex> lock(state.mutex);

    JsonPtr records = cache_.records(collection);
    if (!records) {
        records = Json::array();
    }

    const std::string uid = infra::IdGenerator::generate();
    JsonPtr record = append_record(records.get(), body.get(), uid);

    infra::Logger::log(infra::LogLevel::TRACE,
                       "CRUD: Staged insert " + Json::get_string(record.get(), "id") + " -> " +
                           collection);

    WriteRequest request;
    request.collection = collection;
    request.action = "insert";
    request.message = commit_message(collection);
    request.affected = std::move(record);
    request.mutation = [shared_body = share(std::move(body)), uid](cJSON* current) {
        return append_record(current, shared_body.get(), uid);
    };

    return stage(lock, collection, std::move(records), std::move(request));
}

std::future<WriteResult> Db::update_async(const std::string& collection, const std::string& key,
                                          const cJSON* partial)
{
    if (!cJSON_IsObject(partial)) {
        throw SchemaValidationError("Update for " + collection + " must be a JSON object", "");
    }

    load(collection, true);

    CollectionState& state = state_for(collection);
    std::unique_lock<std::mutex> lock(state.mutex);

    JsonPtr records = cache_.records(collection);
    cJSON* target = records ? find_matching(records.get(), key) : nullptr;
    if (!target) {
        throw NotFoundError("Item with key \"" + key + "\" not found in collection \"" +
                            collection + "\"");
    }

    apply_update(target, partial);
    schemas_.validate(collection, target);

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "CRUD: Staged update of " + key + " in " + collection);

    WriteRequest request;
    request.collection = collection;
    request.action = "update";
    request.message = commit_message(collection);
    request.affected = Json::clone(target);
    request.mutation = [this, collection, key, shared_partial = share(Json::clone(partial))](
                           cJSON* current) {
        cJSON* fresh = find_matching(current, key);
        if (!fresh) {
            throw NotFoundError("Item with key \"" + key + "\" vanished from collection \"" +
                                collection + "\"");
        }
        apply_update(fresh, shared_partial.get());
        schemas_.validate(collection, fresh);
        return Json::clone(fresh);
    };

    return stage(lock, collection, std::move(records), std::move(request));
}

std::future<WriteResult> Db::remove_async(const std::string& collection, const std::string& key)
{
    ensure_loaded(collection);

    CollectionState& state = state_for(collection);
    std::unique_lock<std::mutex> lock(state.mutex);

    JsonPtr records = cache_.records(collection);
    if (!records) {
        records = Json::array();
    }

    JsonPtr removed = detach_matching(records.get(), key);
    if (cJSON_GetArraySize(removed.get()) == 0) {
        throw NotFoundError("Item with key \"" + key + "\" not found in collection \"" +
                            collection + "\"");
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "CRUD: Staged delete of " +
                           std::to_string(cJSON_GetArraySize(removed.get())) +
                           " record(s) from " + collection);

    WriteRequest request;
    request.collection = collection;
    request.action = "delete";
    request.message = commit_message(collection);
    request.affected = std::move(removed);
    request.mutation = [collection, key](cJSON* current) {
        JsonPtr gone = detach_matching(current, key);
        if (cJSON_GetArraySize(gone.get()) == 0) {
            throw NotFoundError("Item with key \"" + key + "\" vanished from collection \"" +
                                collection + "\"");
        }
        return gone;
    };

    return stage(lock, collection, std::move(records), std::move(request));
}

JsonPtr Db::insert(const std::string& collection, const cJSON* partial)
{
    return insert_async(collection, partial).get().record;
}

JsonPtr Db::update(const std::string& collection, const std::string& key, const cJSON* partial)
{
    return update_async(collection, key, partial).get().record;
}

void Db::remove(const std::string& collection, const std::string& key)
{
    remove_async(collection, key).get();
}

void Db::on_write_complete(const WriteRequest& request, const WriteResult* result)
{
    if (request.create_only) {
        return;
    }

    const std::string& collection = request.collection;

    if (result) {
        if (request.action == "delete") {
            const cJSON* record = nullptr;
            cJSON_ArrayForEach(record, result->record.get())
            {
                audit_.record(collection, request.action, record);
            }
        } else {
            audit_.record(collection, request.action, result->record.get());
        }
    }

    CollectionState& state = state_for(collection);
    JsonPtr published;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        ++state.generation;

        // Later writes in the lane still carry optimistic data; the last one
        // to finish refreshes.
        if (queue_.pending(collection) > 0) {
            return;
        }

        try {
            FetchResult fetched = cache_.fetch(collection);
            if (!fetched.not_modified) {
                published = Json::clone(fetched.records.get());
                cache_.store(collection, std::move(fetched.records), fetched.etag, fetched.sha);
            }
        } catch (const NotFoundError&) {
            // Deleted behind our back; recreating it here would deadlock the lane.
            published = Json::array();
            cache_.store(collection, Json::array(), "", "");
        } catch (const DbError& e) {
            infra::Logger::log(infra::LogLevel::WARN, "Cache: Refresh of " + collection +
                                                          " after write failed: " + e.what());
        }
    }

    if (published) {
        bus_.notify(collection, published.get());
    }
}

// ============================================================================
//  ADMINISTRATIVE OPERATIONS
// ============================================================================

void Db::register_schema(const std::string& collection, Schema schema)
{
    schemas_.register_schema(collection, std::move(schema));
}

void Db::initialize_all()
{
    const std::vector<std::string> collections = schemas_.collections();
    infra::Logger::log(infra::LogLevel::INFO,
                       "CRUD: Initialising " + std::to_string(collections.size()) + " collections");

    std::vector<std::future<JsonPtr>> loads;
    loads.reserve(collections.size());
    for (const auto& name : collections) {
        loads.push_back(scheduler_.submit([this, name] { return load(name, false); }));
    }

    std::exception_ptr first_failure;
    for (size_t i = 0; i < loads.size(); ++i) {
        try {
            loads[i].get();
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::ERROR, "CRUD: Failed to initialise " +
                                                           collections[i] + ": " + e.what());
            if (!first_failure) {
                first_failure = std::current_exception();
            }
        }
    }

    if (first_failure) {
        std::rethrow_exception(first_failure);
    }
    infra::Logger::log(infra::LogLevel::INFO, "CRUD: Initialisation completed");
}

Subscription Db::subscribe(const std::string& collection, EventBus::Callback callback)
{
    return bus_.subscribe(collection, std::move(callback));
}

std::vector<AuditEntry> Db::audit_trail(const std::string& collection) const
{
    return audit_.entries(collection);
}

size_t Db::pending_writes(const std::string& collection) const
{
    return queue_.pending(collection);
}

} // namespace repodb::storage
