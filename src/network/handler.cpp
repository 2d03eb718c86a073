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
 * @file handler.cpp
 * @brief Implementation of the request processing pipeline.
 *
 * @details
 * 1. **Ingest**: Parse the request JSON.
 * 2. **Decode**: Extract `action` and its arguments.
 * 3. **Execute**: Route to the `Db`.
 * 4. **Respond**: Format the result or the exception.
 */

#include "repodb/network/handler.hpp"

#include "repodb/infra/json.hpp"
#include "repodb/infra/logger.hpp"
#include "repodb/storage/errors.hpp"

#include <cJSON.h>

namespace repodb::network {

using infra::Json;
using infra::JsonPtr;

namespace {

/// Malformed request; reported with kind "bad_request".
class BadRequest : public storage::DbError {
  public:
    using DbError::DbError;

    const char* kind() const noexcept override
    {
        return "bad_request";
    }
};

std::string ok(JsonPtr data)
{
    JsonPtr response = Json::object();
    Json::set_string(response.get(), "status", "ok");
    Json::set(response.get(), "data", data ? std::move(data) : JsonPtr(cJSON_CreateNull()));
    return Json::print(response.get());
}

std::string error(const std::string& kind, const std::string& message)
{
    JsonPtr response = Json::object();
    Json::set_string(response.get(), "status", "error");
    Json::set_string(response.get(), "error", kind);
    Json::set_string(response.get(), "message", message);
    return Json::print(response.get());
}

std::string require_string(const cJSON* request, const char* key)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(request, key);
    if (!cJSON_IsString(node) || std::string(node->valuestring).empty()) {
        throw BadRequest(std::string("Missing argument: '") + key + "'");
    }
    return node->valuestring;
}

const cJSON* require_object(const cJSON* request, const char* key)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(request, key);
    if (!cJSON_IsObject(node)) {
        throw BadRequest(std::string("Missing payload: '") + key + "' must be an object");
    }
    return node;
}

JsonPtr dispatch(storage::Db& db, const cJSON* request)
{
    const std::string action = require_string(request, "action");

    if (action == "init") {
        const cJSON* col = cJSON_GetObjectItemCaseSensitive(request, "collection");
        if (cJSON_IsString(col)) {
            return db.load(col->valuestring);
        }
        db.initialize_all();
        return nullptr;
    }

    const std::string collection = require_string(request, "collection");

    if (action == "get") {
        const bool force = cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(request, "force"));
        return db.load(collection, force);
    }
    if (action == "find") {
        const cJSON* query = cJSON_GetObjectItemCaseSensitive(request, "query");
        if (query && !cJSON_IsNull(query) && !cJSON_IsObject(query)) {
            throw BadRequest("'query' must be an object");
        }
        return db.find(collection, cJSON_IsObject(query) ? query : nullptr);
    }
    if (action == "find_by_id") {
        return db.find_by_id(collection, require_string(request, "key"));
    }
    if (action == "insert") {
        return db.insert(collection, require_object(request, "data"));
    }
    if (action == "update") {
        return db.update(collection, require_string(request, "key"),
                         require_object(request, "data"));
    }
    if (action == "delete") {
        db.remove(collection, require_string(request, "key"));
        return nullptr;
    }

    throw BadRequest("Unknown action '" + action + "'");
}

} // namespace

std::string Handler::process(storage::Db& db, const std::string& raw_json)
{
    // [Safety Check] Short-circuit empty payloads.
    if (raw_json.empty()) {
        return error("bad_request", "Empty request payload");
    }

    JsonPtr request = Json::parse(raw_json);
    if (!request || !cJSON_IsObject(request.get())) {
        return error("bad_request", "Invalid JSON syntax");
    }

    try {
        return ok(dispatch(db, request.get()));
    } catch (const storage::DbError& e) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Handler: Request failed (" + std::string(e.kind()) + "): " + e.what());
        return error(e.kind(), e.what());
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Handler: Unexpected failure: " + std::string(e.what()));
        return error("internal", e.what());
    }
}

} // namespace repodb::network
