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
 * @file handler.hpp
 * @brief JSON request dispatcher in front of a `Db`.
 *
 * @details
 * Decouples the textual request protocol (used by the CLI) from the storage
 * API: it deserializes a request, routes it to the matching `Db` operation and
 * serializes the result, or the error, into a response document.
 */

#pragma once

#include "repodb/storage/db.hpp"

#include <string>

namespace repodb::network {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 */
class Handler {
  public:
    /**
     * @brief Executes one request against `db`.
     *
     * @param db The active database instance.
     * @param raw_json The request document.
     * @return std::string The serialized response (single line).
     *
     * **Actions:**
     * | action       | arguments                  | data                         |
     * |--------------|----------------------------|------------------------------|
     * | `get`        | `collection`, `force`?     | record array                 |
     * | `find`       | `collection`, `query`?     | matching records             |
     * | `find_by_id` | `collection`, `key`        | record or `null`             |
     * | `insert`     | `collection`, `data`       | stored record                |
     * | `update`     | `collection`, `key`, `data`| updated record               |
     * | `delete`     | `collection`, `key`        | `null`                       |
     * | `init`       | `collection`?              | record array / `null`        |
     *
     * `init` without a collection initialises every collection with a schema.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "data": <result>}`
     * - **Error:** `{"status": "error", "error": "<kind>", "message": "<description>"}`
     *
     * `kind` is one of `bad_request`, `network`, `not_found`, `conflict`,
     * `schema_validation`, `queue_exhausted`, `internal`.
     */
    static std::string process(storage::Db& db, const std::string& raw_json);
};

} // namespace repodb::network
