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
 * @file schema.hpp
 * @brief Per-collection schema table: required fields, type hints, defaults.
 *
 * @details
 * Schemas are deliberately shallow. They gate obviously malformed records
 * before any network traffic happens; domain rules stay with the callers.
 */

#pragma once

#include "repodb/infra/json.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace repodb::storage {

/**
 * @enum FieldType
 * @brief JSON kind a field is declared to hold.
 */
enum class FieldType {
    ANY,     ///< No kind check.
    STRING,  ///< JSON string.
    NUMBER,  ///< JSON number.
    BOOLEAN, ///< `true` / `false`.
    ARRAY,   ///< JSON array.
    OBJECT   ///< JSON object.
};

/// @brief Parses "string", "number", "boolean", "array", "object", "any".
/// @throws std::invalid_argument for any other name.
FieldType parse_field_type(const std::string& name);

const char* field_type_name(FieldType type);

/**
 * @struct Schema
 * @brief Validation rules and default values for one collection.
 */
struct Schema {
    std::vector<std::string> required;
    std::map<std::string, FieldType> types;

    /// @brief JSON object of default member values (may be empty).
    infra::JsonPtr defaults;

    Schema() = default;
    Schema(const Schema& other);
    Schema& operator=(const Schema& other);
    Schema(Schema&&) = default;
    Schema& operator=(Schema&&) = default;

    /**
     * @brief Builds a schema from `{"required": [...], "types": {...}, "defaults": {...}}`.
     *
     * Every member is optional.
     *
     * @throws std::invalid_argument when a member has the wrong shape or a type
     * name is unknown.
     */
    static Schema from_json(const cJSON* definition);
};

/**
 * @class SchemaRegistry
 * @brief Thread-safe collection -> schema table.
 *
 * Collections without a schema accept any JSON object.
 */
class SchemaRegistry {
  public:
    /// @brief Adds or replaces the schema of `collection`.
    void register_schema(const std::string& collection, Schema schema);

    bool has(const std::string& collection) const;

    /// @brief Names of every collection with a registered schema, sorted.
    std::vector<std::string> collections() const;

    /**
     * @brief Checks `record` against the collection's schema.
     *
     * A required field must be present (an explicit `null` counts as present).
     * A typed field that is present and not `null` must hold the declared kind.
     *
     * @throws SchemaValidationError naming the first offending field.
     */
    void validate(const std::string& collection, const cJSON* record) const;

    /**
     * @brief Returns a copy of `partial` with schema defaults filled in.
     *
     * Caller-supplied members always win over defaults.
     */
    infra::JsonPtr apply_defaults(const std::string& collection, const cJSON* partial) const;

  private:
    mutable std::shared_mutex lock_;
    std::unordered_map<std::string, Schema> schemas_;
};

} // namespace repodb::storage
