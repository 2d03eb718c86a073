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
 * @file schema.cpp
 * @brief Schema parsing, default merging and record validation.
 */

#include "repodb/storage/schema.hpp"

#include "repodb/infra/logger.hpp"
#include "repodb/storage/errors.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace repodb::storage {

using infra::Json;
using infra::JsonPtr;

namespace {

bool matches(FieldType type, const cJSON* value)
{
    switch (type) {
    case FieldType::ANY:
        return true;
    case FieldType::STRING:
        return cJSON_IsString(value);
    case FieldType::NUMBER:
        return cJSON_IsNumber(value);
    case FieldType::BOOLEAN:
        return cJSON_IsBool(value);
    case FieldType::ARRAY:
        return cJSON_IsArray(value);
    case FieldType::OBJECT:
        return cJSON_IsObject(value);
    }
    return false;
}

} // namespace

FieldType parse_field_type(const std::string& name)
{
    if (name == "string")
        return FieldType::STRING;
    if (name == "number")
        return FieldType::NUMBER;
    if (name == "boolean")
        return FieldType::BOOLEAN;
    if (name == "array")
        return FieldType::ARRAY;
    if (name == "object")
        return FieldType::OBJECT;
    if (name == "any")
        return FieldType::ANY;
    throw std::invalid_argument("unknown field type '" + name + "'");
}

const char* field_type_name(FieldType type)
{
    switch (type) {
    case FieldType::ANY:
        return "any";
    case FieldType::STRING:
        return "string";
    case FieldType::NUMBER:
        return "number";
    case FieldType::BOOLEAN:
        return "boolean";
    case FieldType::ARRAY:
        return "array";
    case FieldType::OBJECT:
        return "object";
    }
    return "any";
}

Schema::Schema(const Schema& other)
    : required(other.required), types(other.types), defaults(Json::clone(other.defaults.get()))
{
}

Schema& Schema::operator=(const Schema& other)
{
    if (this != &other) {
        required = other.required;
        types = other.types;
        defaults = Json::clone(other.defaults.get());
    }
    return *this;
}

Schema Schema::from_json(const cJSON* definition)
{
    if (!cJSON_IsObject(definition)) {
        throw std::invalid_argument("schema must be a JSON object");
    }

    Schema schema;

    const cJSON* required = cJSON_GetObjectItemCaseSensitive(definition, "required");
    if (required) {
        if (!cJSON_IsArray(required)) {
            throw std::invalid_argument("schema 'required' must be an array");
        }
        const cJSON* field = nullptr;
        cJSON_ArrayForEach(field, required)
        {
            if (!cJSON_IsString(field)) {
                throw std::invalid_argument("schema 'required' entries must be strings");
            }
            schema.required.emplace_back(field->valuestring);
        }
    }

    const cJSON* types = cJSON_GetObjectItemCaseSensitive(definition, "types");
    if (types) {
        if (!cJSON_IsObject(types)) {
            throw std::invalid_argument("schema 'types' must be an object");
        }
        const cJSON* entry = nullptr;
        cJSON_ArrayForEach(entry, types)
        {
            if (!cJSON_IsString(entry)) {
                throw std::invalid_argument("schema type of '" + std::string(entry->string) +
                                            "' must be a string");
            }
            schema.types[entry->string] = parse_field_type(entry->valuestring);
        }
    }

    const cJSON* defaults = cJSON_GetObjectItemCaseSensitive(definition, "defaults");
    if (defaults) {
        if (!cJSON_IsObject(defaults)) {
            throw std::invalid_argument("schema 'defaults' must be an object");
        }
        schema.defaults = Json::clone(defaults);
    }

    return schema;
}

void SchemaRegistry::register_schema(const std::string& collection, Schema schema)
{
    std::unique_lock lock(lock_);
    schemas_[collection] = std::move(schema);
    infra::Logger::log(infra::LogLevel::DEBUG, "Schema: Definition registered for " + collection);
}

bool SchemaRegistry::has(const std::string& collection) const
{
    std::shared_lock lock(lock_);
    return schemas_.count(collection) > 0;
}

std::vector<std::string> SchemaRegistry::collections() const
{
    std::shared_lock lock(lock_);
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& [name, schema] : schemas_)
        names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

void SchemaRegistry::validate(const std::string& collection, const cJSON* record) const
{
    if (!cJSON_IsObject(record)) {
        throw SchemaValidationError("Record for " + collection + " must be a JSON object", "");
    }

    std::shared_lock lock(lock_);
    auto it = schemas_.find(collection);
    if (it == schemas_.end()) {
        return;
    }
    const Schema& schema = it->second;

    for (const auto& field : schema.required) {
        if (!cJSON_GetObjectItemCaseSensitive(record, field.c_str())) {
            throw SchemaValidationError("Missing required field: " + field, field);
        }
    }

    for (const auto& [field, type] : schema.types) {
        const cJSON* value = cJSON_GetObjectItemCaseSensitive(record, field.c_str());
        if (!value || cJSON_IsNull(value)) {
            continue;
        }
        if (!matches(type, value)) {
            throw SchemaValidationError("Field '" + field + "' must be of type " +
                                            field_type_name(type),
                                        field);
        }
    }
}

JsonPtr SchemaRegistry::apply_defaults(const std::string& collection, const cJSON* partial) const
{
    JsonPtr merged = Json::object();

    {
        std::shared_lock lock(lock_);
        auto it = schemas_.find(collection);
        if (it != schemas_.end() && it->second.defaults) {
            Json::merge(merged.get(), it->second.defaults.get());
        }
    }

    Json::merge(merged.get(), partial);
    return merged;
}

} // namespace repodb::storage
