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
 * @file config.cpp
 * @brief Configuration parsing and validation.
 */

#include "repodb/config/config.hpp"

#include "repodb/infra/json.hpp"
#include "repodb/infra/string.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace repodb::config {

using infra::Json;
using infra::JsonPtr;
using infra::LogLevel;
using infra::Logger;

namespace {

const cJSON* section(const cJSON* root, const char* name)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(root, name);
    if (node && !cJSON_IsObject(node)) {
        throw ConfigError(std::string("Config: '") + name + "' must be an object");
    }
    return node;
}

std::string read_string(const cJSON* object, const char* key, const std::string& fallback)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!node || cJSON_IsNull(node)) {
        return fallback;
    }
    if (!cJSON_IsString(node)) {
        throw ConfigError(std::string("Config: '") + key + "' must be a string");
    }
    return node->valuestring;
}

double read_number(const cJSON* object, const char* key, double fallback)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!node || cJSON_IsNull(node)) {
        return fallback;
    }
    if (!cJSON_IsNumber(node)) {
        throw ConfigError(std::string("Config: '") + key + "' must be a number");
    }
    return node->valuedouble;
}

/// Upper bound for every duration setting: one week.
constexpr long long kMaxMillis = 7LL * 24 * 60 * 60 * 1000;

/// Reads an integral setting, rejecting values outside [`low`, `high`].
long long read_integer(const cJSON* object, const char* key, long long fallback, long long low,
                       long long high)
{
    const double value = read_number(object, key, static_cast<double>(fallback));
    if (!(value >= static_cast<double>(low) && value <= static_cast<double>(high))) {
        throw ConfigError(std::string("Config: '") + key + "' must be between " +
                          std::to_string(low) + " and " + std::to_string(high));
    }
    return static_cast<long long>(value);
}

void parse_store(const cJSON* node, remote::StoreConfig& store)
{
    if (!node) {
        throw ConfigError("Config: 'store' section is required");
    }

    store.owner = read_string(node, "owner", "");
    store.repo = read_string(node, "repo", "");
    store.branch = read_string(node, "branch", store.branch);
    store.base_path = read_string(node, "base_path", store.base_path);
    store.api_url = read_string(node, "api_url", store.api_url);
    store.token = read_string(node, "token", "");
    store.timeout_ms =
        static_cast<long>(read_integer(node, "timeout_ms", store.timeout_ms, 1, kMaxMillis));

    if (store.owner.empty() || store.repo.empty()) {
        throw ConfigError("Config: 'store.owner' and 'store.repo' are required");
    }
    if (store.branch.empty()) {
        throw ConfigError("Config: 'store.branch' must not be empty");
    }

    if (store.token.empty()) {
        const char* env = std::getenv("REPODB_TOKEN");
        if (env) {
            store.token = infra::String::trim(env);
        }
    }
    if (store.token.empty()) {
        Logger::log(LogLevel::WARN, "Config: No access token configured, requests are anonymous");
    }
}

void parse_queue(const cJSON* node, storage::QueueOptions& queue)
{
    if (!node) {
        return;
    }

    queue.max_attempts = static_cast<int>(read_integer(node, "max_attempts", queue.max_attempts, 1,
                                                       std::numeric_limits<int>::max()));
    queue.backoff_base_ms =
        static_cast<long>(read_integer(node, "backoff_base_ms", queue.backoff_base_ms, 0,
                                       kMaxMillis));
    queue.backoff_factor = read_number(node, "backoff_factor", queue.backoff_factor);
    queue.backoff_cap_ms =
        static_cast<long>(read_integer(node, "backoff_cap_ms", queue.backoff_cap_ms, 0,
                                       kMaxMillis));
    queue.write_deadline_ms =
        static_cast<long>(read_integer(node, "write_deadline_ms", queue.write_deadline_ms, 0,
                                       kMaxMillis));

    if (queue.backoff_factor < 1.0) {
        throw ConfigError("Config: 'queue.backoff_factor' must be at least 1");
    }
}

} // namespace

Config Config::from_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Config: Cannot open " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Logger::log(LogLevel::DEBUG, "Config: Loaded " + path);
    return from_json(buffer.str());
}

Config Config::from_json(const std::string& text)
{
    JsonPtr root = Json::parse(text);
    if (!root || !cJSON_IsObject(root.get())) {
        throw ConfigError("Config: Document must be a JSON object");
    }

    Config config;
    parse_store(section(root.get(), "store"), config.db.store);
    parse_queue(section(root.get(), "queue"), config.db.queue);

    const std::string policy = read_string(root.get(), "write_policy", "rebase");
    try {
        config.db.queue.policy = storage::parse_write_policy(policy);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("Config: ") + e.what());
    }

    const std::string level = read_string(root.get(), "log_level", "info");
    config.log_level = Logger::parse_level(level, LogLevel::FATAL);
    if (config.log_level == LogLevel::FATAL &&
        infra::String::to_lower(infra::String::trim(level)) != "fatal") {
        throw ConfigError("Config: Unknown log_level '" + level + "'");
    }

    config.db.pool_threads =
        static_cast<size_t>(read_integer(root.get(), "pool_threads", 4, 1, 1024));

    const cJSON* schemas = section(root.get(), "schemas");
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, schemas)
    {
        try {
            config.schemas.emplace(entry->string, storage::Schema::from_json(entry));
        } catch (const std::invalid_argument& e) {
            throw ConfigError("Config: Schema of '" + std::string(entry->string) +
                              "' is invalid: " + e.what());
        }
    }

    return config;
}

void Config::apply_schemas(storage::Db& db) const
{
    for (const auto& [collection, schema] : schemas) {
        db.register_schema(collection, schema);
    }
}

} // namespace repodb::config
