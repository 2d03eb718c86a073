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
 * @file json.hpp
 * @brief Ownership wrapper and helpers around cJSON trees.
 *
 * @details
 * cJSON hands out raw heap pointers that must be released with `cJSON_Delete`
 * (trees) or `cJSON_free` (printed buffers). `JsonPtr` binds that contract to
 * scope so records can move between the cache, the write queue and callers
 * without manual bookkeeping.
 */

#pragma once

#include <cJSON.h>
#include <memory>
#include <string>

namespace repodb::infra {

/// @brief Deleter releasing a cJSON tree.
struct JsonDeleter {
    void operator()(cJSON* node) const
    {
        if (node) {
            cJSON_Delete(node);
        }
    }
};

/// @brief Owning handle to a cJSON tree.
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

/**
 * @class Json
 * @brief Static helpers for the recurring cJSON idioms.
 */
class Json {
  public:
    /// @brief Parses `text`; returns an empty handle on syntax errors.
    static JsonPtr parse(const std::string& text);

    /**
     * @brief Serializes a tree.
     *
     * @param node The tree to print (`nullptr` prints "null").
     * @param pretty Two-space style formatted output when true.
     */
    static std::string print(const cJSON* node, bool pretty = false);

    /// @brief Deep copy; empty handle for `nullptr`.
    static JsonPtr clone(const cJSON* node);

    static JsonPtr array();
    static JsonPtr object();

    /// @brief Returns the string value of `key`, or `fallback` when absent or not a string.
    static std::string get_string(const cJSON* object, const char* key,
                                  const std::string& fallback = "");

    /**
     * @brief Replaces (or adds) `key` on `object`, taking ownership of `value`.
     */
    static void set(cJSON* object, const char* key, JsonPtr value);

    /// @brief Convenience overload for string values.
    static void set_string(cJSON* object, const char* key, const std::string& value);

    /**
     * @brief Shallow merge: every member of `overlay` replaces the same-named
     * member of `target`. Members of `overlay` are deep-copied.
     *
     * @param skip_keys Optional nullptr-terminated list of keys to ignore.
     */
    static void merge(cJSON* target, const cJSON* overlay, const char* const* skip_keys = nullptr);

    /// @brief Deep structural equality (case-sensitive keys).
    static bool equals(const cJSON* a, const cJSON* b);
};

} // namespace repodb::infra
