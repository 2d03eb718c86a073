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
 * @file json.cpp
 * @brief Implementation of the cJSON helpers.
 */

#include "repodb/infra/json.hpp"

#include <cstring>

namespace repodb::infra {

JsonPtr Json::parse(const std::string& text)
{
    return JsonPtr(cJSON_ParseWithLength(text.data(), text.size()));
}

std::string Json::print(const cJSON* node, bool pretty)
{
    if (!node) {
        return "null";
    }

    char* raw = pretty ? cJSON_Print(node) : cJSON_PrintUnformatted(node);
    if (!raw) {
        return "null";
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

JsonPtr Json::clone(const cJSON* node)
{
    if (!node) {
        return JsonPtr();
    }
    return JsonPtr(cJSON_Duplicate(node, 1));
}

JsonPtr Json::array()
{
    return JsonPtr(cJSON_CreateArray());
}

JsonPtr Json::object()
{
    return JsonPtr(cJSON_CreateObject());
}

std::string Json::get_string(const cJSON* object, const char* key, const std::string& fallback)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(object, key);
    if (cJSON_IsString(node) && node->valuestring) {
        return node->valuestring;
    }
    return fallback;
}

void Json::set(cJSON* object, const char* key, JsonPtr value)
{
    if (!object || !value) {
        return;
    }
    if (cJSON_GetObjectItemCaseSensitive(object, key)) {
        cJSON_ReplaceItemInObjectCaseSensitive(object, key, value.release());
    } else {
        cJSON_AddItemToObject(object, key, value.release());
    }
}

void Json::set_string(cJSON* object, const char* key, const std::string& value)
{
    set(object, key, JsonPtr(cJSON_CreateString(value.c_str())));
}

void Json::merge(cJSON* target, const cJSON* overlay, const char* const* skip_keys)
{
    const cJSON* member = nullptr;
    cJSON_ArrayForEach(member, overlay)
    {
        if (!member->string) {
            continue;
        }

        bool skipped = false;
        for (const char* const* k = skip_keys; k && *k; ++k) {
            if (std::strcmp(*k, member->string) == 0) {
                skipped = true;
                break;
            }
        }
        if (!skipped) {
            set(target, member->string, clone(member));
        }
    }
}

bool Json::equals(const cJSON* a, const cJSON* b)
{
    return cJSON_Compare(a, b, 1) != 0;
}

} // namespace repodb::infra
