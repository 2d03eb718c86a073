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

#include "repodb/remote/http_client.hpp"

#include "repodb/infra/string.hpp"

namespace repodb::remote {

std::string HttpResponse::header(const std::string& name) const
{
    auto it = headers.find(infra::String::to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

} // namespace repodb::remote
