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
 * @file content_client.cpp
 * @brief Contents-API request construction and status mapping.
 *
 * @details
 * Status mapping:
 * - `200/201` success, `304` not modified (GET only).
 * - `404` -> `NotFoundError`.
 * - `409` -> `ConflictError` (sha mismatch).
 * - `422` naming "sha" -> `ConflictError` (file appeared since the writer looked).
 * - anything else -> `NetworkError` with the status attached.
 */

#include "repodb/remote/content_client.hpp"

#include "repodb/infra/base64.hpp"
#include "repodb/infra/json.hpp"
#include "repodb/infra/logger.hpp"
#include "repodb/infra/string.hpp"
#include "repodb/storage/errors.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace repodb::remote {

using infra::Json;
using infra::JsonPtr;
using infra::LogLevel;
using infra::Logger;

namespace {

/// Percent-encodes everything outside RFC 3986 unreserved characters, keeping '/'.
std::string escape_path(const std::string& path)
{
    std::string out;
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

/// Best-effort extraction of the API's `{"message": ...}` error text.
std::string error_message(const HttpResponse& response)
{
    JsonPtr body = Json::parse(response.body);
    std::string message = Json::get_string(body.get(), "message");
    return message.empty() ? response.body : message;
}

std::string describe(const std::string& method, const std::string& path,
                     const HttpResponse& response)
{
    return "Remote: " + method + " " + path + " failed with HTTP " +
           std::to_string(response.status) + ": " + error_message(response);
}

} // namespace

ContentClient::ContentClient(HttpClient& http, StoreConfig config)
    : http_(http), config_(std::move(config))
{
}

std::string ContentClient::path_for(const std::string& collection) const
{
    return infra::String::join_path(config_.base_path, collection + ".json");
}

std::string ContentClient::url_for(const std::string& path) const
{
    std::string api = config_.api_url;
    while (!api.empty() && api.back() == '/')
        api.pop_back();
    return api + "/repos/" + config_.owner + "/" + config_.repo + "/contents/" + escape_path(path);
}

HttpRequest ContentClient::make_request(const std::string& method, const std::string& url) const
{
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.headers["Accept"] = "application/vnd.github+json";
    request.headers["User-Agent"] = "repodb";
    if (!config_.token.empty()) {
        request.headers["Authorization"] = "token " + config_.token;
    }
    return request;
}

RemoteDocument ContentClient::get(const std::string& path, const std::string& etag)
{
    HttpRequest request =
        make_request("GET", url_for(path) + "?ref=" + escape_path(config_.branch));
    if (!etag.empty()) {
        request.headers["If-None-Match"] = etag;
    }

    HttpResponse response = http_.send(request);

    if (response.status == 304) {
        Logger::log(LogLevel::TRACE, "Remote: " + path + " not modified");
        RemoteDocument doc;
        doc.etag = etag;
        doc.not_modified = true;
        return doc;
    }
    if (response.status == 404) {
        throw storage::NotFoundError("Remote: " + path + " not found");
    }
    if (!response.ok()) {
        throw storage::NetworkError(describe("GET", path, response), response.status);
    }

    JsonPtr body = Json::parse(response.body);
    if (!body || !cJSON_IsObject(body.get())) {
        throw storage::NetworkError("Remote: GET " + path + " returned a malformed body",
                                    response.status);
    }

    RemoteDocument doc;
    doc.etag = response.header("etag");
    doc.sha = Json::get_string(body.get(), "sha");

    // Files above the inline limit come back with encoding "none" and must be
    // fetched through their raw download URL.
    std::string encoding = Json::get_string(body.get(), "encoding", "base64");
    if (encoding == "none") {
        doc.content = fetch_raw(Json::get_string(body.get(), "download_url"), path);
        return doc;
    }

    try {
        doc.content = infra::Base64::decode(Json::get_string(body.get(), "content"));
    } catch (const std::invalid_argument& e) {
        throw storage::NetworkError("Remote: GET " + path + " carried undecodable content: " +
                                        e.what(),
                                    response.status);
    }
    return doc;
}

std::string ContentClient::fetch_raw(const std::string& download_url, const std::string& path)
{
    if (download_url.empty()) {
        throw storage::NetworkError("Remote: " + path +
                                    " has no inline content and no download URL");
    }

    HttpRequest request = make_request("GET", download_url);
    request.headers["Accept"] = "application/vnd.github.raw";
    HttpResponse response = http_.send(request);
    if (!response.ok()) {
        throw storage::NetworkError(describe("GET", path, response), response.status);
    }
    return response.body;
}

std::string ContentClient::put(const std::string& path, const std::string& content,
                               const std::string& sha, const std::string& message)
{
    JsonPtr payload = Json::object();
    Json::set_string(payload.get(), "message", message);
    Json::set_string(payload.get(), "content", infra::Base64::encode(content));
    Json::set_string(payload.get(), "branch", config_.branch);
    if (!sha.empty()) {
        Json::set_string(payload.get(), "sha", sha);
    }

    HttpRequest request = make_request("PUT", url_for(path));
    request.headers["Content-Type"] = "application/json";
    request.body = Json::print(payload.get());

    HttpResponse response = http_.send(request);

    if (response.status == 409) {
        throw storage::ConflictError(describe("PUT", path, response));
    }
    if (response.status == 422 && error_message(response).find("sha") != std::string::npos) {
        throw storage::ConflictError(describe("PUT", path, response));
    }
    if (response.status == 404) {
        throw storage::NotFoundError(describe("PUT", path, response));
    }
    if (!response.ok()) {
        throw storage::NetworkError(describe("PUT", path, response), response.status);
    }

    JsonPtr body = Json::parse(response.body);
    const cJSON* content_node = cJSON_GetObjectItemCaseSensitive(body.get(), "content");
    std::string new_sha = Json::get_string(content_node, "sha");
    if (new_sha.empty()) {
        throw storage::NetworkError("Remote: PUT " + path + " response carried no sha",
                                    response.status);
    }

    Logger::log(LogLevel::TRACE, "Remote: " + path + " written at " + new_sha);
    return new_sha;
}

} // namespace repodb::remote
