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
 * @file curl_http_client.cpp
 * @brief libcurl-backed transport.
 */

#include "repodb/remote/curl_http_client.hpp"

#include "repodb/infra/logger.hpp"
#include "repodb/infra/string.hpp"
#include "repodb/storage/errors.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace repodb::remote {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const
    {
        curl_easy_cleanup(handle);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const
    {
        curl_slist_free_all(list);
    }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

std::once_flag g_curl_init;

size_t write_body(char* data, size_t size, size_t count, void* user)
{
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * count);
    return size * count;
}

/// Collects "Name: value" lines; the status line and blank terminator are skipped.
size_t write_header(char* data, size_t size, size_t count, void* user)
{
    auto* response = static_cast<HttpResponse*>(user);
    std::string line(data, size * count);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = infra::String::to_lower(infra::String::trim(line.substr(0, colon)));
        response->headers[name] = infra::String::trim(line.substr(colon + 1));
    }
    return size * count;
}

} // namespace

CurlHttpClient::CurlHttpClient(long timeout_ms, long connect_timeout_ms)
    : timeout_ms_(timeout_ms), connect_timeout_ms_(connect_timeout_ms)
{
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::send(const HttpRequest& request)
{
    EasyHandle easy(curl_easy_init());
    if (!easy) {
        throw storage::NetworkError("Remote: curl_easy_init failed");
    }

    HttpResponse response;
    HeaderList headers;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            throw storage::NetworkError("Remote: failed to build request headers");
        }
        headers.release();
        headers.reset(appended);
    }

    CURL* h = easy.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &response);
    if (timeout_ms_ > 0)
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    if (connect_timeout_ms_ > 0)
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);

    if (request.method == "GET") {
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        std::string reason = curl_easy_strerror(rc);
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Remote: " + request.method + " " + request.url + " failed: " + reason);
        throw storage::NetworkError("Remote: transport failure: " + reason);
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace repodb::remote
