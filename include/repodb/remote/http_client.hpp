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
 * @file http_client.hpp
 * @brief Abstract HTTP transport used by the remote object store client.
 *
 * @details
 * The contents client only needs "send a request, get status/headers/body".
 * Keeping that behind an interface lets production use libcurl while tests
 * plug in an in-memory fake with instrumentation.
 */

#pragma once

#include <map>
#include <string>

namespace repodb::remote {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;

    /// @brief Header names are stored lower-cased ("etag", "content-type").
    std::map<std::string, std::string> headers;
    std::string body;

    bool ok() const
    {
        return status >= 200 && status < 300;
    }

    /// @brief Case-insensitive lookup; empty when absent.
    std::string header(const std::string& name) const;
};

/**
 * @class HttpClient
 * @brief Synchronous request/response transport.
 *
 * Implementations must be safe to call from several threads at once (one lane
 * worker per collection plus reader threads).
 */
class HttpClient {
  public:
    virtual ~HttpClient() = default;

    /**
     * @brief Performs one request.
     *
     * Any status code is a successful *transport* outcome and is returned.
     *
     * @throws NetworkError when no response was received (DNS, TLS, timeout, ...).
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace repodb::remote
