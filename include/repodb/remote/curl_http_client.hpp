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
 * @file curl_http_client.hpp
 * @brief libcurl implementation of `HttpClient`.
 */

#pragma once

#include "repodb/remote/http_client.hpp"

namespace repodb::remote {

/**
 * @class CurlHttpClient
 * @brief Blocking HTTP(S) transport on a fresh libcurl easy handle per request.
 *
 * Easy handles are never shared, so concurrent `send` calls from different
 * threads need no locking. `curl_global_init` runs once per process.
 */
class CurlHttpClient : public HttpClient {
  public:
    /**
     * @param timeout_ms Whole-request timeout; 0 disables it.
     * @param connect_timeout_ms Connection-phase timeout; 0 uses libcurl's default.
     */
    explicit CurlHttpClient(long timeout_ms = 30000, long connect_timeout_ms = 10000);

    HttpResponse send(const HttpRequest& request) override;

  private:
    long timeout_ms_;
    long connect_timeout_ms_;
};

} // namespace repodb::remote
