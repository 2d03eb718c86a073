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
 * @file content_client.hpp
 * @brief Remote object store client over a repository "contents" API.
 *
 * @details
 * Every collection lives in one file of a Git repository. Reads are conditional
 * on the ETag of the previous read; writes are conditional on the blob sha the
 * writer last observed. The store rejects a write whose sha is stale, which is
 * the only cross-process coordination RepoDB relies on.
 */

#pragma once

#include "repodb/remote/http_client.hpp"

#include <string>

namespace repodb::remote {

/**
 * @struct StoreConfig
 * @brief Coordinates of the backing repository.
 */
struct StoreConfig {
    std::string owner;
    std::string repo;
    std::string branch = "main";

    /// @brief Directory inside the repository holding `<collection>.json` files.
    std::string base_path = "db";

    std::string api_url = "https://api.github.com";

    /// @brief Personal access token; requests are anonymous when empty.
    std::string token;

    long timeout_ms = 30000;
};

/**
 * @struct RemoteDocument
 * @brief Result of a conditional read.
 */
struct RemoteDocument {
    /// @brief Decoded UTF-8 file body (empty when `not_modified`).
    std::string content;

    /// @brief Opaque HTTP validator for the next conditional read.
    std::string etag;

    /// @brief Blob sha; the version tag required by the next write.
    std::string sha;

    /// @brief True when the store answered 304 to `If-None-Match`.
    bool not_modified = false;
};

/**
 * @class ContentClient
 * @brief Thin wrapper translating document reads/writes into contents-API calls.
 */
class ContentClient {
  public:
    /**
     * @param http Transport; must outlive the client.
     * @param config Repository coordinates.
     */
    ContentClient(HttpClient& http, StoreConfig config);

    /**
     * @brief Conditional GET of a file.
     *
     * @param path Repository-relative file path.
     * @param etag Validator from a previous read; empty for an unconditional read.
     *
     * @throws NotFoundError when the file does not exist (404).
     * @throws NetworkError for any other failure.
     */
    RemoteDocument get(const std::string& path, const std::string& etag = "");

    /**
     * @brief Conditional PUT (create or replace) of a file.
     *
     * @param path Repository-relative file path.
     * @param content UTF-8 body; base64-encoded for transport.
     * @param sha Version tag the writer observed; empty to create a new file.
     * @param message Commit message.
     * @return std::string The sha of the newly written blob.
     *
     * @throws ConflictError when `sha` is stale or missing for an existing file.
     * @throws NotFoundError when the repository or branch does not exist.
     * @throws NetworkError for any other failure.
     */
    std::string put(const std::string& path, const std::string& content, const std::string& sha,
                    const std::string& message);

    /// @brief `<base_path>/<collection>.json`.
    std::string path_for(const std::string& collection) const;

    const StoreConfig& config() const
    {
        return config_;
    }

  private:
    HttpClient& http_;
    StoreConfig config_;

    std::string url_for(const std::string& path) const;
    HttpRequest make_request(const std::string& method, const std::string& url) const;
    std::string fetch_raw(const std::string& download_url, const std::string& path);
};

} // namespace repodb::remote
