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
 * @file fake_contents_api.hpp
 * @brief In-memory stand-in for the repository contents API.
 *
 * @details
 * Implements `remote::HttpClient` so the real `ContentClient` runs against it.
 * Files carry a sha (`sha-N`, bumped on every write) and an ETag derived from
 * it. A PUT with a stale sha answers 409, a PUT without sha on an existing file
 * answers 422, exactly like the hosted service. Every call is recorded with
 * its timing, and PUT concurrency is tracked per path.
 */

#pragma once

#include "repodb/infra/base64.hpp"
#include "repodb/infra/json.hpp"
#include "repodb/remote/content_client.hpp"
#include "repodb/remote/http_client.hpp"
#include "repodb/storage/db.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace repodb::test {

class FakeContentsApi : public remote::HttpClient {
  public:
    static constexpr const char* kApiUrl = "https://api.test";
    static constexpr const char* kRawUrl = "https://raw.test/";

    struct Call {
        std::string method;
        std::string url;
        std::string path;
        long status = 0;
        std::map<std::string, std::string> headers;
        std::string body;
        std::chrono::steady_clock::time_point started;
        std::chrono::steady_clock::time_point finished;
    };

    // ------------------------------------------------------------------------
    // Transport
    // ------------------------------------------------------------------------

    remote::HttpResponse send(const remote::HttpRequest& request) override
    {
        Call call;
        call.method = request.method;
        call.url = request.url;
        call.headers = request.headers;
        call.body = request.body;
        call.started = std::chrono::steady_clock::now();

        const bool raw = request.url.rfind(kRawUrl, 0) == 0;
        call.path = raw ? request.url.substr(std::string(kRawUrl).size()) : path_of(request.url);

        remote::HttpResponse response;
        if (take_injected_failure(request.method, response)) {
            // Injected failure, nothing else happens.
        } else if (raw) {
            response = handle_raw(call.path);
        } else if (request.method == "GET") {
            response = handle_get(call.path, request);
        } else if (request.method == "PUT") {
            response = handle_put(call.path, request);
        } else {
            response = reply(405, "Method Not Allowed");
        }

        call.status = response.status;
        call.finished = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(std::move(call));
        }
        return response;
    }

    // ------------------------------------------------------------------------
    // Repository state
    // ------------------------------------------------------------------------

    /// @brief Writes `content` to `path` as a foreign writer would; returns the new sha.
    std::string seed(const std::string& path, const std::string& content)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        File& file = files_[path];
        file.content = content;
        file.sha = next_sha();
        return file.sha;
    }

    void erase(const std::string& path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        files_.erase(path);
    }

    bool exists(const std::string& path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.count(path) > 0;
    }

    std::string content(const std::string& path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        return it == files_.end() ? "" : it->second.content;
    }

    std::string sha(const std::string& path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        return it == files_.end() ? "" : it->second.sha;
    }

    infra::JsonPtr records(const std::string& path) const
    {
        return infra::Json::parse(content(path));
    }

    // ------------------------------------------------------------------------
    // Fault injection
    // ------------------------------------------------------------------------

    /// @brief The next `n` PUTs answer 409 regardless of sha; -1 means forever.
    void conflict_next_puts(int n)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forced_conflicts_ = n;
    }

    /// @brief Runs at the start of every PUT, before the version check.
    void set_before_put(std::function<void(const std::string& path)> hook)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before_put_ = std::move(hook);
    }

    /// @brief The next request with `method` answers `status` with `message`.
    void fail_next(const std::string& method, long status, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back({method, status, message});
    }

    void set_put_latency(std::chrono::milliseconds latency)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        put_latency_ = latency;
    }

    /// @brief Files larger than `bytes` are served with encoding "none".
    void set_inline_limit(size_t bytes)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inline_limit_ = bytes;
    }

    // ------------------------------------------------------------------------
    // Instrumentation
    // ------------------------------------------------------------------------

    std::vector<Call> calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t count(const std::string& method, const std::string& path = "") const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(
            std::count_if(calls_.begin(), calls_.end(), [&](const Call& call) {
                return call.method == method && (path.empty() || call.path == path);
            }));
    }

    size_t total_calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    /// @brief Highest number of PUTs to `path` that were ever in flight at once.
    int max_concurrent_puts(const std::string& path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = max_in_flight_.find(path);
        return it == max_in_flight_.end() ? 0 : it->second;
    }

    void reset_calls()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

  private:
    struct File {
        std::string content;
        std::string sha;
    };

    struct Failure {
        std::string method;
        long status;
        std::string message;
    };

    mutable std::mutex mutex_;
    std::map<std::string, File> files_;
    std::vector<Call> calls_;
    std::vector<Failure> failures_;
    std::map<std::string, int> in_flight_;
    std::map<std::string, int> max_in_flight_;
    std::function<void(const std::string&)> before_put_;
    std::chrono::milliseconds put_latency_{0};
    size_t inline_limit_ = 1024 * 1024;
    int forced_conflicts_ = 0;
    int sha_counter_ = 0;
    int commit_counter_ = 0;

    std::string next_sha()
    {
        return "sha-" + std::to_string(++sha_counter_);
    }

    static std::string etag_for(const File& file)
    {
        return "\"etag-" + file.sha + "\"";
    }

    static std::string path_of(const std::string& url)
    {
        const std::string marker = "/contents/";
        size_t start = url.find(marker);
        if (start == std::string::npos) {
            return "";
        }
        start += marker.size();
        size_t end = url.find('?', start);
        return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }

    static remote::HttpResponse reply(long status, const std::string& message)
    {
        remote::HttpResponse response;
        response.status = status;
        infra::JsonPtr body = infra::Json::object();
        infra::Json::set_string(body.get(), "message", message);
        response.body = infra::Json::print(body.get());
        return response;
    }

    /// Base64 with a line break every 60 characters, as the hosted API sends it.
    static std::string wrapped_base64(const std::string& content)
    {
        std::string encoded = infra::Base64::encode(content);
        std::string wrapped;
        for (size_t i = 0; i < encoded.size(); i += 60) {
            wrapped += encoded.substr(i, 60);
            wrapped += '\n';
        }
        return wrapped;
    }

    bool take_injected_failure(const std::string& method, remote::HttpResponse& response)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = failures_.begin(); it != failures_.end(); ++it) {
            if (it->method == method) {
                response = reply(it->status, it->message);
                failures_.erase(it);
                return true;
            }
        }
        return false;
    }

    remote::HttpResponse handle_raw(const std::string& path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) {
            return reply(404, "Not Found");
        }
        remote::HttpResponse response;
        response.status = 200;
        response.body = it->second.content;
        return response;
    }

    remote::HttpResponse handle_get(const std::string& path, const remote::HttpRequest& request)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) {
            return reply(404, "Not Found");
        }
        const File& file = it->second;
        const std::string etag = etag_for(file);

        auto validator = request.headers.find("If-None-Match");
        if (validator != request.headers.end() && validator->second == etag) {
            remote::HttpResponse response;
            response.status = 304;
            response.headers["etag"] = etag;
            return response;
        }

        infra::JsonPtr body = infra::Json::object();
        infra::Json::set_string(body.get(), "type", "file");
        infra::Json::set_string(body.get(), "path", path);
        infra::Json::set_string(body.get(), "sha", file.sha);
        infra::Json::set_string(body.get(), "download_url", kRawUrl + path);
        if (file.content.size() > inline_limit_) {
            infra::Json::set_string(body.get(), "encoding", "none");
            infra::Json::set_string(body.get(), "content", "");
        } else {
            infra::Json::set_string(body.get(), "encoding", "base64");
            infra::Json::set_string(body.get(), "content", wrapped_base64(file.content));
        }

        remote::HttpResponse response;
        response.status = 200;
        response.headers["etag"] = etag;
        response.body = infra::Json::print(body.get());
        return response;
    }

    remote::HttpResponse handle_put(const std::string& path, const remote::HttpRequest& request)
    {
        std::function<void(const std::string&)> hook;
        std::chrono::milliseconds latency;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = before_put_;
            latency = put_latency_;
            int& active = ++in_flight_[path];
            max_in_flight_[path] = std::max(max_in_flight_[path], active);
        }

        if (hook) {
            hook(path);
        }
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }

        remote::HttpResponse response = apply_put(path, request);

        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_[path];
        return response;
    }

    remote::HttpResponse apply_put(const std::string& path, const remote::HttpRequest& request)
    {
        infra::JsonPtr payload = infra::Json::parse(request.body);
        if (!payload) {
            return reply(400, "Problems parsing JSON");
        }
        const std::string sha = infra::Json::get_string(payload.get(), "sha");
        const std::string message = infra::Json::get_string(payload.get(), "message");
        const std::string content =
            infra::Base64::decode(infra::Json::get_string(payload.get(), "content"));

        std::lock_guard<std::mutex> lock(mutex_);

        if (forced_conflicts_ != 0) {
            if (forced_conflicts_ > 0) {
                --forced_conflicts_;
            }
            return reply(409, path + " does not match " + sha);
        }

        auto it = files_.find(path);
        const bool existed = it != files_.end();
        if (existed && sha.empty()) {
            return reply(422, "Invalid request.\n\n\"sha\" wasn't supplied.");
        }
        if (existed && sha != it->second.sha) {
            return reply(409, path + " does not match " + sha);
        }
        if (!existed && !sha.empty()) {
            return reply(409, path + " does not match " + sha);
        }

        File& file = files_[path];
        file.content = content;
        file.sha = next_sha();

        infra::JsonPtr body = infra::Json::object();
        infra::JsonPtr content_node = infra::Json::object();
        infra::Json::set_string(content_node.get(), "path", path);
        infra::Json::set_string(content_node.get(), "sha", file.sha);
        infra::Json::set(body.get(), "content", std::move(content_node));
        infra::JsonPtr commit = infra::Json::object();
        infra::Json::set_string(commit.get(), "sha", "commit-" + std::to_string(++commit_counter_));
        infra::Json::set_string(commit.get(), "message", message);
        infra::Json::set(body.get(), "commit", std::move(commit));

        remote::HttpResponse response;
        response.status = existed ? 200 : 201;
        response.body = infra::Json::print(body.get());
        return response;
    }
};

// ============================================================================
// Fixture helpers
// ============================================================================

inline remote::StoreConfig fake_store()
{
    remote::StoreConfig store;
    store.owner = "acme";
    store.repo = "data";
    store.branch = "main";
    store.base_path = "db";
    store.api_url = FakeContentsApi::kApiUrl;
    store.token = "test-token";
    return store;
}

/// @brief Fast retry settings so conflict tests finish in milliseconds.
inline storage::QueueOptions fast_queue(storage::WritePolicy policy = storage::WritePolicy::REBASE)
{
    storage::QueueOptions queue;
    queue.max_attempts = 5;
    queue.backoff_base_ms = 1;
    queue.backoff_factor = 2.0;
    queue.backoff_cap_ms = 4;
    queue.policy = policy;
    return queue;
}

inline storage::DbOptions fake_db_options(
    storage::WritePolicy policy = storage::WritePolicy::REBASE)
{
    storage::DbOptions options;
    options.store = fake_store();
    options.queue = fast_queue(policy);
    options.pool_threads = 2;
    return options;
}

} // namespace repodb::test
