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
 * @file scheduler.hpp
 * @brief Thread pool for fan-out work that has no ordering requirement.
 *
 * @details
 * The `Scheduler` runs independent jobs (such as warming every registered
 * collection during bulk initialisation) on a fixed set of worker threads.
 * Writes never go through this pool: ordering-sensitive work belongs to the
 * per-collection lanes of `storage::WriteQueue`.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace repodb::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero (what `hardware_concurrency()` may
     * report) is raised to one.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue, then joins every worker.
     *
     * @note Blocking: tasks already queued still run before the pool is gone.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// @brief Fire-and-forget submission.
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a callable and returns a future for its result.
     *
     * Exceptions thrown by `fn` are captured in the future.
     *
     * @code
     * auto f = scheduler.submit([&] { return db.load("users"); });
     * auto users = f.get();
     * @endcode
     */
    template <typename Fn> auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>>
    {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        enqueue([task] { (*task)(); });
        return future;
    }

    /// @brief Number of worker threads owned by the pool.
    size_t size() const
    {
        return workers_.size();
    }

  private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace repodb::infra
