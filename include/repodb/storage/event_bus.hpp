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
 * @file event_bus.hpp
 * @brief "Collection changed" notification channel.
 *
 * @details
 * Subscribers register per collection and receive the full record array each
 * time the cached snapshot changes. Delivery is synchronous on the notifying
 * thread; a subscriber that throws is logged and skipped, the remaining
 * subscribers still receive the event.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace repodb::storage {

class EventBus;

/**
 * @class Subscription
 * @brief Move-only token for one registration.
 *
 * Does NOT unsubscribe on destruction; wrap it in `ScopedSubscription` for that.
 * The token may outlive the bus: `unsubscribe()` then becomes a no-op.
 */
class Subscription {
  public:
    Subscription() = default;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    ~Subscription() = default;

    /// @brief Removes the registration. Idempotent.
    void unsubscribe();

    bool active() const;

  private:
    friend class EventBus;
    struct State;

    Subscription(std::weak_ptr<State> bus_state, std::string collection, uint64_t id);

    std::weak_ptr<State> bus_state_;
    std::string collection_;
    uint64_t id_ = 0;
};

/**
 * @class ScopedSubscription
 * @brief RAII holder that unsubscribes when it goes out of scope.
 */
class ScopedSubscription {
  public:
    ScopedSubscription() = default;
    ScopedSubscription(Subscription subscription) : subscription_(std::move(subscription)) {}
    ScopedSubscription(ScopedSubscription&&) = default;
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept;
    ~ScopedSubscription();

    Subscription release()
    {
        return std::move(subscription_);
    }

  private:
    Subscription subscription_;
};

/**
 * @class EventBus
 * @brief Per-collection synchronous multicast.
 */
class EventBus {
  public:
    /// @brief Receives the collection's current record array (borrowed for the call).
    using Callback = std::function<void(const cJSON* records)>;

    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    Subscription subscribe(const std::string& collection, Callback callback);

    /**
     * @brief Delivers `records` to every current subscriber of `collection`.
     *
     * Iterates over a copy of the subscriber list, so callbacks may subscribe
     * or unsubscribe re-entrantly.
     *
     * @return size_t Number of subscribers that completed without throwing.
     */
    size_t notify(const std::string& collection, const cJSON* records);

    size_t subscriber_count(const std::string& collection) const;

  private:
    std::shared_ptr<Subscription::State> state_;
};

} // namespace repodb::storage
