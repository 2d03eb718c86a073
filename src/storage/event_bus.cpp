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
 * @file event_bus.cpp
 * @brief Subscription bookkeeping and failure-isolated delivery.
 */

#include "repodb/storage/event_bus.hpp"

#include "repodb/infra/logger.hpp"

#include <exception>

namespace repodb::storage {

using infra::LogLevel;
using infra::Logger;

/// Shared between the bus and every token; tokens hold it weakly.
struct Subscription::State {
    struct Slot {
        uint64_t id;
        std::shared_ptr<EventBus::Callback> callback;
    };

    std::mutex lock;
    uint64_t next_id = 1;
    std::unordered_map<std::string, std::vector<Slot>> slots;

    void remove(const std::string& collection, uint64_t id)
    {
        std::lock_guard<std::mutex> guard(lock);
        auto it = slots.find(collection);
        if (it == slots.end())
            return;

        auto& list = it->second;
        for (auto slot = list.begin(); slot != list.end(); ++slot) {
            if (slot->id == id) {
                list.erase(slot);
                break;
            }
        }
        if (list.empty())
            slots.erase(it);
    }

    bool contains(const std::string& collection, uint64_t id)
    {
        std::lock_guard<std::mutex> guard(lock);
        auto it = slots.find(collection);
        if (it == slots.end())
            return false;
        for (const auto& slot : it->second) {
            if (slot.id == id)
                return true;
        }
        return false;
    }
};

// ----------------------------------------------------------------------------
// Subscription
// ----------------------------------------------------------------------------

Subscription::Subscription(std::weak_ptr<State> bus_state, std::string collection, uint64_t id)
    : bus_state_(std::move(bus_state)), collection_(std::move(collection)), id_(id)
{
}

Subscription::Subscription(Subscription&& other) noexcept
    : bus_state_(std::move(other.bus_state_)), collection_(std::move(other.collection_)),
      id_(other.id_)
{
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept
{
    if (this != &other) {
        bus_state_ = std::move(other.bus_state_);
        collection_ = std::move(other.collection_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::unsubscribe()
{
    if (id_ == 0)
        return;
    if (auto state = bus_state_.lock()) {
        state->remove(collection_, id_);
    }
    bus_state_.reset();
    id_ = 0;
}

bool Subscription::active() const
{
    if (id_ == 0)
        return false;
    auto state = bus_state_.lock();
    return state && state->contains(collection_, id_);
}

ScopedSubscription& ScopedSubscription::operator=(ScopedSubscription&& other) noexcept
{
    if (this != &other) {
        subscription_.unsubscribe();
        subscription_ = other.release();
    }
    return *this;
}

ScopedSubscription::~ScopedSubscription()
{
    subscription_.unsubscribe();
}

// ----------------------------------------------------------------------------
// EventBus
// ----------------------------------------------------------------------------

EventBus::EventBus() : state_(std::make_shared<Subscription::State>()) {}

EventBus::~EventBus() = default;

Subscription EventBus::subscribe(const std::string& collection, Callback callback)
{
    std::lock_guard<std::mutex> guard(state_->lock);
    uint64_t id = state_->next_id++;
    state_->slots[collection].push_back(
        {id, std::make_shared<Callback>(std::move(callback))});
    return Subscription(state_, collection, id);
}

size_t EventBus::notify(const std::string& collection, const cJSON* records)
{
    std::vector<Subscription::State::Slot> targets;
    {
        std::lock_guard<std::mutex> guard(state_->lock);
        auto it = state_->slots.find(collection);
        if (it == state_->slots.end())
            return 0;
        targets = it->second;
    }

    size_t delivered = 0;
    for (const auto& slot : targets) {
        try {
            (*slot.callback)(records);
            delivered++;
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR, "Events: Subscriber of " + collection +
                                             " threw: " + std::string(e.what()));
        } catch (...) {
            Logger::log(LogLevel::ERROR,
                        "Events: Subscriber of " + collection + " threw a non-standard exception");
        }
    }
    return delivered;
}

size_t EventBus::subscriber_count(const std::string& collection) const
{
    std::lock_guard<std::mutex> guard(state_->lock);
    auto it = state_->slots.find(collection);
    return it == state_->slots.end() ? 0 : it->second.size();
}

} // namespace repodb::storage
