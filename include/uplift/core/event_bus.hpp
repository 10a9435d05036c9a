// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/events.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace uplift::core {

using EventHandler = std::function<void(const Event&)>;

namespace detail {

struct BusState {
    struct Entry {
        std::uint64_t id{0};
        std::optional<EventKind> kind;    // nullopt receives everything
        std::shared_ptr<EventHandler> handler;
    };

    std::vector<Entry> entries;
    std::uint64_t next_id{1};
};

} // namespace detail

// Handle returned by subscribe; the handler stays registered until unsubscribe()
class Subscription {
public:
    Subscription() = default;

    void unsubscribe() noexcept;
    [[nodiscard]] bool active() const noexcept;

private:
    friend class EventBus;
    Subscription(std::weak_ptr<detail::BusState> state, std::uint64_t id) noexcept
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::BusState> state_;
    std::uint64_t id_{0};
};

// Synchronous publish/subscribe channel, single-threaded
class EventBus {
public:
    EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    Subscription subscribe(EventKind kind, EventHandler handler);
    Subscription subscribe_all(EventHandler handler);

    // Deliver to the subscribers registered when emit began, skipping any
    // removed during delivery; throwing handlers are logged
    void emit(const Event& event) noexcept;

    // Drop every subscriber
    void clear() noexcept;

    [[nodiscard]] std::size_t subscriber_count() const noexcept { return state_->entries.size(); }

private:
    Subscription add(std::optional<EventKind> kind, EventHandler handler);

    std::shared_ptr<detail::BusState> state_;
};

} // namespace uplift::core
