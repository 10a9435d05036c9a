// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/event_bus.hpp>
#include <uplift/log.hpp>
#include <algorithm>
#include <exception>
#include <utility>

namespace uplift::core {

//=============================================================================
// Subscription
//=============================================================================

void Subscription::unsubscribe() noexcept {
    if (auto state = state_.lock()) {
        std::erase_if(state->entries, [this](const detail::BusState::Entry& e) {
            return e.id == id_;
        });
    }
    state_.reset();
}

bool Subscription::active() const noexcept {
    auto state = state_.lock();
    if (!state) return false;
    return std::any_of(state->entries.begin(), state->entries.end(),
                       [this](const detail::BusState::Entry& e) { return e.id == id_; });
}

//=============================================================================
// EventBus
//=============================================================================

EventBus::EventBus()
    : state_(std::make_shared<detail::BusState>()) {
}

Subscription EventBus::subscribe(EventKind kind, EventHandler handler) {
    return add(kind, std::move(handler));
}

Subscription EventBus::subscribe_all(EventHandler handler) {
    return add(std::nullopt, std::move(handler));
}

Subscription EventBus::add(std::optional<EventKind> kind, EventHandler handler) {
    const auto id = state_->next_id++;
    state_->entries.push_back({id, kind, std::make_shared<EventHandler>(std::move(handler))});
    return Subscription(state_, id);
}

void EventBus::emit(const Event& event) noexcept {
    const auto kind = kind_of(event);

    // Handlers may subscribe or unsubscribe while we iterate
    auto state = state_;
    std::vector<std::pair<std::uint64_t, std::shared_ptr<EventHandler>>> targets;
    targets.reserve(state->entries.size());
    for (const auto& entry : state->entries) {
        if (!entry.kind || *entry.kind == kind) {
            targets.emplace_back(entry.id, entry.handler);
        }
    }

    for (const auto& [id, handler] : targets) {
        // Removed by an earlier handler in this same delivery
        const bool registered = std::any_of(state->entries.begin(), state->entries.end(),
                                            [id](const detail::BusState::Entry& e) { return e.id == id; });
        if (!registered || !*handler) continue;
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            log::get()->error("Subscriber for {} threw: {}", to_string(kind), e.what());
        }
    }
}

void EventBus::clear() noexcept {
    state_->entries.clear();
}

} // namespace uplift::core
