// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplift/core/event_bus.hpp>
#include <stdexcept>
#include <vector>

using namespace uplift::core;

TEST_CASE("EventBus delivers by kind", "[events]") {
    EventBus bus;
    std::vector<TaskId> queued;
    int everything = 0;

    bus.subscribe(EventKind::upload_queued, [&](const Event& e) {
        queued.push_back(std::get<UploadQueued>(e).task_id);
    });
    bus.subscribe_all([&](const Event&) { ++everything; });

    bus.emit(UploadQueued{1, "a.mp4", 10, 10, 1});
    bus.emit(UploadStarted{1, "a.mp4", 10});
    bus.emit(QueueEmpty{});

    REQUIRE(queued.size() == 1);
    CHECK(queued[0] == 1);
    CHECK(everything == 3);
}

TEST_CASE("EventBus unsubscribe", "[events]") {
    EventBus bus;
    int calls = 0;

    auto sub = bus.subscribe(EventKind::queue_empty, [&](const Event&) { ++calls; });
    CHECK(sub.active());
    bus.emit(QueueEmpty{});
    CHECK(calls == 1);

    sub.unsubscribe();
    CHECK_FALSE(sub.active());
    bus.emit(QueueEmpty{});
    CHECK(calls == 1);
    CHECK(bus.subscriber_count() == 0);

    SECTION("Unsubscribe twice is harmless") {
        sub.unsubscribe();
        CHECK(bus.subscriber_count() == 0);
    }
}

TEST_CASE("EventBus isolates throwing subscribers", "[events]") {
    EventBus bus;
    int after = 0;

    bus.subscribe_all([](const Event&) { throw std::runtime_error("boom"); });
    bus.subscribe_all([&](const Event&) { ++after; });

    bus.emit(QueueEmpty{});
    CHECK(after == 1);
}

TEST_CASE("EventBus tolerates changes during emit", "[events]") {
    EventBus bus;
    int late = 0;
    Subscription self;

    self = bus.subscribe(EventKind::queue_empty, [&](const Event&) {
        self.unsubscribe();
        bus.subscribe(EventKind::queue_empty, [&](const Event&) { ++late; });
    });

    bus.emit(QueueEmpty{});
    CHECK(late == 0);       // Added during emit, not part of the snapshot
    bus.emit(QueueEmpty{});
    CHECK(late == 1);
}

TEST_CASE("EventBus skips subscribers removed during emit", "[events]") {
    EventBus bus;
    int second_calls = 0;
    Subscription second;

    SECTION("Unsubscribed by an earlier handler") {
        auto first = bus.subscribe_all([&](const Event&) { second.unsubscribe(); });
        second = bus.subscribe_all([&](const Event&) { ++second_calls; });

        bus.emit(QueueEmpty{});
        CHECK(second_calls == 0);
        CHECK(bus.subscriber_count() == 1);
    }

    SECTION("Bus cleared by an earlier handler") {
        auto first = bus.subscribe(EventKind::queue_empty, [&](const Event&) { bus.clear(); });
        second = bus.subscribe(EventKind::queue_empty, [&](const Event&) { ++second_calls; });

        bus.emit(QueueEmpty{});
        CHECK(second_calls == 0);
        CHECK(bus.subscriber_count() == 0);
    }
}

TEST_CASE("EventBus clear drops every subscriber", "[events]") {
    EventBus bus;
    auto sub = bus.subscribe_all([](const Event&) {});
    bus.subscribe(EventKind::upload_error, [](const Event&) {});
    CHECK(bus.subscriber_count() == 2);

    bus.clear();
    CHECK(bus.subscriber_count() == 0);
    CHECK_FALSE(sub.active());
}

TEST_CASE("Event kinds", "[events]") {
    CHECK(kind_of(Event{UploadProgress{}}) == EventKind::upload_progress);
    CHECK(kind_of(Event{NetworkChange{}}) == EventKind::network_change);
    CHECK(to_string(EventKind::queue_empty) == "queue-empty");
    CHECK(to_string(EventKind::upload_cancelled) == "upload-cancelled");
}
