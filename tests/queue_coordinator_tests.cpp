// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplift/core/error.hpp>
#include <uplift/core/mock_transport.hpp>
#include <uplift/core/queue_coordinator.hpp>
#include "test_support.hpp"
#include <boost/asio/io_context.hpp>
#include <algorithm>
#include <map>
#include <optional>
#include <vector>

using namespace uplift::core;
using namespace std::chrono_literals;
using uplift::test::run_until;

namespace {

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = 1024 * KiB;

QueueConfig quiet_config() {
    QueueConfig c;
    c.max_concurrent_files = 2;
    c.max_concurrent_chunks = 2;
    c.retry_attempts = 3;
    c.base_retry_delay = 1ms;
    c.adaptive_optimization = false;
    c.network_optimization = false;
    return c;
}

EngineOptions fast_options() {
    EngineOptions o;
    o.default_chunk_size = 512 * KiB;
    o.max_retry_delay = 5ms;
    o.retry_jitter = 0.0;
    o.optimization_interval = 0ms;
    o.network_poll_interval = 0ms;
    return o;
}

// Records every event the coordinator publishes
struct Recorder {
    explicit Recorder(QueueCoordinator& q) {
        sub = q.subscribe_all([this](const Event& e) { events.push_back(e); });
    }

    template<typename T>
    std::vector<T> of() const {
        std::vector<T> out;
        for (const auto& e : events) {
            if (auto* v = std::get_if<T>(&e)) out.push_back(*v);
        }
        return out;
    }

    template<typename T>
    std::size_t count() const { return of<T>().size(); }

    std::vector<Event> events;
    Subscription sub;
};

} // namespace

TEST_CASE("Coordinator rejects invalid submissions", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    QueueCoordinator queue(io.get_executor(), transport, quiet_config(), fast_options());

    auto null_payload = queue.submit(nullptr, {});
    REQUIRE_FALSE(null_payload);
    CHECK(null_payload.error() == UploadErrc::validation_failed);

    auto empty = queue.submit(MemoryPayload::filled("empty.txt", 0), {});
    REQUIRE_FALSE(empty);
    CHECK(empty.error() == UploadErrc::validation_failed);

    CHECK(queue.status().queued == 0);
    CHECK(queue.cancel(42) == UploadErrc::unknown_task);
    CHECK(queue.pause(42) == UploadErrc::unknown_task);
    CHECK(queue.resume(42) == UploadErrc::unknown_task);
}

TEST_CASE("Coordinator starts the smallest files first", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(1ms);
    auto config = quiet_config();
    config.priority_mode = PriorityMode::smallest_first;
    QueueCoordinator queue(io.get_executor(), transport, config, fast_options());
    Recorder rec(queue);

    std::size_t max_active = 0;
    auto watch = queue.subscribe_all([&](const Event&) {
        max_active = std::max(max_active, queue.status().active);
    });
    bool empty = false;
    auto on_empty = queue.subscribe(EventKind::queue_empty, [&](const Event&) { empty = true; });

    std::map<TaskId, std::uint64_t> size_of;
    for (std::uint64_t mb : {5, 3, 1, 4, 2}) {
        auto id = queue.submit(MemoryPayload::filled(std::to_string(mb) + "mb.bin", mb * MiB), {});
        REQUIRE(id);
        size_of[*id] = mb;
    }
    CHECK(queue.status().queued == 5);
    CHECK(queue.status().active == 0);

    REQUIRE(run_until(io, [&] { return empty; }));

    auto started = rec.of<UploadStarted>();
    REQUIRE(started.size() == 5);
    CHECK(size_of[started[0].task_id] == 1);
    CHECK(size_of[started[1].task_id] == 2);
    for (std::size_t i = 1; i < started.size(); ++i) {
        CHECK(started[i - 1].size < started[i].size);
    }

    CHECK(max_active <= 2);
    CHECK(rec.count<UploadCompleted>() == 5);
    CHECK(rec.count<UploadError>() == 0);
    CHECK(transport.stats().completed.size() == 5);
    for (const auto& [upload, peak] : transport.stats().max_in_flight_per_upload) {
        CHECK(peak <= 2);
    }

    auto status = queue.status();
    CHECK(status.completed == 5);
    CHECK(status.active == 0);
    CHECK(status.queued == 0);
}

TEST_CASE("Coordinator orders by explicit priority and mode", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    auto config = quiet_config();
    config.max_concurrent_files = 1;

    SECTION("Largest first") {
        config.priority_mode = PriorityMode::largest_first;
        QueueCoordinator queue(io.get_executor(), transport, config, fast_options());
        Recorder rec(queue);

        auto small = queue.submit(MemoryPayload::filled("small", 64 * KiB), {});
        auto large = queue.submit(MemoryPayload::filled("large", 256 * KiB), {});
        REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 2; }));

        auto started = rec.of<UploadStarted>();
        REQUIRE(started.size() == 2);
        CHECK(started[0].task_id == *large);
        CHECK(started[1].task_id == *small);
    }

    SECTION("Fifo with an explicit override") {
        config.priority_mode = PriorityMode::fifo;
        QueueCoordinator queue(io.get_executor(), transport, config, fast_options());
        Recorder rec(queue);

        auto first = queue.submit(MemoryPayload::filled("first", 64 * KiB), {});
        auto second = queue.submit(MemoryPayload::filled("second", 64 * KiB), {});
        SubmitOptions urgent;
        urgent.priority = -1;
        auto third = queue.submit(MemoryPayload::filled("third", 64 * KiB), {}, std::move(urgent));
        REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 3; }));

        auto started = rec.of<UploadStarted>();
        REQUIRE(started.size() == 3);
        CHECK(started[0].task_id == *third);
        CHECK(started[1].task_id == *first);
        CHECK(started[2].task_id == *second);

        auto queued = rec.of<UploadQueued>();
        REQUIRE(queued.size() == 3);
        CHECK(queued[2].priority == -1);
        CHECK(queued[2].queue_length == 3);
    }
}

TEST_CASE("Coordinator retries a flaky chunk to completion", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(1ms);
    transport.fail_chunk(1, MockTransport::network_error(), 2);
    QueueCoordinator queue(io.get_executor(), transport, quiet_config(), fast_options());
    Recorder rec(queue);

    std::optional<UploadCompleted> callback_result;
    SubmitOptions opts;
    std::optional<TaskId> id;
    std::uint32_t snapshot_retries = 0;
    opts.callbacks.on_progress = [&](const UploadProgress&) {
        if (auto snap = queue.task(*id)) snapshot_retries = snap->retry_count;
    };
    opts.callbacks.on_complete = [&](const UploadCompleted& c) { callback_result = c; };
    auto submitted = queue.submit(MemoryPayload::filled("flaky.bin", 2 * MiB), {}, std::move(opts));
    REQUIRE(submitted);
    id = *submitted;

    REQUIRE(run_until(io, [&] { return callback_result.has_value(); }));

    CHECK(snapshot_retries == 2);
    CHECK(transport.attempts(1) == 3);
    CHECK(callback_result->task_id == *id);
    CHECK(callback_result->total_retries == 2);
    CHECK(rec.count<UploadError>() == 0);
    CHECK(queue.status().completed == 1);
}

TEST_CASE("Coordinator reports exhausted retries once", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(1ms);
    transport.fail_chunk(0, MockTransport::network_error(), 100);
    auto config = quiet_config();
    config.retry_attempts = 2;
    QueueCoordinator queue(io.get_executor(), transport, config, fast_options());
    Recorder rec(queue);

    std::vector<UploadError> callback_errors;
    SubmitOptions opts;
    opts.callbacks.on_error = [&](const UploadError& e) { callback_errors.push_back(e); };
    auto id = queue.submit(MemoryPayload::filled("doomed.bin", 1 * MiB), {}, std::move(opts));
    REQUIRE(id);

    REQUIRE(run_until(io, [&] { return rec.count<QueueEmpty>() == 1; }));
    uplift::test::run_for(io, 20ms);

    auto errors = rec.of<UploadError>();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].task_id == *id);
    CHECK(errors[0].error.kind == ErrorKind::network);
    CHECK(callback_errors.size() == 1);
    CHECK(transport.attempts(0) == 3);
    CHECK(rec.count<UploadCompleted>() == 0);
    CHECK(queue.status().failed == 1);
    CHECK(queue.optimizer().success_rate() == Catch::Approx(0.0));
    CHECK_FALSE(queue.task(*id).has_value());
}

TEST_CASE("Coordinator cancel", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(5ms);
    QueueCoordinator queue(io.get_executor(), transport, quiet_config(), fast_options());
    Recorder rec(queue);

    SECTION("Mid-transfer stops all activity") {
        auto payload = MemoryPayload::filled("movie.mp4", 4 * MiB);
        auto id = queue.submit(payload, {});
        REQUIRE(id);

        std::size_t progress_after_cancel = 0;
        bool cancelled = false;
        auto sub = queue.subscribe(EventKind::upload_progress, [&](const Event&) {
            if (cancelled) {
                ++progress_after_cancel;
                return;
            }
            cancelled = true;
            CHECK_FALSE(queue.cancel(*id));
        });

        REQUIRE(run_until(io, [&] { return cancelled; }));
        uplift::test::run_for(io, 50ms);

        CHECK(progress_after_cancel == 0);
        auto events = rec.of<UploadCancelled>();
        REQUIRE(events.size() == 1);
        CHECK(events[0].task_id == *id);
        CHECK(events[0].was_active);
        CHECK(rec.count<UploadCompleted>() == 0);
        CHECK(transport.in_flight() == 0);
        CHECK(transport.stats().aborted.size() == 1);
        CHECK(queue.status().cancelled == 1);
        CHECK(queue.status().active == 0);

        SECTION("Resubmitting starts a fresh task") {
            auto again = queue.submit(payload, {});
            REQUIRE(again);
            CHECK(*again != *id);
            REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 1; }));
            CHECK(rec.of<UploadCompleted>()[0].task_id == *again);
        }
    }

    SECTION("While queued") {
        auto a = queue.submit(MemoryPayload::filled("a", 64 * KiB), {});
        auto b = queue.submit(MemoryPayload::filled("b", 64 * KiB), {});
        auto c = queue.submit(MemoryPayload::filled("c", 64 * KiB), {});
        REQUIRE((a && b && c));

        CHECK_FALSE(queue.cancel(*c));
        CHECK(queue.status().queued == 2);
        auto events = rec.of<UploadCancelled>();
        REQUIRE(events.size() == 1);
        CHECK_FALSE(events[0].was_active);

        CHECK(queue.cancel(*c) == UploadErrc::unknown_task);
        REQUIRE(run_until(io, [&] { return rec.count<QueueEmpty>() == 1; }));
        CHECK(rec.count<UploadCompleted>() == 2);
    }
}

TEST_CASE("Coordinator pause and resume", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(5ms);
    QueueCoordinator queue(io.get_executor(), transport, quiet_config(), fast_options());
    Recorder rec(queue);

    auto id = queue.submit(MemoryPayload::filled("pausable.bin", 4 * MiB), {});
    REQUIRE(id);
    REQUIRE(run_until(io, [&] { return rec.count<UploadProgress>() > 0; }));

    CHECK_FALSE(queue.pause(*id));
    CHECK(queue.status().paused == 1);
    CHECK(queue.task(*id)->status == TaskStatus::paused);
    CHECK(queue.pause(*id) == UploadErrc::invalid_state);

    const auto progress = rec.count<UploadProgress>();
    uplift::test::run_for(io, 40ms);
    CHECK(rec.count<UploadProgress>() == progress);

    CHECK_FALSE(queue.resume(*id));
    REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 1; }));
    CHECK(rec.count<UploadPaused>() == 1);
    CHECK(rec.count<UploadResumed>() == 1);

    SECTION("Bulk controls") {
        auto x = queue.submit(MemoryPayload::filled("x", 4 * MiB), {});
        auto y = queue.submit(MemoryPayload::filled("y", 4 * MiB), {});
        REQUIRE(run_until(io, [&] {
            auto a = queue.task(*x);
            auto b = queue.task(*y);
            return a && b && a->status == TaskStatus::uploading && b->status == TaskStatus::uploading;
        }));

        queue.pause_all();
        CHECK(queue.status().paused == 2);
        queue.resume_all();
        CHECK(queue.status().paused == 0);
        REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 3; }));
    }
}

TEST_CASE("Coordinator pauses while offline", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(5ms);
    const NetworkSample online{EffectiveType::g4, 4 * MiB, 40ms, true};
    auto sampler = std::make_shared<ManualSampler>(online);
    QueueCoordinator queue(io.get_executor(), transport, quiet_config(), fast_options(), sampler);
    Recorder rec(queue);

    auto id = queue.submit(MemoryPayload::filled("roaming.bin", 4 * MiB), {});
    REQUIRE(id);
    REQUIRE(run_until(io, [&] { return rec.count<UploadProgress>() > 0; }));

    auto offline = online;
    offline.online = false;
    sampler->set(offline);
    queue.refresh_network();

    auto paused = rec.of<UploadPaused>();
    REQUIRE(paused.size() == 1);
    CHECK(paused[0].offline);
    CHECK_FALSE(queue.status().network.online);

    const auto progress = rec.count<UploadProgress>();
    uplift::test::run_for(io, 30ms);
    CHECK(rec.count<UploadProgress>() == progress);

    sampler->set(online);
    queue.refresh_network();
    CHECK(rec.count<UploadResumed>() == 1);
    REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 1; }));
    CHECK(rec.count<NetworkChange>() == 2);
}

TEST_CASE("Coordinator shrinks chunks when the network degrades", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(1ms);

    const NetworkSample fast{EffectiveType::g4, 2 * MiB, 40ms, true};
    auto sampler = std::make_shared<ManualSampler>(fast);
    auto config = quiet_config();
    config.max_concurrent_chunks = 1;
    config.network_optimization = true;
    auto options = fast_options();
    options.default_chunk_size = DEFAULT_CHUNK_SIZE;

    QueueCoordinator queue(io.get_executor(), transport, config, options, sampler);
    Recorder rec(queue);
    CHECK(queue.chunk_size() == DEFAULT_CHUNK_SIZE);

    std::optional<std::uint32_t> switched_at;
    auto sub = queue.subscribe(EventKind::upload_progress, [&](const Event& e) {
        const auto& p = std::get<UploadProgress>(e);
        if (!switched_at && p.completed_chunks == 2) {
            switched_at = p.completed_chunks;
            sampler->set(NetworkSample{EffectiveType::g2, 8 * KiB, 1500ms, true});
            queue.refresh_network();
        }
    });

    auto id = queue.submit(MemoryPayload::filled("large.bin", 40 * MiB), {});
    REQUIRE(id);
    REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 1; }, 30s));
    REQUIRE(switched_at);

    auto changes = rec.of<NetworkChange>();
    REQUIRE(changes.size() == 1);
    CHECK(changes[0].metrics.effective_type == EffectiveType::g2);
    CHECK(changes[0].previous_type == EffectiveType::g4);

    std::uint64_t total = 0;
    for (const auto& chunk : transport.stats().received) {
        if (chunk.index < *switched_at) {
            CHECK(chunk.size == DEFAULT_CHUNK_SIZE);
        } else {
            CHECK(chunk.size <= SLOW_NETWORK_CHUNK_SIZE);
        }
        total += chunk.size;
    }
    CHECK(total == 40 * MiB);
    CHECK(queue.chunk_size() == SLOW_NETWORK_CHUNK_SIZE);
    CHECK(queue.config().max_concurrent_files == 1);
    CHECK(queue.config().max_concurrent_chunks == 1);
}

TEST_CASE("Coordinator starts conservatively on a slow network", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    auto sampler = std::make_shared<ManualSampler>(NetworkSample{EffectiveType::slow_2g, 4 * KiB, 2500ms, true});
    auto config = quiet_config();
    config.max_concurrent_files = 3;
    config.max_concurrent_chunks = 4;
    config.priority_mode = PriorityMode::fifo;

    QueueCoordinator queue(io.get_executor(), transport, config, fast_options(), sampler);

    CHECK(queue.config().max_concurrent_files == 1);
    CHECK(queue.config().max_concurrent_chunks == 1);
    CHECK(queue.config().priority_mode == PriorityMode::smallest_first);
    CHECK(queue.chunk_size() == SLOW_NETWORK_CHUNK_SIZE);
}

TEST_CASE("Coordinator configuration updates", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(5ms);
    auto config = quiet_config();
    config.max_concurrent_files = 1;
    QueueCoordinator queue(io.get_executor(), transport, config, fast_options());
    Recorder rec(queue);

    SECTION("Invalid patches are rejected whole") {
        QueueConfigPatch patch;
        patch.max_concurrent_chunks = 6;
        patch.max_concurrent_files = 0;
        CHECK(queue.update_config(patch) == UploadErrc::invalid_config);
        CHECK(queue.config().max_concurrent_chunks == 2);
    }

    SECTION("Raising the file limit promotes waiting tasks") {
        for (int i = 0; i < 3; ++i) {
            REQUIRE(queue.submit(MemoryPayload::filled("f" + std::to_string(i), 2 * MiB), {}));
        }
        REQUIRE(run_until(io, [&] { return rec.count<UploadStarted>() == 1; }));
        CHECK(queue.status().queued == 2);

        QueueConfigPatch patch;
        patch.max_concurrent_files = 3;
        patch.base_retry_delay = 2ms;
        CHECK_FALSE(queue.update_config(patch));
        CHECK(queue.retry_policy().base_delay() == 2ms);

        REQUIRE(run_until(io, [&] { return rec.count<UploadStarted>() == 3; }));
        CHECK(queue.status().queued == 0);
        REQUIRE(run_until(io, [&] { return rec.count<UploadCompleted>() == 3; }));
    }
}

TEST_CASE("Coordinator optimization cycle", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    auto config = quiet_config();
    config.adaptive_optimization = true;
    config.max_concurrent_files = 3;
    QueueCoordinator queue(io.get_executor(), transport, config, fast_options());
    Recorder rec(queue);

    SECTION("Publishes a performance update") {
        queue.optimize_now();
        auto updates = rec.of<PerformanceUpdate>();
        REQUIRE(updates.size() == 1);
        CHECK(updates[0].max_concurrent_files == 3);
        CHECK(updates[0].chunk_size == queue.chunk_size());
    }

    SECTION("Failures reduce file concurrency") {
        transport.fail_chunk(0, TransportError{make_error_code(UploadErrc::client_error), 400, "Bad", {}}, 100);
        for (int i = 0; i < 3; ++i) {
            REQUIRE(queue.submit(MemoryPayload::filled("bad" + std::to_string(i), 64 * KiB), {}));
        }
        REQUIRE(run_until(io, [&] { return queue.status().failed == 3; }));

        queue.optimize_now();
        CHECK(queue.config().max_concurrent_files == 2);
    }
}

TEST_CASE("Coordinator shutdown", "[queue]") {
    boost::asio::io_context io;
    MockTransport transport(io.get_executor());
    transport.latency(5ms);
    QueueCoordinator queue(io.get_executor(), transport, quiet_config(), fast_options());
    Recorder rec(queue);

    std::size_t cancelled = 0;
    auto sub = queue.subscribe(EventKind::upload_cancelled, [&](const Event&) { ++cancelled; });

    for (int i = 0; i < 4; ++i) {
        REQUIRE(queue.submit(MemoryPayload::filled("s" + std::to_string(i), 1 * MiB), {}));
    }
    REQUIRE(run_until(io, [&] { return rec.count<UploadStarted>() == 2; }));

    queue.shutdown();
    CHECK(queue.is_shut_down());
    CHECK(cancelled == 4);
    CHECK(queue.status().cancelled == 4);
    CHECK(queue.status().active == 0);
    CHECK(queue.status().queued == 0);

    auto late = queue.submit(MemoryPayload::filled("late", 1 * MiB), {});
    REQUIRE_FALSE(late);
    CHECK(late.error() == UploadErrc::shut_down);

    uplift::test::run_for(io, 30ms);
    CHECK(rec.count<UploadCompleted>() == 0);
    CHECK(transport.in_flight() == 0);
}
