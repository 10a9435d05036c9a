// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/event_bus.hpp>
#include <uplift/core/network_monitor.hpp>
#include <uplift/core/payload.hpp>
#include <uplift/core/performance_optimizer.hpp>
#include <uplift/core/queue_config.hpp>
#include <uplift/core/retry_policy.hpp>
#include <uplift/core/transport.hpp>
#include <uplift/core/types.hpp>
#include <uplift/core/upload_task.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <chrono>
#include <compare>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <system_error>
#include <vector>

namespace uplift::core {

struct SubmitOptions {
    std::optional<std::int64_t> priority;   // Lower is more urgent; derived from priority_mode when unset
    TaskCallbacks callbacks;
};

// Snapshot returned by QueueCoordinator::status()
struct QueueStatus {
    std::size_t queued{0};
    std::size_t active{0};
    std::size_t paused{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::uint64_t chunk_size{0};
    QueueConfig config;
    NetworkMetrics network;
    PerformanceMetrics performance;
};

// Sole entry point for callers: owns the pending queue and the active set.
// Construct it at the composition root; every call must happen on its executor.
// The transport must outlive the coordinator.
class QueueCoordinator {
public:
    QueueCoordinator(boost::asio::any_io_executor executor,
                     Transport& transport,
                     QueueConfig config = {},
                     EngineOptions options = {},
                     std::shared_ptr<NetworkSampler> platform_sampler = nullptr);
    ~QueueCoordinator();

    QueueCoordinator(const QueueCoordinator&) = delete;
    QueueCoordinator& operator=(const QueueCoordinator&) = delete;

    // Queue a payload; fails with validation_failed for null or empty payloads
    [[nodiscard]] std::expected<TaskId, std::error_code>
    submit(PayloadHandle payload, SessionContext session, SubmitOptions options = {}) noexcept;

    [[nodiscard]] std::error_code cancel(TaskId id) noexcept;
    [[nodiscard]] std::error_code pause(TaskId id) noexcept;
    [[nodiscard]] std::error_code resume(TaskId id) noexcept;

    void pause_all() noexcept;
    void resume_all() noexcept;

    [[nodiscard]] QueueStatus status() const;

    // Progress of an active task
    [[nodiscard]] std::optional<UploadSnapshot> task(TaskId id) const;

    // Validate, merge and trigger a promotion pass
    [[nodiscard]] std::error_code update_config(const QueueConfigPatch& patch) noexcept;
    [[nodiscard]] const QueueConfig& config() const noexcept { return *config_; }
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

    // Chunk size given to newly started tasks
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

    Subscription subscribe(EventKind kind, EventHandler handler);
    Subscription subscribe_all(EventHandler handler);

    [[nodiscard]] NetworkMonitor& network_monitor() noexcept { return network_; }
    [[nodiscard]] const PerformanceOptimizer& optimizer() const noexcept { return optimizer_; }
    [[nodiscard]] RetryPolicy& retry_policy() noexcept { return *retry_; }

    // Sample the network now instead of waiting for the poll timer
    void refresh_network() noexcept;

    // Run one optimization cycle now
    void optimize_now() noexcept;

    // Cancel every task and timer and drop all subscribers
    void shutdown() noexcept;
    [[nodiscard]] bool is_shut_down() const noexcept { return shut_down_; }

private:
    struct QueueKey {
        std::int64_t priority{0};
        std::chrono::steady_clock::time_point enqueue_time;
        std::uint64_t sequence{0};

        auto operator<=>(const QueueKey&) const = default;
    };

    struct QueuedTask {
        TaskId id{0};
        PayloadHandle payload;
        SessionContext session;
        TaskCallbacks callbacks;
    };

    [[nodiscard]] std::int64_t calculate_priority(const Payload& payload) const noexcept;

    // Post a single promotion pass; bursts of triggers coalesce
    void schedule_promotion() noexcept;
    void promote() noexcept;

    void on_task_finished(TaskId id, TaskStatus status) noexcept;
    void on_chunk_transferred(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) noexcept;
    void on_network_change(const NetworkMetrics& metrics, EffectiveType previous) noexcept;

    void apply_chunk_size(std::uint64_t size) noexcept;
    void detect_initial_capabilities() noexcept;
    void maybe_announce_empty() noexcept;

    void arm_optimize_timer() noexcept;
    void arm_network_timer() noexcept;

    [[nodiscard]] std::map<QueueKey, QueuedTask>::iterator find_pending(TaskId id) noexcept;

    // Copy of the active set, safe against removal while iterating
    [[nodiscard]] std::vector<std::shared_ptr<UploadTask>> active_tasks() const;

    boost::asio::any_io_executor executor_;
    Transport& transport_;
    EngineOptions options_;
    std::shared_ptr<QueueConfig> config_;
    std::shared_ptr<RetryPolicy> retry_;

    EventBus bus_;
    NetworkMonitor network_;
    PerformanceOptimizer optimizer_;

    std::map<QueueKey, QueuedTask> pending_;
    std::map<TaskId, std::shared_ptr<UploadTask>> active_;
    std::set<TaskId> offline_paused_;

    TaskId next_id_{1};
    std::uint64_t next_sequence_{0};
    std::uint64_t chunk_size_;
    std::size_t completed_{0};
    std::size_t failed_{0};
    std::size_t cancelled_{0};

    bool online_{true};
    bool promotion_pending_{false};
    bool shut_down_{false};

    boost::asio::steady_timer optimize_timer_;
    boost::asio::steady_timer network_timer_;

    // Posted work checks this before touching the coordinator
    std::shared_ptr<bool> alive_;
};

} // namespace uplift::core
