// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/error.hpp>
#include <uplift/core/metrics.hpp>
#include <uplift/core/transport.hpp>
#include <uplift/core/types.hpp>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace uplift::core {

struct UploadQueued {
    TaskId task_id{0};
    std::string name;
    std::uint64_t size{0};
    std::int64_t priority{0};
    std::size_t queue_length{0};
};

struct UploadStarted {
    TaskId task_id{0};
    std::string name;
    std::uint64_t size{0};
};

struct UploadProgress {
    TaskId task_id{0};
    double percent{0.0};
    std::uint64_t speed_bps{0};           // Instantaneous
    std::uint64_t eta_seconds{0};
    std::uint64_t uploaded_bytes{0};
    std::uint64_t total_bytes{0};
    std::uint32_t completed_chunks{0};
    std::uint32_t total_chunks{0};
};

struct UploadCompleted {
    TaskId task_id{0};
    std::string name;
    std::uint64_t size{0};
    FinalizeResult result;
    std::chrono::milliseconds elapsed{0};
    std::uint32_t total_retries{0};
};

struct UploadError {
    TaskId task_id{0};
    TaskError error;
};

struct UploadPaused {
    TaskId task_id{0};
    bool offline{false};                  // Paused by the network monitor
};

struct UploadResumed {
    TaskId task_id{0};
    std::uint32_t resume_count{0};
};

struct UploadCancelled {
    TaskId task_id{0};
    bool was_active{false};
};

struct QueueEmpty {};

struct PerformanceUpdate {
    PerformanceMetrics metrics;
    std::uint32_t max_concurrent_files{0};
    std::uint32_t max_concurrent_chunks{0};
    std::uint64_t chunk_size{0};
};

struct NetworkChange {
    NetworkMetrics metrics;
    EffectiveType previous_type{EffectiveType::unknown};
};

// Closed event set; EventKind follows the variant's alternative order
using Event = std::variant<
    UploadQueued,
    UploadStarted,
    UploadProgress,
    UploadCompleted,
    UploadError,
    UploadPaused,
    UploadResumed,
    UploadCancelled,
    QueueEmpty,
    PerformanceUpdate,
    NetworkChange>;

enum class EventKind : std::uint8_t {
    upload_queued,
    upload_started,
    upload_progress,
    upload_completed,
    upload_error,
    upload_paused,
    upload_resumed,
    upload_cancelled,
    queue_empty,
    performance_update,
    network_change
};

static_assert(std::variant_size_v<Event> == static_cast<std::size_t>(EventKind::network_change) + 1);

[[nodiscard]] inline EventKind kind_of(const Event& event) noexcept {
    return static_cast<EventKind>(event.index());
}

[[nodiscard]] constexpr std::string_view to_string(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::upload_queued:      return "upload-queued";
        case EventKind::upload_started:     return "upload-started";
        case EventKind::upload_progress:    return "upload-progress";
        case EventKind::upload_completed:   return "upload-completed";
        case EventKind::upload_error:       return "upload-error";
        case EventKind::upload_paused:      return "upload-paused";
        case EventKind::upload_resumed:     return "upload-resumed";
        case EventKind::upload_cancelled:   return "upload-cancelled";
        case EventKind::queue_empty:        return "queue-empty";
        case EventKind::performance_update: return "performance-update";
        case EventKind::network_change:     return "network-change";
    }
    return "unknown";
}

} // namespace uplift::core
