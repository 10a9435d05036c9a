// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/chunk_scheduler.hpp>
#include <uplift/core/error.hpp>
#include <uplift/core/events.hpp>
#include <uplift/core/payload.hpp>
#include <uplift/core/queue_config.hpp>
#include <uplift/core/retry_policy.hpp>
#include <uplift/core/transport.hpp>
#include <uplift/core/types.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace uplift::core {

// Optional per-task observers supplied at submission
struct TaskCallbacks {
    std::function<void(const UploadProgress&)> on_progress;
    std::function<void(const UploadCompleted&)> on_complete;
    std::function<void(const UploadError&)> on_error;
};

// Point-in-time view of an active upload
struct UploadSnapshot {
    TaskId task_id{0};
    std::string name;
    std::uint64_t size{0};
    SessionContext session;
    std::string remote_upload_id;
    std::uint32_t total_chunks{0};
    std::vector<CompletedChunk> completed_chunks;   // Sorted by index
    std::uint32_t current_chunk_index{0};           // Next chunk to plan
    std::uint32_t in_flight{0};
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_progress_time;
    std::uint64_t uploaded_bytes{0};
    TaskStatus status{TaskStatus::initializing};
    std::optional<TaskError> error;
    std::optional<std::chrono::steady_clock::time_point> paused_at;
    std::uint32_t resume_count{0};
    std::uint64_t chunk_size{0};
    std::uint32_t retry_count{0};                   // Most retries spent by one operation
    std::uint32_t total_retries{0};
};

// Valid status transitions of the task state machine
[[nodiscard]] bool can_transition(TaskStatus from, TaskStatus to) noexcept;

// Lifecycle of one file: initiate, chunk transfer, finalize.
// Runs on a single executor; the coordinator owns it while it is active.
class UploadTask : public std::enable_shared_from_this<UploadTask> {
public:
    using Clock = std::chrono::steady_clock;

    // Wiring back to the coordinator
    struct Hooks {
        std::function<void(const Event&)> emit;
        std::function<void(TaskId, TaskStatus)> on_finished;
        std::function<void(std::uint64_t bytes, Clock::duration elapsed)> on_chunk_transferred;
    };

    struct Context {
        boost::asio::any_io_executor executor;
        Transport* transport{nullptr};
        std::shared_ptr<const QueueConfig> config;
        std::shared_ptr<RetryPolicy> retry;
        EngineOptions options;
    };

    UploadTask(TaskId id, PayloadHandle payload, SessionContext session,
               std::uint64_t chunk_size, Context context,
               Hooks hooks, TaskCallbacks callbacks = {});

    UploadTask(const UploadTask&) = delete;
    UploadTask& operator=(const UploadTask&) = delete;

    // Request a multipart upload id and start transferring
    void start() noexcept;

    // uploading -> paused; in-flight chunks are aborted and requeued
    [[nodiscard]] std::error_code pause(bool offline = false) noexcept;

    // paused -> uploading
    [[nodiscard]] std::error_code resume() noexcept;

    // Any non-terminal state -> cancelled; aborts the remote upload
    [[nodiscard]] std::error_code cancel() noexcept;

    // New size applies to chunks planned from now on
    void chunk_size(std::uint64_t size) noexcept;
    [[nodiscard]] std::uint64_t chunk_size() const noexcept;

    [[nodiscard]] TaskId id() const noexcept { return id_; }
    [[nodiscard]] TaskStatus status() const noexcept { return status_; }
    [[nodiscard]] const PayloadHandle& payload() const noexcept { return payload_; }
    [[nodiscard]] std::uint32_t retry_count() const noexcept;
    [[nodiscard]] std::uint64_t uploaded_bytes() const noexcept;

    [[nodiscard]] UploadSnapshot snapshot() const;

private:
    void initiate() noexcept;
    void on_initiated(std::expected<std::string, TransportError> result) noexcept;
    [[nodiscard]] bool adopt(std::uint64_t attempt_id) const noexcept;
    void on_op_failed(const TransportError& error) noexcept;
    void begin_transfer() noexcept;

    void on_chunk(const CompletedChunk& chunk, Clock::duration elapsed) noexcept;
    void on_chunks_complete() noexcept;

    void finalize() noexcept;
    void on_finalized(std::expected<FinalizeResult, TransportError> result) noexcept;

    // Schedule op after a backoff delay unless the task stops first
    void retry_after(std::chrono::milliseconds delay, void (UploadTask::*op)()) noexcept;

    // Deadline for an initiate/finalize attempt, armed once the request is transmitted
    [[nodiscard]] StartHandler deadline_on_start(std::chrono::milliseconds timeout, std::uint64_t attempt_id);
    void arm_deadline(std::chrono::milliseconds timeout, std::uint64_t attempt_id) noexcept;
    void on_deadline(std::uint64_t attempt_id) noexcept;

    void fail(ErrorKind kind, const TransportError& error) noexcept;
    void finish(TaskStatus terminal) noexcept;
    [[nodiscard]] bool transition(TaskStatus to) noexcept;
    void abort_remote() noexcept;

    void emit(const Event& event) noexcept;

    TaskId id_;
    PayloadHandle payload_;
    SessionContext session_;
    Context ctx_;
    Hooks hooks_;
    TaskCallbacks callbacks_;

    TaskStatus status_{TaskStatus::initializing};
    std::optional<TaskError> error_;
    std::string upload_id_;
    std::uint64_t chunk_size_;
    std::shared_ptr<ChunkScheduler> scheduler_;

    // Cancels the whole task; each remote op also gets its own source
    std::stop_source stop_;
    std::stop_source op_stop_;
    std::unique_ptr<boost::asio::steady_timer> deadline_;
    std::unique_ptr<boost::asio::steady_timer> backoff_;
    std::uint64_t attempt_id_{0};
    std::uint32_t op_retries_{0};       // Retries of the current initiate/finalize
    std::uint32_t max_op_retries_{0};
    std::uint32_t total_op_retries_{0};

    Clock::time_point start_time_;
    Clock::time_point last_progress_time_;
    std::uint64_t last_progress_bytes_{0};
    std::uint64_t last_speed_{0};
    std::optional<Clock::time_point> paused_at_;
    std::uint32_t resume_count_{0};
};

} // namespace uplift::core
