// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/payload.hpp>
#include <uplift/core/queue_config.hpp>
#include <uplift/core/retry_policy.hpp>
#include <uplift/core/transport.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <chrono>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace uplift::core {

// A chunk whose byte range has been fixed
struct PlannedChunk {
    std::uint32_t index{0};
    std::uint64_t offset{0};
    std::uint64_t size{0};
    std::uint32_t retries{0};       // Retries spent on this chunk
};

// Drives bounded-concurrency chunk transfers for one multipart upload.
// Runs entirely on its executor; transport completions are re-posted there.
class ChunkScheduler : public std::enable_shared_from_this<ChunkScheduler> {
public:
    using Clock = std::chrono::steady_clock;

    struct Callbacks {
        // Chunk stored; elapsed is the transfer time of that chunk alone
        std::function<void(const CompletedChunk&, Clock::duration elapsed)> on_chunk;
        // Every byte of the payload is covered
        std::function<void()> on_complete;
        // A chunk failed for good; nothing else will be reported
        std::function<void(const TransportError&)> on_failure;
    };

    ChunkScheduler(boost::asio::any_io_executor executor,
                   Transport& transport,
                   PayloadHandle payload,
                   std::string upload_id,
                   std::shared_ptr<const QueueConfig> config,
                   std::shared_ptr<RetryPolicy> retry,
                   const EngineOptions& options,
                   std::uint64_t chunk_size,
                   Callbacks callbacks);

    ChunkScheduler(const ChunkScheduler&) = delete;
    ChunkScheduler& operator=(const ChunkScheduler&) = delete;

    // Begin dispatching
    void start() noexcept;

    // Abort in-flight transfers; their chunks are re-sent on resume
    void pause() noexcept;
    void resume() noexcept;

    // Stop everything; no callback fires afterwards
    void cancel() noexcept;

    // Applies to chunks planned from now on
    void chunk_size(std::uint64_t size) noexcept;
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }

    // Planned chunks plus the remainder at the current chunk size
    [[nodiscard]] std::uint32_t total_chunks() const noexcept;
    [[nodiscard]] std::uint32_t current_chunk_index() const noexcept { return static_cast<std::uint32_t>(planned_.size()); }
    [[nodiscard]] std::uint32_t completed_count() const noexcept { return static_cast<std::uint32_t>(completed_.size()); }
    [[nodiscard]] std::vector<CompletedChunk> completed_chunks() const;
    [[nodiscard]] std::uint64_t uploaded_bytes() const noexcept { return uploaded_bytes_; }
    [[nodiscard]] std::uint32_t in_flight() const noexcept { return static_cast<std::uint32_t>(in_flight_.size()); }
    [[nodiscard]] std::uint32_t max_chunk_retries() const noexcept { return max_chunk_retries_; }
    [[nodiscard]] std::uint32_t total_retries() const noexcept { return total_retries_; }
    [[nodiscard]] bool paused() const noexcept { return paused_; }
    [[nodiscard]] bool finished() const noexcept { return stopped_ || done_; }

private:
    struct InFlight {
        std::uint32_t index{0};
        std::stop_source stop;
        std::unique_ptr<boost::asio::steady_timer> deadline;   // Armed once transmitting
        Clock::time_point started;
    };

    struct Backoff {
        std::uint32_t index{0};
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    // Fill free slots from the ready queue, then from unplanned bytes
    void pump() noexcept;
    void dispatch(std::uint32_t index) noexcept;

    void on_chunk_result(std::uint64_t op_id, std::expected<ChunkReceipt, TransportError> result) noexcept;
    void on_started(std::uint64_t op_id, Clock::time_point at) noexcept;
    void on_timeout(std::uint64_t op_id) noexcept;
    void on_backoff(std::uint64_t op_id) noexcept;
    void handle_failure(std::uint32_t index, const TransportError& error) noexcept;
    void check_done() noexcept;

    // Stop in-flight ops and backoff timers; returns the chunk indices they held
    std::vector<std::uint32_t> halt_all() noexcept;

    [[nodiscard]] bool has_unplanned() const noexcept { return next_offset_ < payload_->size(); }

    boost::asio::any_io_executor executor_;
    Transport& transport_;
    PayloadHandle payload_;
    std::string upload_id_;
    std::shared_ptr<const QueueConfig> config_;
    std::shared_ptr<RetryPolicy> retry_;
    EngineOptions options_;
    Callbacks callbacks_;

    std::uint64_t chunk_size_;
    std::uint64_t next_offset_{0};
    std::vector<PlannedChunk> planned_;
    std::deque<std::uint32_t> ready_;                               // Planned, waiting for a slot
    std::map<std::uint64_t, InFlight> in_flight_;                   // By operation id
    std::map<std::uint64_t, Backoff> backoff_;                      // By operation id
    std::map<std::uint32_t, CompletedChunk> completed_;             // By chunk index
    std::uint64_t next_op_{1};

    std::uint64_t uploaded_bytes_{0};
    std::uint32_t max_chunk_retries_{0};
    std::uint32_t total_retries_{0};

    bool started_{false};
    bool paused_{false};
    bool stopped_{false};
    bool done_{false};
};

} // namespace uplift::core
