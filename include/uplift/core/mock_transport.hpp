// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/transport.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace uplift::core {

// In-process object store with scripted failures.
// Single-threaded: all calls and completions happen on its executor.
class MockTransport final : public Transport {
public:
    struct ReceivedChunk {
        std::string upload_id;
        std::uint32_t index{0};
        std::uint64_t size{0};
    };

    struct Stats {
        std::uint32_t initiate_attempts{0};
        std::uint32_t chunk_attempts{0};
        std::uint32_t finalize_attempts{0};
        std::uint32_t max_in_flight{0};                          // Across all uploads
        std::map<std::string, std::uint32_t> max_in_flight_per_upload;
        std::map<std::uint32_t, std::uint32_t> attempts_per_index;
        std::vector<ReceivedChunk> received;                     // Successful chunk puts, in order
        std::vector<std::string> completed;                      // Finalized upload ids
        std::vector<std::string> aborted;
    };

    explicit MockTransport(boost::asio::any_io_executor executor);

    // Delay before every completion
    void latency(std::chrono::milliseconds delay) noexcept { latency_ = delay; }

    // Time a request waits before it is transmitted, as behind a busy worker pool
    void queue_delay(std::chrono::milliseconds delay) noexcept { queue_delay_ = delay; }

    // The next `count` attempts on chunk `index` fail with `error`
    void fail_chunk(std::uint32_t index, TransportError error, std::uint32_t count = 1);
    void fail_initiate(TransportError error, std::uint32_t count = 1);
    void fail_finalize(TransportError error, std::uint32_t count = 1);

    // Convenience for a retryable network failure
    [[nodiscard]] static TransportError network_error(std::string message = "connection reset");

    void initiate_multipart_upload(UploadMetadata metadata,
                                   std::stop_token stop,
                                   StartHandler started,
                                   InitiateHandler handler) override;

    void upload_chunk(std::string upload_id,
                      ChunkRequest request,
                      std::stop_token stop,
                      StartHandler started,
                      ChunkHandler handler) override;

    void complete_multipart_upload(std::string upload_id,
                                   std::vector<CompletedChunk> chunks,
                                   std::stop_token stop,
                                   StartHandler started,
                                   FinalizeHandler handler) override;

    void abort_multipart_upload(std::string upload_id,
                                AbortHandler handler) override;

    [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
    [[nodiscard]] std::uint32_t in_flight() const noexcept { return in_flight_; }
    [[nodiscard]] std::uint32_t attempts(std::uint32_t index) const noexcept;

    // Name the upload was opened for, empty when unknown
    [[nodiscard]] std::string upload_name(const std::string& upload_id) const;

private:
    struct Upload {
        UploadMetadata metadata;
        std::map<std::uint32_t, std::string> parts;   // Index -> etag of stored parts
    };

    struct Op;

    // Start after the queue delay, complete after the latency; `complete`
    // receives true when stopped first. `release` runs exactly once, as soon
    // as the op stops or completes.
    void schedule(std::stop_token stop,
                  StartHandler started,
                  std::function<void()> release,
                  std::function<void(bool stopped)> complete);
    void transmit(const std::shared_ptr<Op>& op);

    [[nodiscard]] static std::optional<TransportError> take_failure(std::deque<TransportError>& script);
    [[nodiscard]] static TransportError cancelled_error();

    boost::asio::any_io_executor executor_;
    std::chrono::milliseconds latency_{0};
    std::chrono::milliseconds queue_delay_{0};

    std::map<std::uint32_t, std::deque<TransportError>> chunk_failures_;
    std::deque<TransportError> initiate_failures_;
    std::deque<TransportError> finalize_failures_;

    std::map<std::string, Upload> uploads_;
    std::uint64_t next_upload_{1};
    std::uint32_t in_flight_{0};
    std::map<std::string, std::uint32_t> in_flight_per_upload_;
    Stats stats_;
};

} // namespace uplift::core
