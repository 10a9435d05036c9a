// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/mock_transport.hpp>
#include <uplift/core/error.hpp>
#include <uplift/log.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace uplift::core {

struct MockTransport::Op {
    explicit Op(const boost::asio::any_io_executor& executor) : timer(executor) {}

    void run_release() {
        if (release) {
            auto fn = std::move(release);
            release = nullptr;
            fn();
        }
    }

    void finish() {
        on_stop.reset();
        run_release();
        auto fn = std::move(complete);
        fn(stopped);
    }

    boost::asio::steady_timer timer;
    std::optional<std::stop_callback<std::function<void()>>> on_stop;
    StartHandler started;
    std::function<void()> release;
    std::function<void(bool)> complete;
    bool stopped{false};
};

MockTransport::MockTransport(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)) {
}

//=============================================================================
// Failure scripts
//=============================================================================

void MockTransport::fail_chunk(std::uint32_t index, TransportError error, std::uint32_t count) {
    auto& script = chunk_failures_[index];
    for (std::uint32_t i = 0; i < count; ++i) script.push_back(error);
}

void MockTransport::fail_initiate(TransportError error, std::uint32_t count) {
    for (std::uint32_t i = 0; i < count; ++i) initiate_failures_.push_back(error);
}

void MockTransport::fail_finalize(TransportError error, std::uint32_t count) {
    for (std::uint32_t i = 0; i < count; ++i) finalize_failures_.push_back(error);
}

TransportError MockTransport::network_error(std::string message) {
    return TransportError{make_error_code(UploadErrc::connection_lost), 0, std::move(message), std::nullopt};
}

TransportError MockTransport::cancelled_error() {
    return TransportError{make_error_code(UploadErrc::cancelled), 0, "Request cancelled", std::nullopt};
}

std::optional<TransportError> MockTransport::take_failure(std::deque<TransportError>& script) {
    if (script.empty()) return std::nullopt;
    auto error = std::move(script.front());
    script.pop_front();
    return error;
}

//=============================================================================
// Scheduling
//=============================================================================

void MockTransport::schedule(std::stop_token stop,
                             StartHandler started,
                             std::function<void()> release,
                             std::function<void(bool)> complete) {
    auto op = std::make_shared<Op>(executor_);
    op->started = std::move(started);
    op->release = std::move(release);
    op->complete = std::move(complete);

    Op* raw = op.get();
    if (stop.stop_requested()) {
        raw->stopped = true;
        raw->run_release();
    } else {
        op->on_stop.emplace(stop, std::function<void()>([raw] {
            raw->stopped = true;
            raw->run_release();
            raw->timer.cancel();
        }));
    }

    if (queue_delay_.count() > 0 && !raw->stopped) {
        op->timer.expires_after(queue_delay_);
        op->timer.async_wait([this, op](const boost::system::error_code&) {
            if (op->stopped) {
                op->finish();
                return;
            }
            transmit(op);
        });
        return;
    }
    transmit(op);
}

void MockTransport::transmit(const std::shared_ptr<Op>& op) {
    if (!op->stopped && op->started) {
        auto started = std::move(op->started);
        op->started = nullptr;
        started();
    }

    op->timer.expires_after(latency_);
    op->timer.async_wait([op](const boost::system::error_code&) {
        op->finish();
    });
}

//=============================================================================
// Transport
//=============================================================================

void MockTransport::initiate_multipart_upload(UploadMetadata metadata,
                                              std::stop_token stop,
                                              StartHandler started,
                                              InitiateHandler handler) {
    ++stats_.initiate_attempts;
    schedule(std::move(stop), std::move(started), nullptr,
        [this, metadata = std::move(metadata), handler = std::move(handler)](bool stopped) mutable {
            if (stopped) {
                handler(std::unexpected(cancelled_error()));
                return;
            }
            if (auto failure = take_failure(initiate_failures_)) {
                handler(std::unexpected(std::move(*failure)));
                return;
            }
            auto id = fmt::format("mock-{}", next_upload_++);
            uploads_[id] = Upload{std::move(metadata), {}};
            log::get()->trace("Mock: opened {}", id);
            handler(id);
        });
}

void MockTransport::upload_chunk(std::string upload_id,
                                 ChunkRequest request,
                                 std::stop_token stop,
                                 StartHandler started,
                                 ChunkHandler handler) {
    ++stats_.chunk_attempts;
    ++stats_.attempts_per_index[request.index];

    ++in_flight_;
    auto& per_upload = in_flight_per_upload_[upload_id];
    ++per_upload;
    stats_.max_in_flight = std::max(stats_.max_in_flight, in_flight_);
    auto& peak = stats_.max_in_flight_per_upload[upload_id];
    peak = std::max(peak, per_upload);

    auto release = [this, upload_id] {
        --in_flight_;
        --in_flight_per_upload_[upload_id];
    };

    schedule(std::move(stop), std::move(started), std::move(release),
        [this, upload_id, index = request.index, size = request.bytes.size(),
         handler = std::move(handler)](bool stopped) mutable {
            if (stopped) {
                handler(std::unexpected(cancelled_error()));
                return;
            }
            if (auto it = chunk_failures_.find(index); it != chunk_failures_.end()) {
                if (auto failure = take_failure(it->second)) {
                    handler(std::unexpected(std::move(*failure)));
                    return;
                }
            }
            auto upload = uploads_.find(upload_id);
            if (upload == uploads_.end()) {
                handler(std::unexpected(TransportError{
                    make_error_code(UploadErrc::not_found), 404,
                    fmt::format("No such upload: {}", upload_id), std::nullopt}));
                return;
            }
            auto etag = fmt::format("etag-{}-{}", upload_id, index);
            upload->second.parts[index] = etag;
            stats_.received.push_back(ReceivedChunk{upload_id, index, size});
            handler(ChunkReceipt{std::move(etag), size});
        });
}

void MockTransport::complete_multipart_upload(std::string upload_id,
                                              std::vector<CompletedChunk> chunks,
                                              std::stop_token stop,
                                              StartHandler started,
                                              FinalizeHandler handler) {
    ++stats_.finalize_attempts;
    schedule(std::move(stop), std::move(started), nullptr,
        [this, upload_id = std::move(upload_id), chunks = std::move(chunks),
         handler = std::move(handler)](bool stopped) mutable {
            if (stopped) {
                handler(std::unexpected(cancelled_error()));
                return;
            }
            if (auto failure = take_failure(finalize_failures_)) {
                handler(std::unexpected(std::move(*failure)));
                return;
            }
            auto upload = uploads_.find(upload_id);
            if (upload == uploads_.end()) {
                handler(std::unexpected(TransportError{
                    make_error_code(UploadErrc::not_found), 404,
                    fmt::format("No such upload: {}", upload_id), std::nullopt}));
                return;
            }

            // Parts must be contiguous from zero and match what was stored
            for (std::size_t i = 0; i < chunks.size(); ++i) {
                const auto& part = chunks[i];
                auto stored = upload->second.parts.find(part.index);
                if (part.index != i || part.etag.empty() ||
                    stored == upload->second.parts.end() || stored->second != part.etag) {
                    handler(std::unexpected(TransportError{
                        make_error_code(UploadErrc::client_error), 400,
                        fmt::format("Invalid part list at part {}", i + 1), std::nullopt}));
                    return;
                }
            }

            const auto& meta = upload->second.metadata;
            FinalizeResult result{
                fmt::format("mock://bucket/{}", meta.name),
                meta.session.session_id.empty()
                    ? meta.name
                    : fmt::format("{}/{}", meta.session.session_id, meta.name)};
            stats_.completed.push_back(upload_id);
            handler(std::move(result));
        });
}

void MockTransport::abort_multipart_upload(std::string upload_id, AbortHandler handler) {
    stats_.aborted.push_back(upload_id);
    uploads_.erase(upload_id);
    schedule(std::stop_token{}, nullptr, nullptr, [handler = std::move(handler)](bool) mutable {
        handler({});
    });
}

//=============================================================================
// Inspection
//=============================================================================

std::uint32_t MockTransport::attempts(std::uint32_t index) const noexcept {
    auto it = stats_.attempts_per_index.find(index);
    return it == stats_.attempts_per_index.end() ? 0 : it->second;
}

std::string MockTransport::upload_name(const std::string& upload_id) const {
    auto it = uploads_.find(upload_id);
    return it == uploads_.end() ? std::string{} : it->second.metadata.name;
}

} // namespace uplift::core
