// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/chunk_scheduler.hpp>
#include <uplift/core/error.hpp>
#include <uplift/log.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>

namespace uplift::core {

ChunkScheduler::ChunkScheduler(boost::asio::any_io_executor executor,
                               Transport& transport,
                               PayloadHandle payload,
                               std::string upload_id,
                               std::shared_ptr<const QueueConfig> config,
                               std::shared_ptr<RetryPolicy> retry,
                               const EngineOptions& options,
                               std::uint64_t chunk_size,
                               Callbacks callbacks)
    : executor_(std::move(executor))
    , transport_(transport)
    , payload_(std::move(payload))
    , upload_id_(std::move(upload_id))
    , config_(std::move(config))
    , retry_(std::move(retry))
    , options_(options)
    , callbacks_(std::move(callbacks))
    , chunk_size_(clamp_chunk_size(chunk_size, options)) {
}

//=============================================================================
// Control
//=============================================================================

void ChunkScheduler::start() noexcept {
    if (started_ || stopped_) return;
    started_ = true;
    log::get()->trace("Upload {}: starting with {} byte chunks", upload_id_, chunk_size_);
    pump();
}

void ChunkScheduler::pause() noexcept {
    if (stopped_ || done_ || paused_) return;
    paused_ = true;

    // Aborted transfers go back to the ready queue with their retry budget intact
    auto held = halt_all();
    ready_.insert(ready_.end(), held.begin(), held.end());
    std::sort(ready_.begin(), ready_.end());
    log::get()->debug("Upload {}: paused, {} chunks requeued", upload_id_, held.size());
}

void ChunkScheduler::resume() noexcept {
    if (!paused_ || stopped_) return;
    paused_ = false;
    check_done();
    pump();
}

void ChunkScheduler::cancel() noexcept {
    if (stopped_) return;
    stopped_ = true;
    (void)halt_all();
    ready_.clear();
}

void ChunkScheduler::chunk_size(std::uint64_t size) noexcept {
    chunk_size_ = clamp_chunk_size(size, options_);
}

std::uint32_t ChunkScheduler::total_chunks() const noexcept {
    const std::uint64_t remaining = payload_->size() - next_offset_;
    const std::uint64_t pending = (remaining + chunk_size_ - 1) / chunk_size_;
    return static_cast<std::uint32_t>(planned_.size() + pending);
}

std::vector<CompletedChunk> ChunkScheduler::completed_chunks() const {
    std::vector<CompletedChunk> out;
    out.reserve(completed_.size());
    for (const auto& [index, chunk] : completed_) {
        out.push_back(chunk);
    }
    return out;
}

//=============================================================================
// Dispatch
//=============================================================================

void ChunkScheduler::pump() noexcept {
    if (!started_ || paused_ || stopped_ || done_) return;

    // Read live so config changes apply to the next decision
    const std::uint32_t limit = std::max<std::uint32_t>(1, config_->max_concurrent_chunks);

    while (!stopped_ && !paused_ && in_flight_.size() < limit) {
        if (!ready_.empty()) {
            const auto index = ready_.front();
            ready_.pop_front();
            dispatch(index);
            continue;
        }
        if (has_unplanned()) {
            PlannedChunk chunk;
            chunk.index = static_cast<std::uint32_t>(planned_.size());
            chunk.offset = next_offset_;
            chunk.size = std::min(chunk_size_, payload_->size() - next_offset_);
            next_offset_ += chunk.size;
            planned_.push_back(chunk);
            dispatch(chunk.index);
            continue;
        }
        break;
    }
}

void ChunkScheduler::dispatch(std::uint32_t index) noexcept {
    const PlannedChunk chunk = planned_[index];

    auto bytes = payload_->read(chunk.offset, static_cast<std::size_t>(chunk.size));
    if (!bytes) {
        handle_failure(index, TransportError{bytes.error(), 0,
                                             "Failed to read chunk: " + bytes.error().message(), {}});
        return;
    }

    const auto op_id = next_op_++;
    std::weak_ptr<ChunkScheduler> weak = weak_from_this();

    InFlight op;
    op.index = index;
    op.started = Clock::now();
    auto token = op.stop.get_token();
    in_flight_.emplace(op_id, std::move(op));

    log::get()->trace("Upload {}: chunk {} [{}, +{}) dispatched", upload_id_, index, chunk.offset, chunk.size);

    // The deadline and the speed clock run from transmission, not from the
    // transport's own queue
    auto started = [weak, op_id, exec = executor_]() {
        const auto at = Clock::now();
        boost::asio::post(exec, [weak, op_id, at]() {
            if (auto self = weak.lock()) {
                self->on_started(op_id, at);
            }
        });
    };

    transport_.upload_chunk(upload_id_, ChunkRequest{index, chunk.offset, std::move(*bytes)}, token,
        std::move(started),
        [weak, op_id, exec = executor_](std::expected<ChunkReceipt, TransportError> result) {
            boost::asio::post(exec, [weak, op_id, result = std::move(result)]() mutable {
                if (auto self = weak.lock()) {
                    self->on_chunk_result(op_id, std::move(result));
                }
            });
        });
}

void ChunkScheduler::on_started(std::uint64_t op_id, Clock::time_point at) noexcept {
    auto it = in_flight_.find(op_id);
    if (it == in_flight_.end() || stopped_) return;

    auto& op = it->second;
    if (op.deadline) return;
    op.started = at;

    const auto remaining = options_.chunk_timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - at);
    std::weak_ptr<ChunkScheduler> weak = weak_from_this();
    op.deadline = std::make_unique<boost::asio::steady_timer>(
        executor_, std::max(remaining, std::chrono::milliseconds::zero()));
    op.deadline->async_wait([weak, op_id](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->on_timeout(op_id);
        }
    });
}

//=============================================================================
// Completions
//=============================================================================

void ChunkScheduler::on_chunk_result(std::uint64_t op_id,
                                     std::expected<ChunkReceipt, TransportError> result) noexcept {
    auto it = in_flight_.find(op_id);
    if (it == in_flight_.end()) return;  // Timed out, paused or cancelled earlier

    InFlight op = std::move(it->second);
    in_flight_.erase(it);
    if (op.deadline) op.deadline->cancel();
    if (stopped_) return;

    auto self = shared_from_this();

    if (result && result->etag.empty()) {
        result = std::unexpected(TransportError{make_error_code(UploadErrc::missing_etag), 0,
                                                "No ETag for chunk " + std::to_string(op.index), {}});
    }

    if (!result) {
        handle_failure(op.index, result.error());
        pump();
        return;
    }

    const auto& chunk = planned_[op.index];
    if (result->size != 0 && result->size != chunk.size) {
        log::get()->warn("Upload {}: chunk {} acknowledged {} bytes, sent {}",
                         upload_id_, op.index, result->size, chunk.size);
    }

    CompletedChunk done{op.index, std::move(result->etag), chunk.size};
    auto [pos, inserted] = completed_.emplace(op.index, done);
    if (!inserted) {
        log::get()->warn("Upload {}: duplicate completion for chunk {}", upload_id_, op.index);
        pump();
        return;
    }
    uploaded_bytes_ += done.size;

    if (callbacks_.on_chunk) {
        callbacks_.on_chunk(pos->second, Clock::now() - op.started);
    }
    if (stopped_) return;

    check_done();
    pump();
}

void ChunkScheduler::on_timeout(std::uint64_t op_id) noexcept {
    auto it = in_flight_.find(op_id);
    if (it == in_flight_.end()) return;

    InFlight op = std::move(it->second);
    in_flight_.erase(it);
    op.stop.request_stop();
    if (stopped_) return;

    auto self = shared_from_this();
    handle_failure(op.index, TransportError{make_error_code(UploadErrc::timeout), 0,
                                            "Chunk " + std::to_string(op.index) + " timed out", {}});
    pump();
}

void ChunkScheduler::on_backoff(std::uint64_t op_id) noexcept {
    auto it = backoff_.find(op_id);
    if (it == backoff_.end()) return;

    const auto index = it->second.index;
    backoff_.erase(it);
    if (stopped_) return;

    ready_.push_front(index);
    pump();
}

void ChunkScheduler::handle_failure(std::uint32_t index, const TransportError& error) noexcept {
    const auto retries = planned_[index].retries;

    if (!RetryPolicy::should_retry(error.code, retries, config_->retry_attempts)) {
        log::get()->error("Upload {}: chunk {} failed after {} retries: {}",
                          upload_id_, index, retries, error.message);
        stopped_ = true;
        (void)halt_all();
        ready_.clear();
        if (callbacks_.on_failure) {
            callbacks_.on_failure(error);
        }
        return;
    }

    const auto attempt = ++planned_[index].retries;
    ++total_retries_;
    max_chunk_retries_ = std::max(max_chunk_retries_, attempt);

    const auto delay = retry_->next_delay(attempt, error);
    log::get()->warn("Upload {}: chunk {} failed ({}), retry {} in {} ms",
                     upload_id_, index, error.message, attempt, delay.count());

    if (paused_) {
        ready_.push_front(index);
        return;
    }

    const auto op_id = next_op_++;
    std::weak_ptr<ChunkScheduler> weak = weak_from_this();
    Backoff backoff{index, std::make_unique<boost::asio::steady_timer>(executor_, delay)};
    backoff.timer->async_wait([weak, op_id](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->on_backoff(op_id);
        }
    });
    backoff_.emplace(op_id, std::move(backoff));
}

void ChunkScheduler::check_done() noexcept {
    if (done_ || stopped_ || paused_) return;
    if (has_unplanned() || !ready_.empty() || !in_flight_.empty() || !backoff_.empty()) return;
    if (completed_.size() != planned_.size()) return;

    done_ = true;
    log::get()->debug("Upload {}: all {} chunks stored", upload_id_, planned_.size());
    if (callbacks_.on_complete) {
        callbacks_.on_complete();
    }
}

std::vector<std::uint32_t> ChunkScheduler::halt_all() noexcept {
    std::vector<std::uint32_t> held;
    held.reserve(in_flight_.size() + backoff_.size());

    for (auto& [id, op] : in_flight_) {
        op.stop.request_stop();
        if (op.deadline) op.deadline->cancel();
        held.push_back(op.index);
    }
    in_flight_.clear();

    for (auto& [id, backoff] : backoff_) {
        backoff.timer->cancel();
        held.push_back(backoff.index);
    }
    backoff_.clear();
    return held;
}

} // namespace uplift::core
