// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/upload_task.hpp>
#include <uplift/log.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <exception>

namespace uplift::core {

namespace {

template<typename Callback, typename Arg>
void invoke_callback(const Callback& cb, const Arg& arg, TaskId id) noexcept {
    if (!cb) return;
    try {
        cb(arg);
    } catch (const std::exception& e) {
        log::get()->error("Task {}: callback threw: {}", id, e.what());
    }
}

// Remote upload ids nobody adopted still hold server-side state
void discard_upload(Transport& transport, const std::string& upload_id) {
    log::get()->debug("Discarding unadopted upload {}", upload_id);
    transport.abort_multipart_upload(upload_id, [upload_id](std::expected<void, TransportError> result) {
        if (!result) {
            log::get()->warn("Abort of upload {} failed: {}", upload_id, result.error().message);
        }
    });
}

} // namespace

bool can_transition(TaskStatus from, TaskStatus to) noexcept {
    switch (from) {
        case TaskStatus::initializing:
            return to == TaskStatus::uploading || to == TaskStatus::cancelled || to == TaskStatus::error;
        case TaskStatus::uploading:
            return to == TaskStatus::paused || to == TaskStatus::completing ||
                   to == TaskStatus::cancelled || to == TaskStatus::error;
        case TaskStatus::paused:
            return to == TaskStatus::uploading || to == TaskStatus::cancelled || to == TaskStatus::error;
        case TaskStatus::completing:
            return to == TaskStatus::completed || to == TaskStatus::cancelled || to == TaskStatus::error;
        case TaskStatus::completed:
        case TaskStatus::error:
        case TaskStatus::cancelled:
            break;
    }
    return false;
}

UploadTask::UploadTask(TaskId id, PayloadHandle payload, SessionContext session,
                       std::uint64_t chunk_size, Context context,
                       Hooks hooks, TaskCallbacks callbacks)
    : id_(id)
    , payload_(std::move(payload))
    , session_(std::move(session))
    , ctx_(std::move(context))
    , hooks_(std::move(hooks))
    , callbacks_(std::move(callbacks))
    , chunk_size_(clamp_chunk_size(chunk_size, ctx_.options)) {
    start_time_ = Clock::now();
    last_progress_time_ = start_time_;
}

//=============================================================================
// Public control
//=============================================================================

void UploadTask::start() noexcept {
    if (status_ != TaskStatus::initializing || attempt_id_ != 0) return;
    start_time_ = Clock::now();
    last_progress_time_ = start_time_;
    log::get()->info("Task {}: starting upload of '{}' ({} bytes)", id_, payload_->name(), payload_->size());
    initiate();
}

std::error_code UploadTask::pause(bool offline) noexcept {
    if (status_ != TaskStatus::uploading) {
        return make_error_code(UploadErrc::invalid_state);
    }
    (void)transition(TaskStatus::paused);
    paused_at_ = Clock::now();
    scheduler_->pause();
    emit(UploadPaused{id_, offline});
    return {};
}

std::error_code UploadTask::resume() noexcept {
    if (status_ != TaskStatus::paused) {
        return make_error_code(UploadErrc::invalid_state);
    }
    (void)transition(TaskStatus::uploading);
    paused_at_.reset();
    ++resume_count_;

    // Time spent paused does not count towards speed
    last_progress_time_ = Clock::now();
    last_progress_bytes_ = scheduler_->uploaded_bytes();

    emit(UploadResumed{id_, resume_count_});
    scheduler_->resume();
    return {};
}

std::error_code UploadTask::cancel() noexcept {
    if (is_terminal(status_)) {
        return make_error_code(UploadErrc::invalid_state);
    }
    auto self = shared_from_this();

    (void)transition(TaskStatus::cancelled);
    stop_.request_stop();
    op_stop_.request_stop();
    if (deadline_) deadline_->cancel();
    if (backoff_) backoff_->cancel();
    if (scheduler_) scheduler_->cancel();
    abort_remote();

    log::get()->info("Task {}: cancelled", id_);
    emit(UploadCancelled{id_, true});
    finish(TaskStatus::cancelled);
    return {};
}

void UploadTask::chunk_size(std::uint64_t size) noexcept {
    chunk_size_ = clamp_chunk_size(size, ctx_.options);
    if (scheduler_) {
        scheduler_->chunk_size(chunk_size_);
    }
}

std::uint64_t UploadTask::chunk_size() const noexcept {
    return scheduler_ ? scheduler_->chunk_size() : chunk_size_;
}

std::uint32_t UploadTask::retry_count() const noexcept {
    const std::uint32_t chunk_retries = scheduler_ ? scheduler_->max_chunk_retries() : 0;
    return std::max(max_op_retries_, chunk_retries);
}

std::uint64_t UploadTask::uploaded_bytes() const noexcept {
    return scheduler_ ? scheduler_->uploaded_bytes() : 0;
}

UploadSnapshot UploadTask::snapshot() const {
    UploadSnapshot s;
    s.task_id = id_;
    s.name = payload_->name();
    s.size = payload_->size();
    s.session = session_;
    s.remote_upload_id = upload_id_;
    s.start_time = start_time_;
    s.last_progress_time = last_progress_time_;
    s.status = status_;
    s.error = error_;
    s.paused_at = paused_at_;
    s.resume_count = resume_count_;
    s.chunk_size = chunk_size();
    s.retry_count = retry_count();
    s.total_retries = total_op_retries_;

    if (scheduler_) {
        s.total_chunks = scheduler_->total_chunks();
        s.completed_chunks = scheduler_->completed_chunks();
        s.current_chunk_index = scheduler_->current_chunk_index();
        s.in_flight = scheduler_->in_flight();
        s.uploaded_bytes = scheduler_->uploaded_bytes();
        s.total_retries += scheduler_->total_retries();
    } else {
        s.total_chunks = static_cast<std::uint32_t>((s.size + chunk_size_ - 1) / chunk_size_);
    }
    return s;
}

//=============================================================================
// Initiate
//=============================================================================

void UploadTask::initiate() noexcept {
    if (stop_.stop_requested()) return;

    const auto attempt = ++attempt_id_;
    op_stop_ = std::stop_source{};

    UploadMetadata meta{payload_->name(), payload_->size(), payload_->content_type(), session_};
    std::weak_ptr<UploadTask> weak = weak_from_this();
    Transport* transport = ctx_.transport;

    transport->initiate_multipart_upload(std::move(meta), op_stop_.get_token(),
        deadline_on_start(ctx_.options.chunk_timeout, attempt),
        [weak, attempt, transport, exec = ctx_.executor](std::expected<std::string, TransportError> result) {
            boost::asio::post(exec, [weak, attempt, transport, result = std::move(result)]() mutable {
                auto self = weak.lock();
                if (self && self->adopt(attempt)) {
                    self->on_initiated(std::move(result));
                } else if (result) {
                    discard_upload(*transport, *result);
                }
            });
        });
}

bool UploadTask::adopt(std::uint64_t attempt_id) const noexcept {
    return attempt_id == attempt_id_ && !stop_.stop_requested();
}

void UploadTask::on_initiated(std::expected<std::string, TransportError> result) noexcept {
    // Retire this attempt so a deadline already queued cannot fire for it
    ++attempt_id_;
    if (deadline_) deadline_->cancel();
    if (status_ != TaskStatus::initializing) return;

    if (!result) {
        on_op_failed(result.error());
        return;
    }

    upload_id_ = std::move(*result);
    op_retries_ = 0;
    log::get()->debug("Task {}: multipart upload {} opened", id_, upload_id_);
    begin_transfer();
}

void UploadTask::begin_transfer() noexcept {
    if (!transition(TaskStatus::uploading)) return;

    std::weak_ptr<UploadTask> weak = weak_from_this();
    ChunkScheduler::Callbacks cbs;
    cbs.on_chunk = [weak](const CompletedChunk& chunk, Clock::duration elapsed) {
        if (auto self = weak.lock()) self->on_chunk(chunk, elapsed);
    };
    cbs.on_complete = [weak]() {
        if (auto self = weak.lock()) self->on_chunks_complete();
    };
    cbs.on_failure = [weak](const TransportError& error) {
        if (auto self = weak.lock()) self->fail(classify(error.code), error);
    };

    scheduler_ = std::make_shared<ChunkScheduler>(ctx_.executor, *ctx_.transport, payload_, upload_id_,
                                                  ctx_.config, ctx_.retry, ctx_.options,
                                                  chunk_size_, std::move(cbs));
    last_progress_time_ = Clock::now();
    scheduler_->start();
}

//=============================================================================
// Chunk progress
//=============================================================================

void UploadTask::on_chunk(const CompletedChunk& chunk, Clock::duration elapsed) noexcept {
    if (is_terminal(status_)) return;

    if (hooks_.on_chunk_transferred) {
        hooks_.on_chunk_transferred(chunk.size, elapsed);
    }
    if (is_terminal(status_)) return;

    const auto now = Clock::now();
    const std::uint64_t uploaded = scheduler_->uploaded_bytes();
    const std::uint64_t total = payload_->size();

    // Instantaneous speed over the interval since the previous progress report
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now - last_progress_time_).count();
    if (ns > 0 && uploaded > last_progress_bytes_) {
        last_speed_ = static_cast<std::uint64_t>(
            static_cast<double>(uploaded - last_progress_bytes_) * 1e9 / static_cast<double>(ns));
    }
    last_progress_time_ = now;
    last_progress_bytes_ = uploaded;

    UploadProgress progress;
    progress.task_id = id_;
    progress.uploaded_bytes = uploaded;
    progress.total_bytes = total;
    progress.percent = total > 0 ? static_cast<double>(uploaded) * 100.0 / static_cast<double>(total) : 100.0;
    progress.speed_bps = last_speed_;
    progress.eta_seconds = last_speed_ > 0 ? (total - uploaded) / last_speed_ : 0;
    progress.completed_chunks = scheduler_->completed_count();
    progress.total_chunks = scheduler_->total_chunks();

    emit(progress);
    if (is_terminal(status_)) return;
    invoke_callback(callbacks_.on_progress, progress, id_);
}

void UploadTask::on_chunks_complete() noexcept {
    if (!transition(TaskStatus::completing)) return;
    op_retries_ = 0;
    finalize();
}

//=============================================================================
// Finalize
//=============================================================================

void UploadTask::finalize() noexcept {
    if (stop_.stop_requested() || status_ != TaskStatus::completing) return;

    auto chunks = scheduler_->completed_chunks();
    const auto total = scheduler_->total_chunks();
    bool covered = chunks.size() == total;
    for (std::uint32_t i = 0; covered && i < chunks.size(); ++i) {
        covered = chunks[i].index == i;
    }
    if (!covered) {
        fail(ErrorKind::finalize, TransportError{make_error_code(UploadErrc::finalize_failed), 0,
                                                 "Stored chunks do not cover the payload", {}});
        return;
    }

    const auto attempt = ++attempt_id_;
    op_stop_ = std::stop_source{};

    std::weak_ptr<UploadTask> weak = weak_from_this();
    ctx_.transport->complete_multipart_upload(upload_id_, std::move(chunks), op_stop_.get_token(),
        deadline_on_start(ctx_.options.finalize_timeout, attempt),
        [weak, attempt, exec = ctx_.executor](std::expected<FinalizeResult, TransportError> result) {
            boost::asio::post(exec, [weak, attempt, result = std::move(result)]() mutable {
                auto self = weak.lock();
                if (self && self->adopt(attempt)) {
                    self->on_finalized(std::move(result));
                }
            });
        });
}

void UploadTask::on_finalized(std::expected<FinalizeResult, TransportError> result) noexcept {
    ++attempt_id_;
    if (deadline_) deadline_->cancel();
    if (status_ != TaskStatus::completing) return;

    if (!result) {
        on_op_failed(result.error());
        return;
    }

    (void)transition(TaskStatus::completed);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time_);

    UploadCompleted done;
    done.task_id = id_;
    done.name = payload_->name();
    done.size = payload_->size();
    done.result = std::move(*result);
    done.elapsed = elapsed;
    done.total_retries = total_op_retries_ + scheduler_->total_retries();

    log::get()->info("Task {}: '{}' completed in {} ms ({} retries)",
                     id_, done.name, elapsed.count(), done.total_retries);
    emit(done);
    invoke_callback(callbacks_.on_complete, done, id_);
    finish(TaskStatus::completed);
}

//=============================================================================
// Retry and deadlines for initiate/finalize
//=============================================================================

void UploadTask::on_op_failed(const TransportError& error) noexcept {
    const bool finalizing = status_ == TaskStatus::completing;

    if (!RetryPolicy::should_retry(error.code, op_retries_, ctx_.config->retry_attempts)) {
        fail(finalizing ? ErrorKind::finalize : classify(error.code), error);
        return;
    }

    ++op_retries_;
    ++total_op_retries_;
    max_op_retries_ = std::max(max_op_retries_, op_retries_);

    const auto delay = ctx_.retry->next_delay(op_retries_, error);
    log::get()->warn("Task {}: {} failed ({}), retry {} in {} ms", id_,
                     finalizing ? "finalize" : "initiate", error.message, op_retries_, delay.count());
    retry_after(delay, finalizing ? &UploadTask::finalize : &UploadTask::initiate);
}

void UploadTask::retry_after(std::chrono::milliseconds delay, void (UploadTask::*op)()) noexcept {
    backoff_ = std::make_unique<boost::asio::steady_timer>(ctx_.executor, delay);
    std::weak_ptr<UploadTask> weak = weak_from_this();
    backoff_->async_wait([weak, op](const boost::system::error_code& ec) {
        if (ec) return;
        auto self = weak.lock();
        if (!self || self->stop_.stop_requested()) return;
        ((*self).*op)();
    });
}

StartHandler UploadTask::deadline_on_start(std::chrono::milliseconds timeout, std::uint64_t attempt_id) {
    std::weak_ptr<UploadTask> weak = weak_from_this();
    return [weak, timeout, attempt_id, exec = ctx_.executor]() {
        const auto at = Clock::now();
        boost::asio::post(exec, [weak, timeout, attempt_id, at]() {
            if (auto self = weak.lock()) {
                self->arm_deadline(timeout - std::chrono::duration_cast<std::chrono::milliseconds>(
                                                 Clock::now() - at),
                                   attempt_id);
            }
        });
    };
}

void UploadTask::arm_deadline(std::chrono::milliseconds timeout, std::uint64_t attempt_id) noexcept {
    if (attempt_id != attempt_id_ || stop_.stop_requested()) return;

    deadline_ = std::make_unique<boost::asio::steady_timer>(
        ctx_.executor, std::max(timeout, std::chrono::milliseconds::zero()));
    std::weak_ptr<UploadTask> weak = weak_from_this();
    deadline_->async_wait([weak, attempt_id](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) {
            self->on_deadline(attempt_id);
        }
    });
}

void UploadTask::on_deadline(std::uint64_t attempt_id) noexcept {
    if (attempt_id != attempt_id_ || stop_.stop_requested()) return;
    if (status_ != TaskStatus::initializing && status_ != TaskStatus::completing) return;

    // Any late answer to this attempt is now stale
    ++attempt_id_;
    op_stop_.request_stop();
    on_op_failed(TransportError{make_error_code(UploadErrc::timeout), 0,
                                status_ == TaskStatus::completing ? "Finalize timed out" : "Initiate timed out",
                                {}});
}

//=============================================================================
// Termination
//=============================================================================

void UploadTask::fail(ErrorKind kind, const TransportError& error) noexcept {
    if (is_terminal(status_)) return;
    auto self = shared_from_this();

    (void)transition(TaskStatus::error);
    error_ = TaskError{kind, error.code, error.message};
    stop_.request_stop();
    op_stop_.request_stop();
    if (deadline_) deadline_->cancel();
    if (backoff_) backoff_->cancel();
    if (scheduler_) scheduler_->cancel();
    abort_remote();

    log::get()->error("Task {}: {} ({}): {}", id_, to_string(kind), error.code.message(), error.message);
    UploadError event{id_, *error_};
    emit(event);
    invoke_callback(callbacks_.on_error, event, id_);
    finish(TaskStatus::error);
}

void UploadTask::finish(TaskStatus terminal) noexcept {
    if (hooks_.on_finished) {
        hooks_.on_finished(id_, terminal);
    }
}

bool UploadTask::transition(TaskStatus to) noexcept {
    if (!can_transition(status_, to)) {
        log::get()->warn("Task {}: rejected transition {} -> {}", id_, to_string(status_), to_string(to));
        return false;
    }
    log::get()->debug("Task {}: {} -> {}", id_, to_string(status_), to_string(to));
    status_ = to;
    return true;
}

void UploadTask::abort_remote() noexcept {
    if (upload_id_.empty()) return;
    discard_upload(*ctx_.transport, upload_id_);
}

void UploadTask::emit(const Event& event) noexcept {
    if (hooks_.emit) {
        hooks_.emit(event);
    }
}

} // namespace uplift::core
