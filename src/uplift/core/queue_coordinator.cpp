// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/queue_coordinator.hpp>
#include <uplift/core/error.hpp>
#include <uplift/log.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <vector>

namespace uplift::core {

namespace {

EngineOptions checked_options(EngineOptions options) {
    if (auto ec = validate(options)) {
        log::get()->error("Invalid engine options ({}), using defaults", ec.message());
        return EngineOptions{};
    }
    return options;
}

QueueConfig checked_config(QueueConfig config) {
    if (auto ec = validate(config)) {
        log::get()->error("Invalid queue configuration ({}), using defaults", ec.message());
        return QueueConfig{};
    }
    return config;
}

[[nodiscard]] bool is_slow(EffectiveType t) noexcept {
    return t == EffectiveType::slow_2g || t == EffectiveType::g2;
}

} // namespace

QueueCoordinator::QueueCoordinator(boost::asio::any_io_executor executor,
                                   Transport& transport,
                                   QueueConfig config,
                                   EngineOptions options,
                                   std::shared_ptr<NetworkSampler> platform_sampler)
    : executor_(std::move(executor))
    , transport_(transport)
    , options_(checked_options(options))
    , config_(std::make_shared<QueueConfig>(checked_config(config)))
    , retry_(std::make_shared<RetryPolicy>(config_->base_retry_delay, options_.max_retry_delay,
                                           options_.retry_jitter))
    , network_(options_, std::move(platform_sampler))
    , optimizer_(options_)
    , chunk_size_(options_.default_chunk_size)
    , optimize_timer_(executor_)
    , network_timer_(executor_)
    , alive_(std::make_shared<bool>(true)) {
    detect_initial_capabilities();

    network_.on_change([this](const NetworkMetrics& metrics, EffectiveType previous) {
        on_network_change(metrics, previous);
    });

    arm_optimize_timer();
    arm_network_timer();

    log::get()->info("Upload queue ready: {} files, {} chunks, {} retries, {} priority",
                     config_->max_concurrent_files, config_->max_concurrent_chunks,
                     config_->retry_attempts, to_string(config_->priority_mode));
}

QueueCoordinator::~QueueCoordinator() {
    shutdown();
}

//=============================================================================
// Submission and control
//=============================================================================

std::expected<TaskId, std::error_code>
QueueCoordinator::submit(PayloadHandle payload, SessionContext session, SubmitOptions options) noexcept {
    if (shut_down_) {
        return std::unexpected(make_error_code(UploadErrc::shut_down));
    }
    if (!payload || payload->size() == 0) {
        return std::unexpected(make_error_code(UploadErrc::validation_failed));
    }

    const TaskId id = next_id_++;
    const std::int64_t priority = options.priority.value_or(calculate_priority(*payload));
    QueueKey key{priority, std::chrono::steady_clock::now(), next_sequence_++};

    UploadQueued event{id, payload->name(), payload->size(), priority, 0};
    pending_.emplace(key, QueuedTask{id, std::move(payload), std::move(session), std::move(options.callbacks)});
    event.queue_length = pending_.size();

    log::get()->info("Task {}: queued '{}' ({} bytes, priority {})", id, event.name, event.size, priority);
    bus_.emit(event);
    schedule_promotion();
    return id;
}

std::error_code QueueCoordinator::cancel(TaskId id) noexcept {
    if (auto it = active_.find(id); it != active_.end()) {
        auto task = it->second;
        return task->cancel();
    }

    auto it = find_pending(id);
    if (it == pending_.end()) {
        return make_error_code(UploadErrc::unknown_task);
    }
    pending_.erase(it);
    ++cancelled_;

    log::get()->info("Task {}: cancelled while queued", id);
    bus_.emit(UploadCancelled{id, false});
    maybe_announce_empty();
    return {};
}

std::error_code QueueCoordinator::pause(TaskId id) noexcept {
    if (auto it = active_.find(id); it != active_.end()) {
        return it->second->pause();
    }
    return find_pending(id) != pending_.end()
        ? make_error_code(UploadErrc::invalid_state)
        : make_error_code(UploadErrc::unknown_task);
}

std::error_code QueueCoordinator::resume(TaskId id) noexcept {
    if (auto it = active_.find(id); it != active_.end()) {
        offline_paused_.erase(id);
        return it->second->resume();
    }
    return find_pending(id) != pending_.end()
        ? make_error_code(UploadErrc::invalid_state)
        : make_error_code(UploadErrc::unknown_task);
}

void QueueCoordinator::pause_all() noexcept {
    std::size_t count = 0;
    for (const auto& task : active_tasks()) {
        if (!task->pause()) ++count;
    }
    log::get()->info("Paused {} uploads", count);
}

void QueueCoordinator::resume_all() noexcept {
    std::size_t count = 0;
    for (const auto& task : active_tasks()) {
        if (!task->resume()) ++count;
    }
    offline_paused_.clear();
    log::get()->info("Resumed {} uploads", count);
}

//=============================================================================
// Queries
//=============================================================================

QueueStatus QueueCoordinator::status() const {
    QueueStatus s;
    s.queued = pending_.size();
    s.active = active_.size();
    s.paused = static_cast<std::size_t>(std::count_if(active_.begin(), active_.end(), [](const auto& entry) {
        return entry.second->status() == TaskStatus::paused;
    }));
    s.completed = completed_;
    s.failed = failed_;
    s.cancelled = cancelled_;
    s.chunk_size = chunk_size_;
    s.config = *config_;
    s.network = network_.metrics();
    s.performance = optimizer_.metrics();
    s.performance.active_concurrency = static_cast<std::uint32_t>(active_.size());
    return s;
}

std::optional<UploadSnapshot> QueueCoordinator::task(TaskId id) const {
    auto it = active_.find(id);
    if (it == active_.end()) return std::nullopt;
    return it->second->snapshot();
}

std::error_code QueueCoordinator::update_config(const QueueConfigPatch& patch) noexcept {
    const QueueConfig next = merged(*config_, patch);
    if (auto ec = validate(next)) {
        return ec;
    }
    *config_ = next;
    retry_->base_delay(next.base_retry_delay);

    log::get()->info("Config updated: {} files, {} chunks, {} retries, {} ms base delay, {}",
                     next.max_concurrent_files, next.max_concurrent_chunks, next.retry_attempts,
                     next.base_retry_delay.count(), to_string(next.priority_mode));
    schedule_promotion();
    return {};
}

Subscription QueueCoordinator::subscribe(EventKind kind, EventHandler handler) {
    return bus_.subscribe(kind, std::move(handler));
}

Subscription QueueCoordinator::subscribe_all(EventHandler handler) {
    return bus_.subscribe_all(std::move(handler));
}

//=============================================================================
// Promotion
//=============================================================================

std::int64_t QueueCoordinator::calculate_priority(const Payload& payload) const noexcept {
    const auto size = static_cast<std::int64_t>(payload.size());
    switch (config_->priority_mode) {
        case PriorityMode::smallest_first: return size;
        case PriorityMode::largest_first:  return -size;
        case PriorityMode::fifo:           return 0;
    }
    return 0;
}

void QueueCoordinator::schedule_promotion() noexcept {
    if (promotion_pending_ || shut_down_) return;
    promotion_pending_ = true;

    std::weak_ptr<bool> alive = alive_;
    boost::asio::post(executor_, [this, alive]() {
        if (!alive.lock()) return;
        promotion_pending_ = false;
        promote();
    });
}

void QueueCoordinator::promote() noexcept {
    while (!shut_down_ && !pending_.empty() && active_.size() < config_->max_concurrent_files) {
        auto node = pending_.extract(pending_.begin());
        QueuedTask queued = std::move(node.mapped());

        std::weak_ptr<bool> alive = alive_;
        UploadTask::Hooks hooks;
        hooks.emit = [this, alive](const Event& event) {
            if (alive.lock()) bus_.emit(event);
        };
        hooks.on_finished = [this, alive](TaskId id, TaskStatus status) {
            if (alive.lock()) on_task_finished(id, status);
        };
        hooks.on_chunk_transferred = [this, alive](std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) {
            if (alive.lock()) on_chunk_transferred(bytes, elapsed);
        };

        UploadTask::Context ctx{executor_, &transport_, config_, retry_, options_};
        auto task = std::make_shared<UploadTask>(queued.id, queued.payload, std::move(queued.session),
                                                 chunk_size_, std::move(ctx), std::move(hooks),
                                                 std::move(queued.callbacks));
        active_.emplace(queued.id, task);

        bus_.emit(UploadStarted{queued.id, queued.payload->name(), queued.payload->size()});
        task->start();
    }
    optimizer_.active_concurrency(static_cast<std::uint32_t>(active_.size()));
}

void QueueCoordinator::on_task_finished(TaskId id, TaskStatus status) noexcept {
    auto it = active_.find(id);
    if (it == active_.end()) return;
    active_.erase(it);
    offline_paused_.erase(id);

    switch (status) {
        case TaskStatus::completed:
            ++completed_;
            optimizer_.record_outcome(true);
            break;
        case TaskStatus::error:
            ++failed_;
            optimizer_.record_outcome(false);
            break;
        case TaskStatus::cancelled:
            ++cancelled_;
            break;
        default:
            log::get()->warn("Task {}: finished in non-terminal state {}", id, to_string(status));
            break;
    }
    optimizer_.active_concurrency(static_cast<std::uint32_t>(active_.size()));

    maybe_announce_empty();
    schedule_promotion();
}

void QueueCoordinator::maybe_announce_empty() noexcept {
    if (pending_.empty() && active_.empty()) {
        log::get()->info("Upload queue empty");
        bus_.emit(QueueEmpty{});
    }
}

std::vector<std::shared_ptr<UploadTask>> QueueCoordinator::active_tasks() const {
    std::vector<std::shared_ptr<UploadTask>> out;
    out.reserve(active_.size());
    for (const auto& [id, task] : active_) {
        out.push_back(task);
    }
    return out;
}

std::map<QueueCoordinator::QueueKey, QueueCoordinator::QueuedTask>::iterator
QueueCoordinator::find_pending(TaskId id) noexcept {
    return std::find_if(pending_.begin(), pending_.end(),
                        [id](const auto& entry) { return entry.second.id == id; });
}

//=============================================================================
// Feedback
//=============================================================================

void QueueCoordinator::on_chunk_transferred(std::uint64_t bytes,
                                            std::chrono::steady_clock::duration elapsed) noexcept {
    optimizer_.record_transfer(bytes, elapsed);
    network_.record_transfer(bytes, elapsed);
}

void QueueCoordinator::on_network_change(const NetworkMetrics& metrics, EffectiveType previous) noexcept {
    bus_.emit(NetworkChange{metrics, previous});

    if (!metrics.online) {
        if (online_) {
            online_ = false;
            for (const auto& task : active_tasks()) {
                if (task->status() == TaskStatus::uploading && !task->pause(true)) {
                    offline_paused_.insert(task->id());
                }
            }
            log::get()->warn("Network offline, paused {} uploads", offline_paused_.size());
        }
        return;
    }

    if (!online_) {
        online_ = true;
        const auto paused = std::move(offline_paused_);
        offline_paused_.clear();
        std::size_t resumed = 0;
        for (auto id : paused) {
            auto it = active_.find(id);
            if (it != active_.end() && !it->second->resume()) ++resumed;
        }
        log::get()->warn("Network back online, resumed {} uploads", resumed);
    }

    if (!config_->network_optimization) return;

    if (auto advice = recommended_concurrency(metrics)) {
        config_->max_concurrent_files = advice->max_concurrent_files;
        config_->max_concurrent_chunks = advice->max_concurrent_chunks;
        if (is_slow(metrics.effective_type)) {
            config_->priority_mode = PriorityMode::smallest_first;
        }
    }
    if (auto size = recommended_chunk_size(metrics, options_)) {
        apply_chunk_size(*size);
    }

    log::get()->info("Adapted to {} network: {} files, {} chunks, {} byte chunks",
                     to_string(metrics.effective_type), config_->max_concurrent_files,
                     config_->max_concurrent_chunks, chunk_size_);
    schedule_promotion();
}

void QueueCoordinator::apply_chunk_size(std::uint64_t size) noexcept {
    chunk_size_ = clamp_chunk_size(size, options_);
    for (const auto& [id, task] : active_) {
        task->chunk_size(chunk_size_);
    }
}

void QueueCoordinator::detect_initial_capabilities() noexcept {
    auto* platform = network_.platform_sampler();
    if (!platform) return;

    // Establish the baseline before any change handler is attached
    network_.poll();

    auto sample = platform->sample();
    if (!sample) return;
    online_ = sample->online;

    if (is_slow(sample->effective_type)) {
        config_->max_concurrent_files = 1;
        config_->max_concurrent_chunks = 1;
        config_->priority_mode = PriorityMode::smallest_first;
        if (auto size = recommended_chunk_size(network_.metrics(), options_)) {
            chunk_size_ = *size;
        }
        log::get()->info("Slow network detected ({}), starting with one upload at a time",
                         to_string(sample->effective_type));
    }
}

void QueueCoordinator::refresh_network() noexcept {
    network_.poll();
}

void QueueCoordinator::optimize_now() noexcept {
    if (shut_down_) return;

    if (config_->adaptive_optimization) {
        std::optional<std::uint64_t> expected;
        if (network_.metrics().speed_bps > 0) {
            expected = network_.metrics().speed_bps;
        }

        const auto before = config_->max_concurrent_files;
        const auto adj = optimizer_.evaluate(*config_, chunk_size_, expected);
        if (adj.max_concurrent_files) config_->max_concurrent_files = *adj.max_concurrent_files;
        if (adj.max_concurrent_chunks) config_->max_concurrent_chunks = *adj.max_concurrent_chunks;
        if (adj.chunk_size) apply_chunk_size(*adj.chunk_size);

        if (!adj.empty()) {
            log::get()->info("Optimizer: success rate {:.2f}, {} files, {} chunks, {} byte chunks",
                             optimizer_.success_rate(), config_->max_concurrent_files,
                             config_->max_concurrent_chunks, chunk_size_);
        }
        if (config_->max_concurrent_files > before) {
            schedule_promotion();
        }
    }

    optimizer_.active_concurrency(static_cast<std::uint32_t>(active_.size()));
    bus_.emit(PerformanceUpdate{optimizer_.metrics(), config_->max_concurrent_files,
                                config_->max_concurrent_chunks, chunk_size_});
}

//=============================================================================
// Timers and teardown
//=============================================================================

void QueueCoordinator::arm_optimize_timer() noexcept {
    if (shut_down_ || options_.optimization_interval <= std::chrono::milliseconds::zero()) return;

    optimize_timer_.expires_after(options_.optimization_interval);
    std::weak_ptr<bool> alive = alive_;
    optimize_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec || !alive.lock()) return;
        optimize_now();
        arm_optimize_timer();
    });
}

void QueueCoordinator::arm_network_timer() noexcept {
    if (shut_down_ || options_.network_poll_interval <= std::chrono::milliseconds::zero()) return;

    network_timer_.expires_after(options_.network_poll_interval);
    std::weak_ptr<bool> alive = alive_;
    network_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec || !alive.lock()) return;
        network_.poll();
        arm_network_timer();
    });
}

void QueueCoordinator::shutdown() noexcept {
    if (shut_down_) return;
    shut_down_ = true;

    optimize_timer_.cancel();
    network_timer_.cancel();

    // Cancelling removes tasks from active_
    for (const auto& task : active_tasks()) {
        if (auto ec = task->cancel()) {
            log::get()->debug("Task {}: not cancelled on shutdown: {}", task->id(), ec.message());
        }
    }

    for (const auto& [key, queued] : pending_) {
        ++cancelled_;
        bus_.emit(UploadCancelled{queued.id, false});
    }
    pending_.clear();
    active_.clear();
    offline_paused_.clear();

    bus_.clear();
    network_.on_change(nullptr);
    alive_.reset();
    log::get()->info("Upload queue shut down");
}

} // namespace uplift::core
