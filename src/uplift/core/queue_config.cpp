// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/queue_config.hpp>
#include <uplift/core/error.hpp>
#include <algorithm>

namespace uplift::core {

std::string_view to_string(PriorityMode mode) noexcept {
    switch (mode) {
        case PriorityMode::fifo:           return "fifo";
        case PriorityMode::smallest_first: return "smallest-first";
        case PriorityMode::largest_first:  return "largest-first";
    }
    return "unknown";
}

std::optional<PriorityMode> parse_priority_mode(std::string_view text) noexcept {
    if (text == "fifo") return PriorityMode::fifo;
    if (text == "smallest-first") return PriorityMode::smallest_first;
    if (text == "largest-first") return PriorityMode::largest_first;
    return std::nullopt;
}

std::error_code validate(const QueueConfig& config) noexcept {
    if (config.max_concurrent_files < 1 || config.max_concurrent_chunks < 1) {
        return UploadErrc::invalid_config;
    }
    if (config.base_retry_delay <= std::chrono::milliseconds::zero()) {
        return UploadErrc::invalid_config;
    }
    return {};
}

QueueConfig merged(const QueueConfig& base, const QueueConfigPatch& patch) noexcept {
    QueueConfig out = base;
    if (patch.max_concurrent_files) out.max_concurrent_files = *patch.max_concurrent_files;
    if (patch.max_concurrent_chunks) out.max_concurrent_chunks = *patch.max_concurrent_chunks;
    if (patch.retry_attempts) out.retry_attempts = *patch.retry_attempts;
    if (patch.base_retry_delay) out.base_retry_delay = *patch.base_retry_delay;
    if (patch.priority_mode) out.priority_mode = *patch.priority_mode;
    if (patch.adaptive_optimization) out.adaptive_optimization = *patch.adaptive_optimization;
    if (patch.network_optimization) out.network_optimization = *patch.network_optimization;
    return out;
}

std::error_code validate(const EngineOptions& options) noexcept {
    if (options.min_chunk_size == 0 ||
        options.min_chunk_size > options.max_chunk_size ||
        options.default_chunk_size < options.min_chunk_size ||
        options.default_chunk_size > options.max_chunk_size) {
        return UploadErrc::invalid_config;
    }
    if (options.retry_jitter < 0.0 || options.retry_jitter >= 1.0) {
        return UploadErrc::invalid_config;
    }
    if (options.chunk_timeout <= std::chrono::milliseconds::zero() ||
        options.finalize_timeout <= std::chrono::milliseconds::zero()) {
        return UploadErrc::invalid_config;
    }
    if (options.outcome_window == 0 || options.network_sample_capacity == 0) {
        return UploadErrc::invalid_config;
    }
    if (options.network_ema_weight <= 0.0 || options.network_ema_weight > 1.0) {
        return UploadErrc::invalid_config;
    }
    if (options.concurrency_ceiling < 1 || options.chunk_concurrency_ceiling < 1) {
        return UploadErrc::invalid_config;
    }
    const auto& t = options.thresholds;
    if (t.low_success_rate > t.high_success_rate ||
        t.slow_speed_ratio > t.fast_speed_ratio ||
        t.shrink_factor <= 0.0 || t.shrink_factor > 1.0 || t.grow_factor < 1.0) {
        return UploadErrc::invalid_config;
    }
    return {};
}

std::uint64_t clamp_chunk_size(std::uint64_t size, const EngineOptions& options) noexcept {
    return std::clamp(size, options.min_chunk_size, options.max_chunk_size);
}

} // namespace uplift::core
