// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/performance_optimizer.hpp>
#include <algorithm>
#include <numeric>

namespace uplift::core {

PerformanceOptimizer::PerformanceOptimizer(const EngineOptions& options)
    : options_(options)
    , outcomes_(std::max<std::size_t>(options.outcome_window, 1))
    , speeds_(std::max<std::size_t>(options.outcome_window, 1)) {
}

void PerformanceOptimizer::record_outcome(bool success) noexcept {
    outcomes_.push_back(success);
    ++metrics_.total_uploads;
    if (success) {
        ++metrics_.successful_uploads;
    } else {
        ++metrics_.failed_uploads;
    }
}

void PerformanceOptimizer::record_transfer(std::uint64_t bytes,
                                           std::chrono::steady_clock::duration elapsed) noexcept {
    metrics_.total_bytes_uploaded += bytes;

    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
    if (ns <= 0 || bytes == 0) return;

    const double speed = static_cast<double>(bytes) * 1e9 / static_cast<double>(ns);
    speeds_.push_back(static_cast<std::uint64_t>(speed));

    const double w = options_.network_ema_weight;
    speed_ema_ = speed_ema_ == 0.0 ? speed : w * speed + (1.0 - w) * speed_ema_;
    metrics_.average_speed_bps = static_cast<std::uint64_t>(speed_ema_);
}

double PerformanceOptimizer::success_rate() const noexcept {
    if (outcomes_.empty()) return 1.0;
    const auto ok = std::count(outcomes_.begin(), outcomes_.end(), true);
    return static_cast<double>(ok) / static_cast<double>(outcomes_.size());
}

std::uint64_t PerformanceOptimizer::measured_speed() const noexcept {
    if (speeds_.empty()) return 0;
    const double sum = std::accumulate(speeds_.begin(), speeds_.end(), 0.0);
    return static_cast<std::uint64_t>(sum / static_cast<double>(speeds_.size()));
}

PerformanceOptimizer::Adjustment
PerformanceOptimizer::evaluate(const QueueConfig& config,
                               std::uint64_t chunk_size,
                               std::optional<std::uint64_t> expected_speed) noexcept {
    Adjustment adj;
    const auto& t = options_.thresholds;
    const double rate = success_rate();
    const std::uint64_t measured = measured_speed();
    if (expected_speed && *expected_speed == 0) {
        expected_speed.reset();
    }

    // Concurrency rule; without outcomes there is nothing to judge
    if (!outcomes_.empty()) {
        if (rate < t.low_success_rate && config.max_concurrent_files > 1) {
            adj.max_concurrent_files = config.max_concurrent_files - 1;
            adj.max_concurrent_chunks = std::max<std::uint32_t>(1, config.max_concurrent_chunks - 1);
        } else if (rate > t.high_success_rate &&
                   config.max_concurrent_files < options_.concurrency_ceiling &&
                   (!expected_speed || measured < *expected_speed)) {
            adj.max_concurrent_files = config.max_concurrent_files + 1;
            adj.max_concurrent_chunks = std::min(options_.chunk_concurrency_ceiling,
                                                 config.max_concurrent_chunks + 1);
        }
        if (adj.max_concurrent_chunks && *adj.max_concurrent_chunks == config.max_concurrent_chunks) {
            adj.max_concurrent_chunks.reset();
        }
    }

    // Chunk size rule
    if (expected_speed && measured > 0) {
        const double ratio = static_cast<double>(measured) / static_cast<double>(*expected_speed);
        std::uint64_t next = chunk_size;
        if (ratio < t.slow_speed_ratio) {
            next = static_cast<std::uint64_t>(static_cast<double>(chunk_size) * t.shrink_factor);
        } else if (ratio > t.fast_speed_ratio) {
            next = static_cast<std::uint64_t>(static_cast<double>(chunk_size) * t.grow_factor);
        }
        next = clamp_chunk_size(next, options_);
        if (next != chunk_size) {
            adj.chunk_size = next;
        }
    }

    metrics_.optimal_concurrency = adj.max_concurrent_files.value_or(config.max_concurrent_files);
    return adj;
}

PerformanceMetrics PerformanceOptimizer::metrics() const noexcept {
    PerformanceMetrics out = metrics_;
    out.success_rate = success_rate();
    return out;
}

} // namespace uplift::core
