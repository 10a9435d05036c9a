// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/network_monitor.hpp>
#include <uplift/log.hpp>
#include <algorithm>
#include <cmath>

namespace uplift::core {

//=============================================================================
// ManualSampler
//=============================================================================

void ManualSampler::set(NetworkSample sample) noexcept {
    std::lock_guard lock(mutex_);
    current_ = sample;
}

void ManualSampler::clear() noexcept {
    std::lock_guard lock(mutex_);
    current_.reset();
}

std::optional<NetworkSample> ManualSampler::sample() noexcept {
    std::lock_guard lock(mutex_);
    return current_;
}

//=============================================================================
// ThroughputSampler
//=============================================================================

ThroughputSampler::ThroughputSampler(std::size_t capacity, double ema_weight)
    : samples_(std::max<std::size_t>(capacity, 1))
    , weight_(std::clamp(ema_weight, 0.01, 1.0)) {
}

void ThroughputSampler::record(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) noexcept {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
    if (ns <= 0 || bytes == 0) return;

    // bytes * 1e9 / ns = bytes/second
    const double speed = static_cast<double>(bytes) * 1e9 / static_cast<double>(ns);
    samples_.push_back(static_cast<std::uint64_t>(speed));

    ema_ = samples_.size() == 1 ? speed : weight_ * speed + (1.0 - weight_) * ema_;
}

std::optional<NetworkSample> ThroughputSampler::sample() noexcept {
    if (samples_.empty()) return std::nullopt;

    NetworkSample s;
    s.speed_bps = estimate();
    s.effective_type = classify(s.speed_bps, std::chrono::milliseconds{0});
    return s;
}

EffectiveType ThroughputSampler::classify(std::uint64_t speed_bps, std::chrono::milliseconds rtt) noexcept {
    const double kbps = static_cast<double>(speed_bps) * 8.0 / 1000.0;
    const auto ms = rtt.count();
    const bool has_rtt = ms > 0;

    if ((has_rtt && ms >= 2000) || kbps < 50.0) return EffectiveType::slow_2g;
    if ((has_rtt && ms >= 1400) || kbps < 70.0) return EffectiveType::g2;
    if ((has_rtt && ms >= 270) || kbps < 700.0) return EffectiveType::g3;
    return EffectiveType::g4;
}

//=============================================================================
// Recommendations
//=============================================================================

std::optional<ConcurrencyAdvice> recommended_concurrency(const NetworkMetrics& metrics) noexcept {
    if (!metrics.online) return std::nullopt;
    switch (metrics.effective_type) {
        case EffectiveType::slow_2g:
        case EffectiveType::g2:
            return ConcurrencyAdvice{1, 1};
        case EffectiveType::g3:
            return ConcurrencyAdvice{2, 2};
        case EffectiveType::g4:
            return ConcurrencyAdvice{DEFAULT_MAX_CONCURRENT_FILES, DEFAULT_MAX_CONCURRENT_CHUNKS};
        case EffectiveType::unknown:
            break;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> recommended_chunk_size(const NetworkMetrics& metrics,
                                                    const EngineOptions& options) noexcept {
    if (!metrics.online) return std::nullopt;

    std::uint64_t size = 0;
    switch (metrics.effective_type) {
        case EffectiveType::slow_2g:
        case EffectiveType::g2:
            size = SLOW_NETWORK_CHUNK_SIZE;
            break;
        case EffectiveType::g3:
            size = MEDIUM_NETWORK_CHUNK_SIZE;
            break;
        case EffectiveType::g4: {
            // Aim for a fixed transfer time per chunk
            const auto target = static_cast<std::uint64_t>(TARGET_CHUNK_DURATION.count());
            const std::uint64_t by_speed = metrics.speed_bps > options.max_chunk_size / target
                ? options.max_chunk_size
                : metrics.speed_bps * target;
            size = std::clamp(by_speed, options.default_chunk_size, options.max_chunk_size);
            break;
        }
        case EffectiveType::unknown:
            return std::nullopt;
    }
    return clamp_chunk_size(size, options);
}

//=============================================================================
// NetworkMonitor
//=============================================================================

NetworkMonitor::NetworkMonitor(const EngineOptions& options,
                               std::shared_ptr<NetworkSampler> platform)
    : platform_(std::move(platform))
    , throughput_(options.network_sample_capacity, options.network_ema_weight)
    , change_threshold_(options.network_change_threshold) {
    metrics_.samples = throughput_.samples();
    published_ = metrics_;
}

void NetworkMonitor::record_transfer(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) noexcept {
    throughput_.record(bytes, elapsed);
    poll();
}

void NetworkMonitor::poll() noexcept {
    std::optional<NetworkSample> reading;
    if (platform_) {
        reading = platform_->sample();
    }

    auto measured = throughput_.sample();
    if (reading) {
        // Platform type wins; fill in speed from measurements when it has none
        if (reading->speed_bps == 0 && measured) {
            reading->speed_bps = measured->speed_bps;
        }
        if (reading->effective_type == EffectiveType::unknown && reading->online && measured) {
            reading->effective_type = measured->effective_type;
        }
    } else {
        reading = measured;
    }

    if (!reading) return;

    NetworkMetrics next;
    next.speed_bps = reading->speed_bps;
    next.rtt = reading->rtt;
    next.effective_type = reading->effective_type;
    next.online = reading->online;
    next.last_measured = std::chrono::steady_clock::now();
    next.samples = throughput_.samples();

    const bool changed = significant(next);
    metrics_ = std::move(next);
    if (!changed) return;

    const EffectiveType previous = published_.effective_type;
    published_ = metrics_;
    has_published_ = true;

    log::get()->info("Network changed: {} -> {} ({} B/s, {})",
                     to_string(previous), to_string(metrics_.effective_type),
                     metrics_.speed_bps, metrics_.online ? "online" : "offline");
    if (handler_) {
        handler_(metrics_, previous);
    }
}

bool NetworkMonitor::significant(const NetworkMetrics& next) const noexcept {
    if (!has_published_) {
        return next.effective_type != EffectiveType::unknown || !next.online;
    }
    if (next.effective_type != published_.effective_type) return true;
    if (next.online != published_.online) return true;

    const auto base = published_.speed_bps;
    if (base == 0) return next.speed_bps != 0;
    const double delta = std::abs(static_cast<double>(next.speed_bps) - static_cast<double>(base));
    return delta / static_cast<double>(base) > change_threshold_;
}

} // namespace uplift::core
