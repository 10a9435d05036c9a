// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/config.hpp>
#include <uplift/core/metrics.hpp>
#include <uplift/core/queue_config.hpp>
#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace uplift::core {

// One reading of connection quality
struct NetworkSample {
    EffectiveType effective_type{EffectiveType::unknown};
    std::uint64_t speed_bps{0};           // Zero when the source has no estimate
    std::chrono::milliseconds rtt{0};
    bool online{true};
};

// Source of connection quality readings
class NetworkSampler {
public:
    virtual ~NetworkSampler() = default;

    // nullopt when the source has nothing to report yet
    [[nodiscard]] virtual std::optional<NetworkSample> sample() noexcept = 0;
};

// Platform-reported readings pushed by the host (OS APIs, command line)
class ManualSampler final : public NetworkSampler {
public:
    ManualSampler() = default;
    explicit ManualSampler(NetworkSample initial) noexcept : current_(initial) {}

    // Thread-safe
    void set(NetworkSample sample) noexcept;
    void clear() noexcept;

    [[nodiscard]] std::optional<NetworkSample> sample() noexcept override;

private:
    std::mutex mutex_;
    std::optional<NetworkSample> current_;
};

// Measured fallback built from recent chunk transfer speeds
class ThroughputSampler final : public NetworkSampler {
public:
    explicit ThroughputSampler(std::size_t capacity = NETWORK_SAMPLE_CAPACITY,
                               double ema_weight = NETWORK_EMA_WEIGHT);

    // Record one completed transfer
    void record(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) noexcept;

    [[nodiscard]] std::optional<NetworkSample> sample() noexcept override;

    // Network Information API thresholds; rtt of zero is ignored
    [[nodiscard]] static EffectiveType classify(std::uint64_t speed_bps,
                                                std::chrono::milliseconds rtt) noexcept;

    [[nodiscard]] std::uint64_t estimate() const noexcept { return static_cast<std::uint64_t>(ema_); }
    [[nodiscard]] const boost::circular_buffer<std::uint64_t>& samples() const noexcept { return samples_; }

private:
    boost::circular_buffer<std::uint64_t> samples_;
    double weight_;
    double ema_{0.0};
};

struct ConcurrencyAdvice {
    std::uint32_t max_concurrent_files{0};
    std::uint32_t max_concurrent_chunks{0};
};

// Reference bands; unknown or offline yields no advice
[[nodiscard]] std::optional<ConcurrencyAdvice> recommended_concurrency(const NetworkMetrics& metrics) noexcept;
[[nodiscard]] std::optional<std::uint64_t> recommended_chunk_size(const NetworkMetrics& metrics,
                                                                  const EngineOptions& options) noexcept;

// Tracks connection quality and reports significant changes
class NetworkMonitor {
public:
    using ChangeHandler = std::function<void(const NetworkMetrics& current, EffectiveType previous)>;

    explicit NetworkMonitor(const EngineOptions& options,
                            std::shared_ptr<NetworkSampler> platform = nullptr);

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    void on_change(ChangeHandler handler) noexcept { handler_ = std::move(handler); }

    // Feed a measured chunk transfer and re-evaluate
    void record_transfer(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) noexcept;

    // Re-read the samplers and publish a change if one occurred
    void poll() noexcept;

    [[nodiscard]] const NetworkMetrics& metrics() const noexcept { return metrics_; }
    [[nodiscard]] NetworkSampler* platform_sampler() const noexcept { return platform_.get(); }
    [[nodiscard]] ThroughputSampler& throughput() noexcept { return throughput_; }

private:
    [[nodiscard]] bool significant(const NetworkMetrics& next) const noexcept;

    std::shared_ptr<NetworkSampler> platform_;
    ThroughputSampler throughput_;
    double change_threshold_;

    NetworkMetrics metrics_;
    NetworkMetrics published_;
    bool has_published_{false};
    ChangeHandler handler_;
};

} // namespace uplift::core
