// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/metrics.hpp>
#include <uplift/core/queue_config.hpp>
#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <chrono>
#include <optional>

namespace uplift::core {

// Feedback loop over recent outcomes and chunk speeds
class PerformanceOptimizer {
public:
    // Changes proposed by one evaluation; unset fields stay as they are
    struct Adjustment {
        std::optional<std::uint32_t> max_concurrent_files;
        std::optional<std::uint32_t> max_concurrent_chunks;
        std::optional<std::uint64_t> chunk_size;

        [[nodiscard]] bool empty() const noexcept {
            return !max_concurrent_files && !max_concurrent_chunks && !chunk_size;
        }
    };

    explicit PerformanceOptimizer(const EngineOptions& options);

    // Task-level result; cancelled tasks are not recorded
    void record_outcome(bool success) noexcept;

    // One successful chunk transfer
    void record_transfer(std::uint64_t bytes, std::chrono::steady_clock::duration elapsed) noexcept;

    void active_concurrency(std::uint32_t count) noexcept { metrics_.active_concurrency = count; }

    // successes / (successes + failures) over the window, 1.0 when empty
    [[nodiscard]] double success_rate() const noexcept;

    // Mean of recent chunk speeds, 0 when none
    [[nodiscard]] std::uint64_t measured_speed() const noexcept;

    [[nodiscard]] std::size_t outcome_count() const noexcept { return outcomes_.size(); }

    // Decide the next configuration; expected_speed is the network's estimate
    [[nodiscard]] Adjustment evaluate(const QueueConfig& config,
                                      std::uint64_t chunk_size,
                                      std::optional<std::uint64_t> expected_speed) noexcept;

    [[nodiscard]] PerformanceMetrics metrics() const noexcept;

private:
    EngineOptions options_;
    boost::circular_buffer<bool> outcomes_;
    boost::circular_buffer<std::uint64_t> speeds_;
    PerformanceMetrics metrics_;
    double speed_ema_{0.0};
};

} // namespace uplift::core
