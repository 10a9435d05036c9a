// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/config.hpp>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string_view>
#include <system_error>

namespace uplift::core {

enum class PriorityMode : std::uint8_t {
    fifo,
    smallest_first,
    largest_first
};

[[nodiscard]] std::string_view to_string(PriorityMode mode) noexcept;
[[nodiscard]] std::optional<PriorityMode> parse_priority_mode(std::string_view text) noexcept;

// Live queue configuration, mutable at any time
struct QueueConfig {
    std::uint32_t max_concurrent_files{DEFAULT_MAX_CONCURRENT_FILES};
    std::uint32_t max_concurrent_chunks{DEFAULT_MAX_CONCURRENT_CHUNKS};
    std::uint32_t retry_attempts{RETRY_COUNT};
    std::chrono::milliseconds base_retry_delay{BASE_RETRY_DELAY};
    PriorityMode priority_mode{PriorityMode::smallest_first};
    bool adaptive_optimization{true};
    bool network_optimization{true};

    bool operator==(const QueueConfig&) const = default;
};

// Partial update for QueueConfig; unset fields are left alone
struct QueueConfigPatch {
    std::optional<std::uint32_t> max_concurrent_files;
    std::optional<std::uint32_t> max_concurrent_chunks;
    std::optional<std::uint32_t> retry_attempts;
    std::optional<std::chrono::milliseconds> base_retry_delay;
    std::optional<PriorityMode> priority_mode;
    std::optional<bool> adaptive_optimization;
    std::optional<bool> network_optimization;
};

[[nodiscard]] std::error_code validate(const QueueConfig& config) noexcept;
[[nodiscard]] QueueConfig merged(const QueueConfig& base, const QueueConfigPatch& patch) noexcept;

// Empirical policy constants for the performance optimizer
struct OptimizerThresholds {
    double low_success_rate{0.8};
    double high_success_rate{0.95};
    double slow_speed_ratio{0.7};
    double fast_speed_ratio{1.2};
    double shrink_factor{0.8};
    double grow_factor{1.2};
};

// Engine tuning fixed at construction time
struct EngineOptions {
    std::uint64_t min_chunk_size{MIN_CHUNK_SIZE};
    std::uint64_t max_chunk_size{MAX_CHUNK_SIZE};
    std::uint64_t default_chunk_size{DEFAULT_CHUNK_SIZE};

    std::chrono::milliseconds max_retry_delay{MAX_RETRY_DELAY};
    double retry_jitter{RETRY_JITTER};

    std::chrono::milliseconds chunk_timeout{std::chrono::seconds{CHUNK_TIMEOUT_SEC}};
    std::chrono::milliseconds finalize_timeout{std::chrono::seconds{FINALIZE_TIMEOUT_SEC}};

    // Zero disables the periodic timer
    std::chrono::milliseconds optimization_interval{OPTIMIZATION_INTERVAL};
    std::chrono::milliseconds network_poll_interval{NETWORK_POLL_INTERVAL};

    std::size_t outcome_window{OUTCOME_WINDOW};
    std::size_t network_sample_capacity{NETWORK_SAMPLE_CAPACITY};
    double network_ema_weight{NETWORK_EMA_WEIGHT};
    double network_change_threshold{NETWORK_CHANGE_THRESHOLD};

    std::uint32_t concurrency_ceiling{CONCURRENCY_CEILING};
    std::uint32_t chunk_concurrency_ceiling{CHUNK_CONCURRENCY_CEILING};

    OptimizerThresholds thresholds;
};

[[nodiscard]] std::error_code validate(const EngineOptions& options) noexcept;

// Clamp a chunk size into the engine's bounds
[[nodiscard]] std::uint64_t clamp_chunk_size(std::uint64_t size, const EngineOptions& options) noexcept;

} // namespace uplift::core
