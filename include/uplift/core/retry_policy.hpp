// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/config.hpp>
#include <uplift/core/transport.hpp>
#include <cstdint>
#include <chrono>
#include <random>
#include <system_error>

namespace uplift::core {

// Exponential backoff with jitter and retryability decisions
class RetryPolicy {
public:
    RetryPolicy(std::chrono::milliseconds base_delay = BASE_RETRY_DELAY,
                std::chrono::milliseconds max_delay = MAX_RETRY_DELAY,
                double jitter = RETRY_JITTER,
                std::uint64_t seed = std::random_device{}()) noexcept;

    // base * 2^(attempt-1), +/- jitter, capped at max_delay
    [[nodiscard]] std::chrono::milliseconds next_delay(std::uint32_t attempt) noexcept;

    // Honors a server Retry-After on 429, otherwise next_delay(attempt)
    [[nodiscard]] std::chrono::milliseconds next_delay(std::uint32_t attempt,
                                                       const TransportError& error) noexcept;

    [[nodiscard]] static bool is_retryable(std::error_code ec) noexcept;

    // attempt is the number of retries already spent
    [[nodiscard]] static bool should_retry(std::error_code ec,
                                           std::uint32_t attempt,
                                           std::uint32_t max_attempts) noexcept;

    void base_delay(std::chrono::milliseconds delay) noexcept { base_delay_ = delay; }
    [[nodiscard]] std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }
    [[nodiscard]] std::chrono::milliseconds max_delay() const noexcept { return max_delay_; }
    [[nodiscard]] double jitter() const noexcept { return jitter_; }

    void seed(std::uint64_t value) noexcept { engine_.seed(value); }

private:
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    double jitter_;
    std::mt19937_64 engine_;
};

} // namespace uplift::core
