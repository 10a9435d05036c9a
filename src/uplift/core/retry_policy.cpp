// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/retry_policy.hpp>
#include <uplift/core/error.hpp>
#include <algorithm>
#include <cmath>

namespace uplift::core {

namespace {

// Keeps 2^(attempt-1) well inside double range; the cap applies long before
constexpr std::uint32_t MAX_EXPONENT = 30;

} // namespace

RetryPolicy::RetryPolicy(std::chrono::milliseconds base_delay,
                         std::chrono::milliseconds max_delay,
                         double jitter,
                         std::uint64_t seed) noexcept
    : base_delay_(base_delay)
    , max_delay_(max_delay)
    , jitter_(std::clamp(jitter, 0.0, 0.99))
    , engine_(seed) {
}

std::chrono::milliseconds RetryPolicy::next_delay(std::uint32_t attempt) noexcept {
    const std::uint32_t exponent = std::min(attempt > 0 ? attempt - 1 : 0u, MAX_EXPONENT);
    double delay = static_cast<double>(base_delay_.count()) * std::ldexp(1.0, static_cast<int>(exponent));

    if (jitter_ > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - jitter_, 1.0 + jitter_);
        delay *= dist(engine_);
    }

    const double cap = static_cast<double>(max_delay_.count());
    delay = std::clamp(delay, 0.0, cap);
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::llround(delay))};
}

std::chrono::milliseconds RetryPolicy::next_delay(std::uint32_t attempt,
                                                  const TransportError& error) noexcept {
    if (error.retry_after && error.code == UploadErrc::rate_limited) {
        return std::clamp(*error.retry_after, std::chrono::milliseconds::zero(), max_delay_);
    }
    return next_delay(attempt);
}

bool RetryPolicy::is_retryable(std::error_code ec) noexcept {
    switch (classify(ec)) {
        case ErrorKind::network:
        case ErrorKind::server:
        case ErrorKind::timeout:
            return true;
        case ErrorKind::validation:
        case ErrorKind::client:
        case ErrorKind::cancelled:
        case ErrorKind::finalize:
            break;
    }
    return false;
}

bool RetryPolicy::should_retry(std::error_code ec,
                               std::uint32_t attempt,
                               std::uint32_t max_attempts) noexcept {
    return is_retryable(ec) && attempt < max_attempts;
}

} // namespace uplift::core
