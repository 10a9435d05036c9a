// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string_view>

namespace uplift::core {

// Coarse connection quality bucket
enum class EffectiveType : std::uint8_t {
    unknown,
    slow_2g,
    g2,
    g3,
    g4
};

[[nodiscard]] constexpr std::string_view to_string(EffectiveType t) noexcept {
    switch (t) {
        case EffectiveType::unknown: return "unknown";
        case EffectiveType::slow_2g: return "slow-2g";
        case EffectiveType::g2:      return "2g";
        case EffectiveType::g3:      return "3g";
        case EffectiveType::g4:      return "4g";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<EffectiveType> parse_effective_type(std::string_view text) noexcept {
    if (text == "slow-2g") return EffectiveType::slow_2g;
    if (text == "2g") return EffectiveType::g2;
    if (text == "3g") return EffectiveType::g3;
    if (text == "4g") return EffectiveType::g4;
    if (text == "unknown") return EffectiveType::unknown;
    return std::nullopt;
}

// Current view of the connection
struct NetworkMetrics {
    std::uint64_t speed_bps{0};               // EMA, bytes per second
    std::chrono::milliseconds rtt{0};         // Zero when not reported
    EffectiveType effective_type{EffectiveType::unknown};
    bool online{true};
    std::chrono::steady_clock::time_point last_measured;
    boost::circular_buffer<std::uint64_t> samples;  // Recent raw chunk speeds
};

// Process-wide upload statistics
struct PerformanceMetrics {
    std::uint64_t total_uploads{0};
    std::uint64_t successful_uploads{0};
    std::uint64_t failed_uploads{0};
    std::uint64_t average_speed_bps{0};       // EMA over chunk transfers
    std::uint64_t total_bytes_uploaded{0};
    std::uint32_t active_concurrency{0};
    std::uint32_t optimal_concurrency{0};
    double success_rate{1.0};                 // Over the rolling outcome window
};

} // namespace uplift::core
