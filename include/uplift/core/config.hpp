// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <cstddef>

namespace uplift::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 5 * 1024 * 1024;         // 5 MB initial
constexpr std::uint64_t MIN_CHUNK_SIZE = 256 * 1024;                  // 256 KB
constexpr std::uint64_t MAX_CHUNK_SIZE = 50 * 1024 * 1024;            // 50 MB
constexpr std::uint64_t SLOW_NETWORK_CHUNK_SIZE = 1024 * 1024;        // 2g and below
constexpr std::uint64_t MEDIUM_NETWORK_CHUNK_SIZE = 5 * 1024 * 1024;  // 3g

constexpr std::uint32_t DEFAULT_MAX_CONCURRENT_FILES = 3;
constexpr std::uint32_t DEFAULT_MAX_CONCURRENT_CHUNKS = 4;
constexpr std::uint32_t CONCURRENCY_CEILING = 5;
constexpr std::uint32_t CHUNK_CONCURRENCY_CEILING = 8;

constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds BASE_RETRY_DELAY{1000};
constexpr std::chrono::milliseconds MAX_RETRY_DELAY{30'000};
constexpr double RETRY_JITTER = 0.2;

constexpr std::uint32_t CHUNK_TIMEOUT_SEC = 60;
constexpr std::uint32_t FINALIZE_TIMEOUT_SEC = 60;

constexpr std::chrono::milliseconds OPTIMIZATION_INTERVAL{10'000};
constexpr std::chrono::milliseconds NETWORK_POLL_INTERVAL{5'000};

constexpr std::size_t OUTCOME_WINDOW = 20;
constexpr std::size_t NETWORK_SAMPLE_CAPACITY = 10;
constexpr double NETWORK_EMA_WEIGHT = 0.3;
constexpr double NETWORK_CHANGE_THRESHOLD = 0.2;   // 20% speed move

// 4g chunk sizing targets this much transfer time per chunk
constexpr std::chrono::seconds TARGET_CHUNK_DURATION{2};

} // namespace uplift::core
