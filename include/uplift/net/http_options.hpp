// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/config.hpp>
#include <cstdint>
#include <chrono>
#include <string>

namespace uplift::net {

constexpr const char* USER_AGENT = "Uplift/0.1";

// One worker per chunk at the highest concurrency the engine can reach,
// plus one per file for initiate/complete/abort
constexpr std::uint32_t DEFAULT_WORKER_THREADS =
    core::CONCURRENCY_CEILING * (core::CHUNK_CONCURRENCY_CEILING + 1);

struct HttpOptions {
    std::string api_base_url;                              // e.g. https://host/api
    std::string user_agent{USER_AGENT};
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds request_timeout{0};         // Zero leaves it to the engine deadline
    std::uint32_t worker_threads{DEFAULT_WORKER_THREADS};  // Blocking transfers run here
    bool verify_tls{true};
};

} // namespace uplift::net
