// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>
#include <system_error>

namespace uplift::log {

constexpr const char* LOGGER_NAME = "uplift";

struct LogOptions {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string file;                        // Empty disables the file sink
    std::size_t max_file_size{5 * 1024 * 1024};
    std::size_t max_files{3};
    bool console{true};                      // Colour sink on stderr
};

// Create (or replace) the "uplift" logger
[[nodiscard]] std::error_code init(const LogOptions& options) noexcept;

// Shared logger; a stderr-only default is created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> get() noexcept;

} // namespace uplift::log
