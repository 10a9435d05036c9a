// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/queue_config.hpp>
#include <uplift/log.hpp>
#include <uplift/net/http_options.hpp>
#include <uplift/settings/error.hpp>
#include <expected>
#include <optional>
#include <string_view>
#include <system_error>

namespace uplift::settings {

// Everything a host reads from its JSON settings file
struct Settings {
    core::QueueConfig queue;
    core::EngineOptions engine;
    log::LogOptions log;
    net::HttpOptions http;
};

// Parse settings JSON. Missing keys keep their defaults, unknown keys are
// ignored, and a key with the wrong JSON type fails with invalid_type.
[[nodiscard]] std::expected<Settings, std::error_code>
parse_settings(std::string_view text) noexcept;

[[nodiscard]] std::expected<Settings, std::error_code>
load_settings(std::string_view path) noexcept;

// "trace" ... "critical", "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) noexcept;

} // namespace uplift::settings
