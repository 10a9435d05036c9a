// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/metrics.hpp>
#include <uplift/core/queue_config.hpp>
#include <uplift/settings/settings.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace uplift::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> files;
    std::string config_file;
    std::string api_url;
    std::string session_id;
    std::string token;
    std::uint32_t max_files{0};     // Zero keeps the configured value
    std::uint32_t max_chunks{0};
    std::optional<core::PriorityMode> priority_mode;
    std::optional<core::EffectiveType> network;
    bool dry_run{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;              // First argument error, empty when valid
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Settings file (if any) with command line overrides applied
[[nodiscard]] std::expected<settings::Settings, std::error_code>
resolve_settings(const CliArgs& args) noexcept;

// Upload every file in args.files; exit code 0 when all complete
[[nodiscard]] CliResult upload(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace uplift::cli
