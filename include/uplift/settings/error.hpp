// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace uplift::settings {

enum class ConfigErrc {
    success = 0,
    file_not_found,
    read_error,
    parse_error,
    invalid_type,
    invalid_value,
};

namespace detail {

struct ConfigErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "uplift::settings";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ConfigErrc>(ev)) {
            case ConfigErrc::success:        return "Success";
            case ConfigErrc::file_not_found: return "Settings file not found";
            case ConfigErrc::read_error:     return "Failed to read settings file";
            case ConfigErrc::parse_error:    return "Settings file is not valid JSON";
            case ConfigErrc::invalid_type:   return "Setting has the wrong type";
            case ConfigErrc::invalid_value:  return "Setting value out of range";
            default:                         return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ConfigErrcCategory& config_errc_category() noexcept {
    static detail::ConfigErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ConfigErrc e) noexcept {
    return {static_cast<int>(e), config_errc_category()};
}

} // namespace uplift::settings

namespace std {

template<>
struct is_error_code_enum<uplift::settings::ConfigErrc> : true_type {};

} // namespace std
