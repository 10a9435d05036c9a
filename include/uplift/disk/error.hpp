// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <system_error>

namespace uplift::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    invalid_path,
    not_a_file,
    read_error,
    short_read,
    allocation_failed,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "uplift::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::file_not_found:     return "File not found";
            case DiskErrc::access_denied:      return "Access denied";
            case DiskErrc::invalid_path:       return "Invalid path";
            case DiskErrc::not_a_file:         return "Not a regular file";
            case DiskErrc::read_error:         return "Read error";
            case DiskErrc::short_read:         return "Unexpected end of file";
            case DiskErrc::allocation_failed:  return "Allocation failed";
            case DiskErrc::handle_invalid:     return "Invalid handle";
            default:                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace uplift::disk

namespace std {

template<>
struct is_error_code_enum<uplift::disk::DiskErrc> : true_type {};

} // namespace std
