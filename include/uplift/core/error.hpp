// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace uplift::core {

enum class UploadErrc {
    success = 0,
    validation_failed,
    invalid_config,
    unknown_task,
    invalid_state,
    shut_down,
    read_failed,
    network_error,
    connection_lost,
    dns_error,
    ssl_error,
    timeout,
    server_error,
    rate_limited,
    client_error,
    unauthorized,
    forbidden,
    not_found,
    payload_too_large,
    missing_etag,
    cancelled,
    finalize_failed,
};

// Coarse error taxonomy reported with task-level failures
enum class ErrorKind : std::uint8_t {
    validation,
    network,
    server,     // 5xx and 429
    client,     // 4xx other than 429
    timeout,
    cancelled,
    finalize
};

namespace detail {

struct UploadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "uplift::upload";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<UploadErrc>(ev)) {
            case UploadErrc::success:           return "Success";
            case UploadErrc::validation_failed: return "Invalid submission";
            case UploadErrc::invalid_config:    return "Invalid queue configuration";
            case UploadErrc::unknown_task:      return "Unknown task";
            case UploadErrc::invalid_state:     return "Operation not valid in current task state";
            case UploadErrc::shut_down:         return "Coordinator has been shut down";
            case UploadErrc::read_failed:       return "Failed to read payload";
            case UploadErrc::network_error:     return "Network error";
            case UploadErrc::connection_lost:   return "Connection lost";
            case UploadErrc::dns_error:         return "DNS resolution failed";
            case UploadErrc::ssl_error:         return "SSL/TLS error";
            case UploadErrc::timeout:           return "Operation timed out";
            case UploadErrc::server_error:      return "Server error (5xx)";
            case UploadErrc::rate_limited:      return "Rate limited (429)";
            case UploadErrc::client_error:      return "Request rejected (4xx)";
            case UploadErrc::unauthorized:      return "Not authorized (401)";
            case UploadErrc::forbidden:         return "Forbidden (403)";
            case UploadErrc::not_found:         return "Upload not found (404)";
            case UploadErrc::payload_too_large: return "Payload too large (413)";
            case UploadErrc::missing_etag:      return "Object store returned no ETag";
            case UploadErrc::cancelled:         return "Upload cancelled";
            case UploadErrc::finalize_failed:   return "Failed to finalize multipart upload";
            default:                            return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::UploadErrcCategory& upload_errc_category() noexcept {
    static detail::UploadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(UploadErrc e) noexcept {
    return {static_cast<int>(e), upload_errc_category()};
}

// Map any error code onto the task-level taxonomy
[[nodiscard]] ErrorKind classify(std::error_code ec) noexcept;

// Map an HTTP status onto UploadErrc (2xx maps to success)
[[nodiscard]] UploadErrc errc_from_http_status(long status) noexcept;

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// Failure surfaced once per task through upload-error
struct TaskError {
    ErrorKind kind{ErrorKind::network};
    std::error_code code;
    std::string message;
};

} // namespace uplift::core

namespace std {

template<>
struct is_error_code_enum<uplift::core::UploadErrc> : true_type {};

} // namespace std
