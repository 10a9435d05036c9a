// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/error.hpp>

namespace uplift::core {

ErrorKind classify(std::error_code ec) noexcept {
    if (ec.category() != upload_errc_category()) {
        // Foreign categories: only a few generic conditions are transient
        if (ec == std::errc::timed_out) return ErrorKind::timeout;
        if (ec == std::errc::operation_canceled) return ErrorKind::cancelled;
        if (ec == std::errc::connection_reset ||
            ec == std::errc::connection_refused ||
            ec == std::errc::network_unreachable ||
            ec == std::errc::host_unreachable) {
            return ErrorKind::network;
        }
        return ErrorKind::validation;
    }

    switch (static_cast<UploadErrc>(ec.value())) {
        case UploadErrc::network_error:
        case UploadErrc::connection_lost:
        case UploadErrc::dns_error:
        case UploadErrc::ssl_error:
            return ErrorKind::network;
        case UploadErrc::timeout:
            return ErrorKind::timeout;
        case UploadErrc::server_error:
        case UploadErrc::rate_limited:
            return ErrorKind::server;
        case UploadErrc::client_error:
        case UploadErrc::unauthorized:
        case UploadErrc::forbidden:
        case UploadErrc::not_found:
        case UploadErrc::payload_too_large:
        case UploadErrc::missing_etag:
            return ErrorKind::client;
        case UploadErrc::cancelled:
            return ErrorKind::cancelled;
        case UploadErrc::finalize_failed:
            return ErrorKind::finalize;
        case UploadErrc::success:
        case UploadErrc::validation_failed:
        case UploadErrc::invalid_config:
        case UploadErrc::unknown_task:
        case UploadErrc::invalid_state:
        case UploadErrc::shut_down:
        case UploadErrc::read_failed:
            break;
    }
    return ErrorKind::validation;
}

UploadErrc errc_from_http_status(long status) noexcept {
    if (status >= 200 && status < 300) return UploadErrc::success;
    switch (status) {
        case 401: return UploadErrc::unauthorized;
        case 403: return UploadErrc::forbidden;
        case 404: return UploadErrc::not_found;
        case 408: return UploadErrc::timeout;
        case 413: return UploadErrc::payload_too_large;
        case 429: return UploadErrc::rate_limited;
        default:  break;
    }
    if (status >= 500 && status < 600) return UploadErrc::server_error;
    if (status >= 400 && status < 500) return UploadErrc::client_error;
    return UploadErrc::network_error;
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::validation: return "ValidationError";
        case ErrorKind::network:    return "NetworkError";
        case ErrorKind::server:     return "ServerError";
        case ErrorKind::client:     return "ClientError";
        case ErrorKind::timeout:    return "TimeoutError";
        case ErrorKind::cancelled:  return "CancelledError";
        case ErrorKind::finalize:   return "FinalizeError";
    }
    return "UnknownError";
}

} // namespace uplift::core
