// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace uplift::core {

using TaskId = std::uint64_t;

// Opaque session data supplied by the caller and handed to the transport
struct SessionContext {
    std::string session_id;
    std::string auth_token;
    std::map<std::string, std::string> attributes;
};

// Upload task state machine
enum class TaskStatus : std::uint8_t {
    initializing, // Requesting a multipart upload id
    uploading,    // Chunks in flight
    paused,       // Paused by user or offline
    completing,   // Finalizing the multipart upload
    completed,    // All done
    error,        // Failed with error
    cancelled     // Cancelled by user
};

[[nodiscard]] constexpr bool is_terminal(TaskStatus s) noexcept {
    return s == TaskStatus::completed || s == TaskStatus::error || s == TaskStatus::cancelled;
}

[[nodiscard]] constexpr std::string_view to_string(TaskStatus s) noexcept {
    switch (s) {
        case TaskStatus::initializing: return "initializing";
        case TaskStatus::uploading:    return "uploading";
        case TaskStatus::paused:       return "paused";
        case TaskStatus::completing:   return "completing";
        case TaskStatus::completed:    return "completed";
        case TaskStatus::error:        return "error";
        case TaskStatus::cancelled:    return "cancelled";
    }
    return "unknown";
}

} // namespace uplift::core
