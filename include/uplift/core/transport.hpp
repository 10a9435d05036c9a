// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/types.hpp>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

namespace uplift::core {

// What the object store needs to open a multipart upload
struct UploadMetadata {
    std::string name;
    std::uint64_t size{0};
    std::string content_type;
    SessionContext session;
};

struct ChunkRequest {
    std::uint32_t index{0};        // Zero-based; the wire part number is index + 1
    std::uint64_t offset{0};
    std::vector<std::byte> bytes;
};

struct ChunkReceipt {
    std::string etag;
    std::uint64_t size{0};
};

struct CompletedChunk {
    std::uint32_t index{0};
    std::string etag;
    std::uint64_t size{0};
};

struct FinalizeResult {
    std::string location;
    std::string object_key;
};

// Failure reported by a transport operation
struct TransportError {
    std::error_code code;
    long http_status{0};                                  // Zero when no response
    std::string message;
    std::optional<std::chrono::milliseconds> retry_after; // Server-supplied backoff
};

// Signals that a request has left the local queue and is on the wire
using StartHandler = std::function<void()>;
using InitiateHandler = std::function<void(std::expected<std::string, TransportError>)>;
using ChunkHandler = std::function<void(std::expected<ChunkReceipt, TransportError>)>;
using FinalizeHandler = std::function<void(std::expected<FinalizeResult, TransportError>)>;
using AbortHandler = std::function<void(std::expected<void, TransportError>)>;

// Remote object store collaborator.
// Every completion handler is invoked exactly once, possibly from another
// thread; callers re-post onto their own executor. `started` is invoked at
// most once, before the completion, when the transport begins transmitting
// the request. Time spent queued inside the transport precedes it, so
// deadlines and throughput are measured from there. A request that fails or
// is cancelled before transmission completes without calling it.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void initiate_multipart_upload(UploadMetadata metadata,
                                           std::stop_token stop,
                                           StartHandler started,
                                           InitiateHandler handler) = 0;

    virtual void upload_chunk(std::string upload_id,
                              ChunkRequest request,
                              std::stop_token stop,
                              StartHandler started,
                              ChunkHandler handler) = 0;

    virtual void complete_multipart_upload(std::string upload_id,
                                           std::vector<CompletedChunk> chunks,
                                           std::stop_token stop,
                                           StartHandler started,
                                           FinalizeHandler handler) = 0;

    virtual void abort_multipart_upload(std::string upload_id,
                                        AbortHandler handler) = 0;
};

} // namespace uplift::core
