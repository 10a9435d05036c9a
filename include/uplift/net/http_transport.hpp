// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/error.hpp>
#include <uplift/core/transport.hpp>
#include <uplift/net/http_options.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace uplift::net {

// Location of an open multipart upload
struct UploadRoute {
    std::string upload_id;
    std::string upload_url;
};

// Map a CURLcode onto the upload taxonomy
[[nodiscard]] core::UploadErrc errc_from_curl(int curl_code) noexcept;

// Retry-After in delta-seconds; HTTP dates are not honoured
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_retry_after(std::string_view value) noexcept;

// Append partNumber/uploadId query parameters to a presigned URL
[[nodiscard]] std::string part_url(std::string_view upload_url,
                                   std::uint32_t part_number,
                                   std::string_view escaped_upload_id);

// JSON bodies of the session upload API
[[nodiscard]] std::string initiate_body(const core::UploadMetadata& metadata);
[[nodiscard]] std::string complete_body(const std::vector<core::CompletedChunk>& chunks);

[[nodiscard]] std::expected<UploadRoute, core::TransportError>
parse_initiate_response(long status, std::string_view body) noexcept;

[[nodiscard]] std::expected<core::FinalizeResult, core::TransportError>
parse_complete_response(long status, std::string_view body) noexcept;

// libcurl transport for the presigned multipart protocol.
// Blocking transfers run on an internal thread pool; handlers are
// invoked on pool threads.
class HttpTransport final : public core::Transport {
public:
    explicit HttpTransport(HttpOptions options);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    void initiate_multipart_upload(core::UploadMetadata metadata,
                                   std::stop_token stop,
                                   core::StartHandler started,
                                   core::InitiateHandler handler) override;

    void upload_chunk(std::string upload_id,
                      core::ChunkRequest request,
                      std::stop_token stop,
                      core::StartHandler started,
                      core::ChunkHandler handler) override;

    void complete_multipart_upload(std::string upload_id,
                                   std::vector<core::CompletedChunk> chunks,
                                   std::stop_token stop,
                                   core::StartHandler started,
                                   core::FinalizeHandler handler) override;

    void abort_multipart_upload(std::string upload_id,
                                core::AbortHandler handler) override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    struct Route {
        core::SessionContext session;
        std::string upload_url;
    };

    struct Request {
        const char* method{"GET"};
        std::string url;
        std::vector<std::string> headers;
        const void* body{nullptr};
        std::size_t body_size{0};
        std::chrono::milliseconds timeout{0};
    };

    struct Response {
        long status{0};
        std::map<std::string, std::string> headers;   // Lower-cased names
        std::string body;
    };

    [[nodiscard]] std::expected<Response, core::TransportError>
    perform(void* curl, const Request& request, const std::stop_token& stop) const;

    [[nodiscard]] std::vector<std::string> json_headers(const core::SessionContext& session) const;
    [[nodiscard]] std::string session_url(void* curl, const core::SessionContext& session) const;
    [[nodiscard]] std::optional<Route> find_route(const std::string& upload_id) const;

    HttpOptions options_;
    boost::asio::thread_pool pool_;

    mutable std::mutex mutex_;
    std::map<std::string, Route> routes_;
};

} // namespace uplift::net
