// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/net/http_transport.hpp>
#include <uplift/log.hpp>
#include <boost/asio/post.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace uplift::net {

namespace {

using core::TransportError;
using core::UploadErrc;
using nlohmann::json;

constexpr std::chrono::milliseconds ABORT_TIMEOUT{30'000};
constexpr std::size_t MAX_ERROR_BODY = 256;

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* ptr = nullptr;

    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    [[nodiscard]] bool append(const std::string& header) noexcept {
        auto* next = curl_slist_append(ptr, header.c_str());
        if (!next) return false;
        ptr = next;
        return true;
    }
};

// Header callback, stores lower-cased names
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t body_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nitems;
    body->append(ptr, total);
    return total;
}

// Aborts the transfer once the operation is cancelled
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const std::stop_token*>(userdata);
    return stop && stop->stop_requested() ? 1 : 0;
}

std::string escape(CURL* curl, std::string_view text) {
    char* out = curl_easy_escape(curl, text.data(), static_cast<int>(text.size()));
    if (!out) return std::string(text);
    std::string escaped(out);
    curl_free(out);
    return escaped;
}

bool is_success(long status) noexcept {
    return status >= 200 && status < 300;
}

TransportError cancelled_error() {
    return TransportError{make_error_code(UploadErrc::cancelled), 0, "Request cancelled", std::nullopt};
}

// Server message from a JSON error body, or the start of the raw body
std::string error_message(long status, std::string_view body) {
    try {
        auto j = json::parse(body);
        if (j.is_object()) {
            for (const char* key : {"error", "message"}) {
                if (j.contains(key) && j[key].is_string()) {
                    return j[key].get<std::string>();
                }
            }
        }
    } catch (const json::exception&) {
        // Not JSON; fall through to the raw body
    }
    if (body.empty()) return fmt::format("HTTP {}", status);
    return fmt::format("HTTP {}: {}", status, body.substr(0, MAX_ERROR_BODY));
}

TransportError http_error(long status, std::string_view body) {
    return TransportError{make_error_code(core::errc_from_http_status(status)), status,
                          error_message(status, body), std::nullopt};
}

TransportError malformed(long status, std::string message) {
    return TransportError{make_error_code(UploadErrc::server_error), status, std::move(message), std::nullopt};
}

template<typename T, typename Fn>
std::expected<T, TransportError> guarded(Fn&& fn) noexcept {
    try {
        return fn();
    } catch (const std::exception& e) {
        return std::unexpected(TransportError{
            make_error_code(UploadErrc::network_error), 0, e.what(), std::nullopt});
    }
}

} // namespace

//=============================================================================
// Protocol helpers
//=============================================================================

core::UploadErrc errc_from_curl(int curl_code) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:
            return UploadErrc::success;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return UploadErrc::dns_error;
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return UploadErrc::connection_lost;
        case CURLE_OPERATION_TIMEDOUT:
            return UploadErrc::timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return UploadErrc::ssl_error;
        case CURLE_ABORTED_BY_CALLBACK:
            return UploadErrc::cancelled;
        default:
            return UploadErrc::network_error;
    }
}

std::optional<std::chrono::milliseconds> parse_retry_after(std::string_view value) noexcept {
    while (!value.empty() && value.front() == ' ') value.remove_prefix(1);
    while (!value.empty() && value.back() == ' ') value.remove_suffix(1);
    if (value.empty()) return std::nullopt;

    std::uint64_t seconds = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc{} || end != value.data() + value.size()) {
        return std::nullopt;
    }
    constexpr std::uint64_t max_seconds = 24 * 60 * 60;
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::min(seconds, max_seconds) * 1000)};
}

std::string part_url(std::string_view upload_url,
                     std::uint32_t part_number,
                     std::string_view escaped_upload_id) {
    const char sep = upload_url.find('?') == std::string_view::npos ? '?' : '&';
    return fmt::format("{}{}partNumber={}&uploadId={}", upload_url, sep, part_number, escaped_upload_id);
}

std::string initiate_body(const core::UploadMetadata& metadata) {
    json j;
    j["fileName"] = metadata.name;
    j["fileSize"] = metadata.size;
    j["mimeType"] = metadata.content_type;
    return j.dump();
}

std::string complete_body(const std::vector<core::CompletedChunk>& chunks) {
    json parts = json::array();
    for (const auto& chunk : chunks) {
        parts.push_back({{"PartNumber", chunk.index + 1}, {"ETag", chunk.etag}});
    }
    json j;
    j["parts"] = std::move(parts);
    return j.dump();
}

std::expected<UploadRoute, core::TransportError>
parse_initiate_response(long status, std::string_view body) noexcept {
    try {
        if (!is_success(status)) return std::unexpected(http_error(status, body));

        auto j = json::parse(body);
        if (!j.value("success", false)) {
            return std::unexpected(TransportError{make_error_code(UploadErrc::client_error), status,
                                                  error_message(status, body), std::nullopt});
        }
        const auto& data = j.at("data");
        UploadRoute route{data.at("uploadId").get<std::string>(), data.at("uploadUrl").get<std::string>()};
        if (route.upload_id.empty() || route.upload_url.empty()) {
            return std::unexpected(malformed(status, "Empty uploadId or uploadUrl"));
        }
        return route;
    } catch (const std::exception& e) {
        return std::unexpected(malformed(status, fmt::format("Malformed initiate response: {}", e.what())));
    }
}

std::expected<core::FinalizeResult, core::TransportError>
parse_complete_response(long status, std::string_view body) noexcept {
    try {
        if (!is_success(status)) return std::unexpected(http_error(status, body));

        core::FinalizeResult result;
        if (body.empty()) return result;

        auto j = json::parse(body);
        if (j.is_object() && j.contains("success") && !j["success"].get<bool>()) {
            return std::unexpected(TransportError{make_error_code(UploadErrc::finalize_failed), status,
                                                  error_message(status, body), std::nullopt});
        }
        if (j.is_object() && j.contains("data") && j["data"].is_object()) {
            const auto& data = j["data"];
            result.location = data.value("location", data.value("url", std::string{}));
            result.object_key = data.value("key", std::string{});
        }
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(malformed(status, fmt::format("Malformed complete response: {}", e.what())));
    }
}

//=============================================================================
// HttpTransport
//=============================================================================

HttpTransport::HttpTransport(HttpOptions options)
    : options_(std::move(options))
    , pool_(std::max<std::uint32_t>(options_.worker_threads, 1)) {
    while (!options_.api_base_url.empty() && options_.api_base_url.back() == '/') {
        options_.api_base_url.pop_back();
    }
}

HttpTransport::~HttpTransport() {
    pool_.join();
}

void HttpTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

std::expected<HttpTransport::Response, core::TransportError>
HttpTransport::perform(void* handle, const Request& request, const std::stop_token& stop) const {
    auto* curl = static_cast<CURL*>(handle);
    curl_easy_reset(curl);

    Response response;
    HeaderList headers;
    for (const auto& h : request.headers) {
        if (!headers.append(h)) {
            return std::unexpected(TransportError{
                make_error_code(UploadErrc::network_error), 0, "Out of memory building headers", std::nullopt});
        }
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    if (request.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.ptr);

    if (std::string_view(request.method) != "DELETE") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body ? request.body : "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body_size));
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::stop_token*>(&stop));

    log::get()->trace("HTTP {} {}", request.method, request.url);
    CURLcode result = curl_easy_perform(curl);

    if (stop.stop_requested()) {
        return std::unexpected(cancelled_error());
    }
    if (result != CURLE_OK) {
        return std::unexpected(TransportError{
            make_error_code(errc_from_curl(result)), 0, curl_easy_strerror(result), std::nullopt});
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    log::get()->debug("HTTP {} {} -> {}", request.method, request.url, response.status);
    return response;
}

std::vector<std::string> HttpTransport::json_headers(const core::SessionContext& session) const {
    std::vector<std::string> headers{"Content-Type: application/json", "Accept: application/json"};
    if (!session.auth_token.empty()) {
        headers.push_back(fmt::format("Authorization: Bearer {}", session.auth_token));
    }
    return headers;
}

std::string HttpTransport::session_url(void* curl, const core::SessionContext& session) const {
    return fmt::format("{}/sessions/{}", options_.api_base_url,
                       escape(static_cast<CURL*>(curl), session.session_id));
}

std::optional<HttpTransport::Route> HttpTransport::find_route(const std::string& upload_id) const {
    std::lock_guard lock(mutex_);
    auto it = routes_.find(upload_id);
    if (it == routes_.end()) return std::nullopt;
    return it->second;
}

void HttpTransport::initiate_multipart_upload(core::UploadMetadata metadata,
                                              std::stop_token stop,
                                              core::StartHandler started,
                                              core::InitiateHandler handler) {
    boost::asio::post(pool_, [this, metadata = std::move(metadata), stop = std::move(stop),
                              started = std::move(started), handler = std::move(handler)]() {
        auto result = guarded<std::string>([&]() -> std::expected<std::string, TransportError> {
            if (stop.stop_requested()) return std::unexpected(cancelled_error());

            CurlHandle curl(curl_easy_init());
            if (!curl.ptr) return std::unexpected(malformed(0, "curl_easy_init failed"));

            auto body = initiate_body(metadata);
            Request request{"POST", session_url(curl.ptr, metadata.session) + "/upload",
                            json_headers(metadata.session), body.data(), body.size(),
                            options_.request_timeout};

            if (started) started();

            auto response = perform(curl.ptr, request, stop);
            if (!response) return std::unexpected(response.error());

            auto route = parse_initiate_response(response->status, response->body);
            if (!route) {
                auto error = route.error();
                if (auto it = response->headers.find("retry-after"); it != response->headers.end()) {
                    error.retry_after = parse_retry_after(it->second);
                }
                return std::unexpected(std::move(error));
            }

            std::lock_guard lock(mutex_);
            routes_[route->upload_id] = Route{metadata.session, route->upload_url};
            return route->upload_id;
        });
        handler(std::move(result));
    });
}

void HttpTransport::upload_chunk(std::string upload_id,
                                 core::ChunkRequest request,
                                 std::stop_token stop,
                                 core::StartHandler started,
                                 core::ChunkHandler handler) {
    boost::asio::post(pool_, [this, upload_id = std::move(upload_id), chunk = std::move(request),
                              stop = std::move(stop), started = std::move(started),
                              handler = std::move(handler)]() {
        auto result = guarded<core::ChunkReceipt>([&]() -> std::expected<core::ChunkReceipt, TransportError> {
            if (stop.stop_requested()) return std::unexpected(cancelled_error());

            auto route = find_route(upload_id);
            if (!route) {
                return std::unexpected(TransportError{make_error_code(UploadErrc::not_found), 0,
                                                      fmt::format("Unknown upload {}", upload_id), std::nullopt});
            }

            CurlHandle curl(curl_easy_init());
            if (!curl.ptr) return std::unexpected(malformed(0, "curl_easy_init failed"));

            Request put{"PUT", part_url(route->upload_url, chunk.index + 1, escape(curl.ptr, upload_id)),
                        {"Content-Type: application/octet-stream"},
                        chunk.bytes.data(), chunk.bytes.size(), options_.request_timeout};

            if (started) started();

            auto response = perform(curl.ptr, put, stop);
            if (!response) return std::unexpected(response.error());

            if (!is_success(response->status)) {
                auto error = http_error(response->status, response->body);
                if (auto it = response->headers.find("retry-after"); it != response->headers.end()) {
                    error.retry_after = parse_retry_after(it->second);
                }
                return std::unexpected(std::move(error));
            }

            auto etag = response->headers.find("etag");
            if (etag == response->headers.end() || etag->second.empty()) {
                return std::unexpected(TransportError{make_error_code(UploadErrc::missing_etag),
                                                      response->status, "Response has no ETag header",
                                                      std::nullopt});
            }
            return core::ChunkReceipt{etag->second, chunk.bytes.size()};
        });
        handler(std::move(result));
    });
}

void HttpTransport::complete_multipart_upload(std::string upload_id,
                                              std::vector<core::CompletedChunk> chunks,
                                              std::stop_token stop,
                                              core::StartHandler started,
                                              core::FinalizeHandler handler) {
    boost::asio::post(pool_, [this, upload_id = std::move(upload_id), chunks = std::move(chunks),
                              stop = std::move(stop), started = std::move(started),
                              handler = std::move(handler)]() {
        auto result = guarded<core::FinalizeResult>([&]() -> std::expected<core::FinalizeResult, TransportError> {
            if (stop.stop_requested()) return std::unexpected(cancelled_error());

            auto route = find_route(upload_id);
            if (!route) {
                return std::unexpected(TransportError{make_error_code(UploadErrc::not_found), 0,
                                                      fmt::format("Unknown upload {}", upload_id), std::nullopt});
            }

            CurlHandle curl(curl_easy_init());
            if (!curl.ptr) return std::unexpected(malformed(0, "curl_easy_init failed"));

            auto body = complete_body(chunks);
            Request request{"POST",
                            fmt::format("{}/upload/{}/complete", session_url(curl.ptr, route->session),
                                        escape(curl.ptr, upload_id)),
                            json_headers(route->session), body.data(), body.size(),
                            options_.request_timeout};

            if (started) started();

            auto response = perform(curl.ptr, request, stop);
            if (!response) return std::unexpected(response.error());

            auto finalized = parse_complete_response(response->status, response->body);
            if (!finalized) {
                auto error = finalized.error();
                if (auto it = response->headers.find("retry-after"); it != response->headers.end()) {
                    error.retry_after = parse_retry_after(it->second);
                }
                return std::unexpected(std::move(error));
            }

            std::lock_guard lock(mutex_);
            routes_.erase(upload_id);
            return *finalized;
        });
        handler(std::move(result));
    });
}

void HttpTransport::abort_multipart_upload(std::string upload_id, core::AbortHandler handler) {
    boost::asio::post(pool_, [this, upload_id = std::move(upload_id), handler = std::move(handler)]() {
        auto result = guarded<void>([&]() -> std::expected<void, TransportError> {
            std::optional<Route> route;
            {
                std::lock_guard lock(mutex_);
                if (auto it = routes_.find(upload_id); it != routes_.end()) {
                    route = std::move(it->second);
                    routes_.erase(it);
                }
            }
            if (!route) return {};

            CurlHandle curl(curl_easy_init());
            if (!curl.ptr) return std::unexpected(malformed(0, "curl_easy_init failed"));

            Request request{"DELETE",
                            fmt::format("{}/upload/{}", session_url(curl.ptr, route->session),
                                        escape(curl.ptr, upload_id)),
                            json_headers(route->session), nullptr, 0,
                            options_.request_timeout.count() > 0 ? options_.request_timeout : ABORT_TIMEOUT};

            const std::stop_token never;
            auto response = perform(curl.ptr, request, never);
            if (!response) return std::unexpected(response.error());

            // Already gone on the server side counts as aborted
            if (!is_success(response->status) && response->status != 404) {
                return std::unexpected(http_error(response->status, response->body));
            }
            return {};
        });
        handler(std::move(result));
    });
}

} // namespace uplift::net
