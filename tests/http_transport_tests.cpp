// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplift/core/queue_coordinator.hpp>
#include <uplift/net/http_transport.hpp>
#include "test_support.hpp"
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace uplift::net;
using uplift::core::UploadErrc;
using namespace std::chrono_literals;

namespace {

using boost::asio::ip::tcp;

// Session upload API and object store on 127.0.0.1, one thread per connection.
// Part uploads take `put_delay` to answer.
class LocalStore {
public:
    explicit LocalStore(std::chrono::milliseconds put_delay)
        : put_delay_(put_delay)
        , acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        accept();
        thread_ = std::thread([this] { io_.run(); });
    }

    ~LocalStore() {
        io_.stop();
        thread_.join();
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& w : workers) w.join();
    }

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    [[nodiscard]] std::string api_url() const { return fmt::format("http://127.0.0.1:{}/api", port_); }

    [[nodiscard]] int peak_parts() const noexcept { return peak_.load(); }

    [[nodiscard]] std::set<std::string> parts() const {
        std::lock_guard lock(mutex_);
        return parts_;
    }

    [[nodiscard]] std::size_t completions() const {
        std::lock_guard lock(mutex_);
        return completions_;
    }

private:
    struct Reply {
        int status{200};
        std::string headers;
        std::string body;
    };

    void accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) return;
            {
                std::lock_guard lock(mutex_);
                workers_.emplace_back([this, socket = std::move(socket)]() mutable { serve(socket); });
            }
            accept();
        });
    }

    void serve(tcp::socket& socket) {
        boost::system::error_code ec;
        boost::asio::streambuf buffer;
        const auto header_end = boost::asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec) return;

        std::string data(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_end(buffer.data()));
        const std::string head = data.substr(0, header_end);
        std::string body = data.substr(header_end);

        std::string lower;
        for (char c : head) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        std::size_t content_length = 0;
        if (auto pos = lower.find("content-length:"); pos != std::string::npos) {
            content_length = std::stoul(head.substr(pos + 15));
        }
        if (lower.find("expect: 100-continue") != std::string::npos) {
            boost::asio::write(socket, boost::asio::buffer(std::string("HTTP/1.1 100 Continue\r\n\r\n")), ec);
            if (ec) return;
        }
        if (body.size() < content_length) {
            std::string rest(content_length - body.size(), '\0');
            boost::asio::read(socket, boost::asio::buffer(rest), ec);
            if (ec) return;
            body += rest;
        }

        const auto method = head.substr(0, head.find(' '));
        const auto target_start = head.find(' ') + 1;
        const auto target = head.substr(target_start, head.find(' ', target_start) - target_start);

        const Reply reply = route(method, target, body.size());
        const auto text = fmt::format("HTTP/1.1 {} OK\r\nContent-Length: {}\r\nConnection: close\r\n{}\r\n{}",
                                      reply.status, reply.body.size(), reply.headers, reply.body);
        boost::asio::write(socket, boost::asio::buffer(text), ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    Reply route(const std::string& method, const std::string& target, std::size_t body_size) {
        if (method == "POST" && target.ends_with("/upload")) {
            std::lock_guard lock(mutex_);
            const auto id = fmt::format("u-{}", ++uploads_);
            nlohmann::json j{{"success", true},
                             {"data", {{"uploadId", id},
                                       {"uploadUrl", fmt::format("http://127.0.0.1:{}/store/{}", port_, id)}}}};
            return {200, "Content-Type: application/json\r\n", j.dump()};
        }
        if (method == "PUT" && target.starts_with("/store/")) {
            const int now = ++active_;
            int peak = peak_.load();
            while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}
            std::this_thread::sleep_for(put_delay_);
            --active_;

            const auto part = target.substr(target.find("partNumber=") + 11);
            const auto number = part.substr(0, part.find('&'));
            std::lock_guard lock(mutex_);
            parts_.insert(fmt::format("{}#{}", target.substr(7, target.find('?') - 7), number));
            return {200, fmt::format("ETag: \"etag-{}-{}\"\r\n", number, body_size), ""};
        }
        if (method == "POST" && target.ends_with("/complete")) {
            std::lock_guard lock(mutex_);
            ++completions_;
            nlohmann::json j{{"success", true}, {"data", {{"location", "http://cdn.example.com/obj"}}}};
            return {200, "Content-Type: application/json\r\n", j.dump()};
        }
        if (method == "DELETE") {
            return {204, "", ""};
        }
        return {404, "", ""};
    }

    std::chrono::milliseconds put_delay_;
    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    unsigned short port_{0};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<std::thread> workers_;
    std::set<std::string> parts_;
    std::size_t completions_{0};
    int uploads_{0};
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

} // namespace

TEST_CASE("errc_from_curl", "[http]") {
    CHECK(errc_from_curl(CURLE_OK) == UploadErrc::success);
    CHECK(errc_from_curl(CURLE_COULDNT_RESOLVE_HOST) == UploadErrc::dns_error);
    CHECK(errc_from_curl(CURLE_COULDNT_CONNECT) == UploadErrc::connection_lost);
    CHECK(errc_from_curl(CURLE_RECV_ERROR) == UploadErrc::connection_lost);
    CHECK(errc_from_curl(CURLE_OPERATION_TIMEDOUT) == UploadErrc::timeout);
    CHECK(errc_from_curl(CURLE_PEER_FAILED_VERIFICATION) == UploadErrc::ssl_error);
    CHECK(errc_from_curl(CURLE_ABORTED_BY_CALLBACK) == UploadErrc::cancelled);
    CHECK(errc_from_curl(CURLE_UNSUPPORTED_PROTOCOL) == UploadErrc::network_error);
}

TEST_CASE("parse_retry_after", "[http]") {
    CHECK(parse_retry_after("5") == 5000ms);
    CHECK(parse_retry_after(" 12 ") == 12'000ms);
    CHECK(parse_retry_after("0") == 0ms);

    SECTION("Capped at a day") {
        CHECK(parse_retry_after("999999999") == std::chrono::milliseconds{24 * 60 * 60 * 1000});
    }

    SECTION("Dates and garbage are ignored") {
        CHECK_FALSE(parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
        CHECK_FALSE(parse_retry_after("-3").has_value());
        CHECK_FALSE(parse_retry_after("").has_value());
        CHECK_FALSE(parse_retry_after("10s").has_value());
    }
}

TEST_CASE("part_url appends the part query", "[http]") {
    CHECK(part_url("https://s3.example.com/bucket/key", 3, "abc") ==
          "https://s3.example.com/bucket/key?partNumber=3&uploadId=abc");
    CHECK(part_url("https://s3.example.com/key?X-Amz-Signature=sig", 1, "id%2F1") ==
          "https://s3.example.com/key?X-Amz-Signature=sig&partNumber=1&uploadId=id%2F1");
}

TEST_CASE("Request bodies", "[http]") {
    SECTION("Initiate") {
        auto body = nlohmann::json::parse(initiate_body({"clip.mp4", 1234, "video/mp4", {}}));
        CHECK(body["fileName"] == "clip.mp4");
        CHECK(body["fileSize"] == 1234);
        CHECK(body["mimeType"] == "video/mp4");
    }

    SECTION("Complete numbers parts from one") {
        auto body = nlohmann::json::parse(complete_body({{0, "\"e0\"", 10}, {1, "\"e1\"", 10}}));
        REQUIRE(body["parts"].size() == 2);
        CHECK(body["parts"][0]["PartNumber"] == 1);
        CHECK(body["parts"][0]["ETag"] == "\"e0\"");
        CHECK(body["parts"][1]["PartNumber"] == 2);
    }
}

TEST_CASE("parse_initiate_response", "[http]") {
    SECTION("Success") {
        auto route = parse_initiate_response(200, R"({"success": true,
            "data": {"uploadId": "u-1", "uploadUrl": "https://s3.example.com/k"}})");
        REQUIRE(route);
        CHECK(route->upload_id == "u-1");
        CHECK(route->upload_url == "https://s3.example.com/k");
    }

    SECTION("HTTP errors carry the server message") {
        auto route = parse_initiate_response(401, R"({"error": "Session expired"})");
        REQUIRE_FALSE(route);
        CHECK(route.error().code == UploadErrc::unauthorized);
        CHECK(route.error().http_status == 401);
        CHECK(route.error().message == "Session expired");

        auto plain = parse_initiate_response(503, "busy");
        REQUIRE_FALSE(plain);
        CHECK(plain.error().code == UploadErrc::server_error);
        CHECK(plain.error().message == "HTTP 503: busy");
    }

    SECTION("Refused by the API") {
        auto route = parse_initiate_response(200, R"({"success": false, "message": "Quota exceeded"})");
        REQUIRE_FALSE(route);
        CHECK(route.error().code == UploadErrc::client_error);
        CHECK(route.error().message == "Quota exceeded");
    }

    SECTION("Malformed") {
        auto missing = parse_initiate_response(200, R"({"success": true, "data": {}})");
        REQUIRE_FALSE(missing);
        CHECK(missing.error().code == UploadErrc::server_error);

        auto empty = parse_initiate_response(200, R"({"success": true, "data": {"uploadId": "", "uploadUrl": "x"}})");
        REQUIRE_FALSE(empty);
        CHECK(empty.error().code == UploadErrc::server_error);

        auto garbage = parse_initiate_response(200, "<html>");
        REQUIRE_FALSE(garbage);
        CHECK(garbage.error().code == UploadErrc::server_error);
    }
}

TEST_CASE("parse_complete_response", "[http]") {
    SECTION("Location and key") {
        auto result = parse_complete_response(200, R"({"success": true,
            "data": {"location": "https://cdn.example.com/a.mp4", "key": "s/a.mp4"}})");
        REQUIRE(result);
        CHECK(result->location == "https://cdn.example.com/a.mp4");
        CHECK(result->object_key == "s/a.mp4");
    }

    SECTION("Url fallback") {
        auto result = parse_complete_response(200, R"({"data": {"url": "https://cdn.example.com/b"}})");
        REQUIRE(result);
        CHECK(result->location == "https://cdn.example.com/b");
        CHECK(result->object_key.empty());
    }

    SECTION("Empty body is success") {
        auto result = parse_complete_response(204, "");
        REQUIRE(result);
        CHECK(result->location.empty());
    }

    SECTION("Rejected") {
        auto result = parse_complete_response(200, R"({"success": false, "error": "Part mismatch"})");
        REQUIRE_FALSE(result);
        CHECK(result.error().code == UploadErrc::finalize_failed);
        CHECK(result.error().message == "Part mismatch");

        auto http = parse_complete_response(404, "");
        REQUIRE_FALSE(http);
        CHECK(http.error().code == UploadErrc::not_found);
        CHECK(http.error().message == "HTTP 404");
    }
}

TEST_CASE("HttpTransport uploads through a saturated worker pool", "[http][integration]") {
    using namespace uplift::core;

    // Requests go straight to the local server
    ::setenv("NO_PROXY", "127.0.0.1,localhost", 1);
    ::setenv("no_proxy", "127.0.0.1,localhost", 1);
    HttpTransport::global_init();

    constexpr std::uint64_t CHUNK = 16 * 1024;

    boost::asio::io_context io;
    LocalStore store(200ms);

    // Eight concurrent parts share two workers, so the last wave waits far
    // longer than the chunk timeout before it is sent
    HttpOptions http;
    http.api_base_url = store.api_url();
    http.worker_threads = 2;
    HttpTransport transport(http);

    QueueConfig config;
    config.max_concurrent_files = 2;
    config.max_concurrent_chunks = 4;
    config.retry_attempts = 0;
    config.adaptive_optimization = false;
    config.network_optimization = false;

    EngineOptions options;
    options.min_chunk_size = CHUNK;
    options.default_chunk_size = CHUNK;
    options.chunk_timeout = 500ms;
    options.finalize_timeout = 5s;
    options.optimization_interval = 0ms;
    options.network_poll_interval = 0ms;

    {
        QueueCoordinator queue(io.get_executor(), transport, config, options);

        std::vector<UploadCompleted> completed;
        std::vector<UploadError> errors;
        auto on_done = queue.subscribe(EventKind::upload_completed, [&](const Event& e) {
            completed.push_back(std::get<UploadCompleted>(e));
        });
        auto on_error = queue.subscribe(EventKind::upload_error, [&](const Event& e) {
            errors.push_back(std::get<UploadError>(e));
        });

        const SessionContext session{"s-1", "token", {}};
        REQUIRE(queue.submit(MemoryPayload::filled("a.bin", 4 * CHUNK), session));
        REQUIRE(queue.submit(MemoryPayload::filled("b.bin", 4 * CHUNK), session));

        REQUIRE(uplift::test::run_until(io, [&] { return completed.size() + errors.size() == 2; }));

        for (const auto& e : errors) {
            FAIL_CHECK("Upload failed: " << e.error.message);
        }
        REQUIRE(completed.size() == 2);
        for (const auto& done : completed) {
            CHECK(done.total_retries == 0);
            CHECK(done.result.location == "http://cdn.example.com/obj");
        }
    }

    CHECK(store.peak_parts() == 2);
    CHECK(store.parts().size() == 8);
    CHECK(store.completions() == 2);

    HttpTransport::global_cleanup();
}
