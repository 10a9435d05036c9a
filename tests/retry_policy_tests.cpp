// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplift/core/error.hpp>
#include <uplift/core/retry_policy.hpp>

using namespace uplift::core;
using namespace std::chrono_literals;

TEST_CASE("RetryPolicy::next_delay without jitter", "[retry]") {
    RetryPolicy policy(1000ms, 30'000ms, 0.0, 1);

    CHECK(policy.next_delay(1) == 1000ms);
    CHECK(policy.next_delay(2) == 2000ms);
    CHECK(policy.next_delay(3) == 4000ms);
    CHECK(policy.next_delay(5) == 16'000ms);

    SECTION("Capped at max delay") {
        CHECK(policy.next_delay(6) == 30'000ms);
        CHECK(policy.next_delay(64) == 30'000ms);
    }

    SECTION("Attempt zero behaves like the first retry") {
        CHECK(policy.next_delay(0) == 1000ms);
    }
}

TEST_CASE("RetryPolicy::next_delay jitter bounds", "[retry]") {
    RetryPolicy policy(1000ms, 30'000ms, 0.2, 42);

    for (int i = 0; i < 200; ++i) {
        auto d = policy.next_delay(2);
        CHECK(d >= 1600ms);
        CHECK(d <= 2400ms);
    }

    SECTION("Same seed, same sequence") {
        RetryPolicy a(1000ms, 30'000ms, 0.2, 7);
        RetryPolicy b(1000ms, 30'000ms, 0.2, 7);
        for (std::uint32_t attempt = 1; attempt <= 5; ++attempt) {
            CHECK(a.next_delay(attempt) == b.next_delay(attempt));
        }
    }
}

TEST_CASE("RetryPolicy honours Retry-After on 429", "[retry]") {
    RetryPolicy policy(1000ms, 30'000ms, 0.0, 1);

    TransportError limited{make_error_code(UploadErrc::rate_limited), 429, "slow down", 5000ms};
    CHECK(policy.next_delay(1, limited) == 5000ms);

    SECTION("Still capped") {
        limited.retry_after = 120'000ms;
        CHECK(policy.next_delay(1, limited) == 30'000ms);
    }

    SECTION("Ignored for other errors") {
        TransportError server{make_error_code(UploadErrc::server_error), 503, "busy", 5000ms};
        CHECK(policy.next_delay(1, server) == 1000ms);
    }
}

TEST_CASE("RetryPolicy retryability", "[retry]") {
    SECTION("Retryable") {
        CHECK(RetryPolicy::is_retryable(UploadErrc::network_error));
        CHECK(RetryPolicy::is_retryable(UploadErrc::connection_lost));
        CHECK(RetryPolicy::is_retryable(UploadErrc::server_error));
        CHECK(RetryPolicy::is_retryable(UploadErrc::rate_limited));
        CHECK(RetryPolicy::is_retryable(UploadErrc::timeout));
    }

    SECTION("Not retryable") {
        CHECK_FALSE(RetryPolicy::is_retryable(UploadErrc::client_error));
        CHECK_FALSE(RetryPolicy::is_retryable(UploadErrc::unauthorized));
        CHECK_FALSE(RetryPolicy::is_retryable(UploadErrc::forbidden));
        CHECK_FALSE(RetryPolicy::is_retryable(UploadErrc::validation_failed));
        CHECK_FALSE(RetryPolicy::is_retryable(UploadErrc::cancelled));
    }

    SECTION("Budget") {
        CHECK(RetryPolicy::should_retry(UploadErrc::network_error, 0, 3));
        CHECK(RetryPolicy::should_retry(UploadErrc::network_error, 2, 3));
        CHECK_FALSE(RetryPolicy::should_retry(UploadErrc::network_error, 3, 3));
        CHECK_FALSE(RetryPolicy::should_retry(UploadErrc::client_error, 0, 3));
        CHECK_FALSE(RetryPolicy::should_retry(UploadErrc::network_error, 0, 0));
    }
}
