// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the per-callsite logging rate limiter

#include <catch2/catch_test_macros.hpp>

#include "util/rate_limiter.hpp"
#include "util/time.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace chainsync::util;

TEST_CASE("RateLimiter: Burst capacity per callsite", "[rate_limiter]") {
    RateLimiter limiter;

    SECTION("First N messages allowed") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(limiter.should_log("sync:invalid_header", 200, 3600));
        }
        REQUIRE_FALSE(limiter.should_log("sync:invalid_header", 200, 3600));
    }

    SECTION("Callsites have independent buckets") {
        for (int i = 0; i < 200; ++i) {
            limiter.should_log("sync:1", 200, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("sync:1", 200, 3600));
        REQUIRE(limiter.should_log("sync:2", 200, 3600));
    }

    SECTION("Reset forgets every bucket") {
        for (int i = 0; i < 3; ++i) {
            limiter.should_log("sync:reset", 3, 3600);
        }
        REQUIRE_FALSE(limiter.should_log("sync:reset", 3, 3600));
        limiter.Reset();
        REQUIRE(limiter.should_log("sync:reset", 3, 3600));
    }
}

TEST_CASE("RateLimiter: Suppressed messages are counted", "[rate_limiter]") {
    MockTimeScope mock_time(2000000);
    RateLimiter limiter;

    for (int i = 0; i < 2; ++i) {
        REQUIRE(limiter.Check("peer:failed_request", 2, std::chrono::seconds(20)).allowed);
    }

    // Five calls land in an empty bucket
    for (int i = 0; i < 5; ++i) {
        auto decision = limiter.Check("peer:failed_request", 2, std::chrono::seconds(20));
        REQUIRE_FALSE(decision.allowed);
    }

    // One token back after 10s; the next allowed message reports what was dropped
    SetMockTime(2000010);
    auto decision = limiter.Check("peer:failed_request", 2, std::chrono::seconds(20));
    REQUIRE(decision.allowed);
    REQUIRE(decision.suppressed == 5);

    // The counter starts over
    SetMockTime(2000020);
    decision = limiter.Check("peer:failed_request", 2, std::chrono::seconds(20));
    REQUIRE(decision.allowed);
    REQUIRE(decision.suppressed == 0);
}

TEST_CASE("RateLimiter: Token refill over time", "[rate_limiter]") {
    MockTimeScope mock_time(1000000);
    RateLimiter limiter;

    SECTION("Tokens refill after period") {
        // 10 tokens, refilled at one per 10 seconds
        for (int i = 0; i < 10; ++i) {
            limiter.should_log("test:refill", 10, 100);
        }
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));

        SetMockTime(1000010);
        REQUIRE(limiter.should_log("test:refill", 10, 100));
        REQUIRE_FALSE(limiter.should_log("test:refill", 10, 100));
    }

    SECTION("Tokens cap at burst limit") {
        for (int i = 0; i < 5; ++i) {
            limiter.should_log("test:cap", 5, 1);
        }

        // Ten seconds could refill ten tokens, the bucket holds five
        SetMockTime(1000010);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(limiter.should_log("test:cap", 5, 1));
        }
        REQUIRE_FALSE(limiter.should_log("test:cap", 5, 1));
    }
}

TEST_CASE("RateLimiter: Misbehaving peer flood", "[rate_limiter][security]") {
    RateLimiter limiter;

    // A peer answering 1000 requests with invalid headers: only the burst reaches the log
    int logged_count = 0;
    for (int i = 0; i < 1000; ++i) {
        if (limiter.should_log("sync:bad_peer", 200, 3600)) {
            logged_count++;
        }
    }
    REQUIRE(logged_count == 200);
}

TEST_CASE("RateLimiter: Thread safety", "[rate_limiter][threading]") {
    RateLimiter& limiter = RateLimiter::instance();

    const int num_threads = 4;
    const int attempts_per_thread = 100;
    std::atomic<int> logged_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&limiter, &logged_count]() {
            for (int i = 0; i < attempts_per_thread; ++i) {
                if (limiter.should_log("rate_limiter_tests:threads", 200, 3600)) {
                    logged_count++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // 400 attempts against a 200-token bucket
    REQUIRE(logged_count == 200);
}
