#include <catch2/catch_test_macros.hpp>

#include <mcp_host/pipeline/rate_limiter.hpp>

#include "../mocks/fake_clock.hpp"

#include <atomic>
#include <map>
#include <string>
#include <chrono>
#include <thread>
#include <vector>

using namespace mcp_host;
using mcp_host::testing::FakeClock;
using namespace std::chrono_literals;

namespace {

RateLimitSettings Limits(int default_limit, std::map<std::string, int> per_tool = {}) {
    RateLimitSettings settings;
    settings.default_limit_per_minute = default_limit;
    settings.tool_limits = std::move(per_tool);
    return settings;
}

} // namespace

TEST_CASE("SlidingWindowRateLimiter: N calls pass, N+1 is rejected", "[pipeline][rate_limit]") {
    FakeClock clock;
    SlidingWindowRateLimiter limiter(Limits(3), clock.Fn());

    CHECK(limiter.Admit("text"));
    CHECK(limiter.Admit("text"));
    CHECK(limiter.Admit("text"));
    CHECK_FALSE(limiter.Admit("text"));
    CHECK(limiter.CountInWindow("text") == 3);
}

TEST_CASE("SlidingWindowRateLimiter: window slides after 60 seconds", "[pipeline][rate_limit]") {
    FakeClock clock;
    SlidingWindowRateLimiter limiter(Limits(2), clock.Fn());

    CHECK(limiter.Admit("text"));
    clock.Advance(30s);
    CHECK(limiter.Admit("text"));
    CHECK_FALSE(limiter.Admit("text"));

    // First admission is exactly 60s old: evicted.
    clock.Advance(30s);
    CHECK(limiter.Admit("text"));
    CHECK_FALSE(limiter.Admit("text"));

    clock.Advance(61s);
    CHECK(limiter.CountInWindow("text") == 0);
    CHECK(limiter.Admit("text"));
}

TEST_CASE("SlidingWindowRateLimiter: rejected calls are not counted", "[pipeline][rate_limit]") {
    FakeClock clock;
    SlidingWindowRateLimiter limiter(Limits(1), clock.Fn());

    CHECK(limiter.Admit("a"));
    for (int i = 0; i < 5; ++i) {
        CHECK_FALSE(limiter.Admit("a"));
    }
    CHECK(limiter.CountInWindow("a") == 1);
    clock.Advance(60s);
    CHECK(limiter.Admit("a"));
}

TEST_CASE("SlidingWindowRateLimiter: keys are independent and case-insensitive", "[pipeline][rate_limit]") {
    FakeClock clock;
    SlidingWindowRateLimiter limiter(Limits(1), clock.Fn());

    CHECK(limiter.Admit("Text"));
    CHECK_FALSE(limiter.Admit("TEXT"));
    CHECK(limiter.Admit("datetime"));
}

TEST_CASE("SlidingWindowRateLimiter: per-tool limits override the default", "[pipeline][rate_limit]") {
    FakeClock clock;
    SlidingWindowRateLimiter limiter(Limits(1, {{"Http", 3}, {"free", 0}}), clock.Fn());

    CHECK(limiter.LimitFor("http") == 3);
    CHECK(limiter.LimitFor("other") == 1);

    CHECK(limiter.Admit("http"));
    CHECK(limiter.Admit("http"));
    CHECK(limiter.Admit("http"));
    CHECK_FALSE(limiter.Admit("http"));

    // A limit of zero is unlimited and creates no bucket.
    for (int i = 0; i < 100; ++i) {
        CHECK(limiter.Admit("free"));
    }
    CHECK(limiter.CountInWindow("free") == 0);
}

TEST_CASE("SlidingWindowRateLimiter: concurrent admissions never exceed the limit", "[pipeline][rate_limit]") {
    SlidingWindowRateLimiter limiter(Limits(50));
    std::atomic<int> admitted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                if (limiter.Admit("shared")) {
                    ++admitted;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(admitted == 50);
}

TEST_CASE("NullRateLimiter: admits everything", "[pipeline][rate_limit]") {
    NullRateLimiter limiter;
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(limiter.Admit("x"));
    }
}
