// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dnl/core/connection_limiter.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace dnl::core;
using namespace std::chrono_literals;

TEST_CASE("ConnectionLimiter permits", "[connection_limiter]") {
    ConnectionLimiter limiter(2);
    CHECK(limiter.capacity() == 2);

    auto a = limiter.try_acquire();
    auto b = limiter.try_acquire();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(!limiter.try_acquire().has_value());

    SECTION("Destroying a permit frees the slot") {
        a.reset();
        CHECK(limiter.try_acquire().has_value());
    }

    SECTION("Moved-from permits do not double release") {
        ConnectionLimiter::Permit moved = std::move(*b);
        b.reset();
        CHECK(!limiter.try_acquire().has_value());
        moved.release();
        moved.release();
        auto c = limiter.try_acquire();
        CHECK(c.has_value());
        CHECK(!limiter.try_acquire().has_value());
    }
}

TEST_CASE("ConnectionLimiter acquire is interruptible", "[connection_limiter]") {
    ConnectionLimiter limiter(1);
    auto held = limiter.try_acquire();
    REQUIRE(held.has_value());

    std::stop_source stop;
    std::jthread stopper([&] {
        std::this_thread::sleep_for(100ms);
        stop.request_stop();
    });

    auto waited = limiter.acquire(stop.get_token());
    CHECK(!waited.has_value());
}

TEST_CASE("ConnectionLimiter bounds concurrency", "[connection_limiter]") {
    ConnectionLimiter limiter(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < 12; ++t) {
            workers.emplace_back([&] {
                auto permit = limiter.acquire();
                REQUIRE(permit.has_value());
                auto now = ++running;
                auto seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                std::this_thread::sleep_for(10ms);
                --running;
            });
        }
    }
    CHECK(peak <= 3);
    CHECK(peak >= 1);
}
