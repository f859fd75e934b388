#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "uplink/download/cancellation.hpp"
#include "uplink/download/progress.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace uplink;
using namespace std::chrono_literals;
using Catch::Approx;

// ═══════════════════════════════════════════════════════════════════════════
// ProgressSample
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProgressSample byte ticks", "[progress]") {
    SECTION("Percentage and speed") {
        const auto sample = ProgressSample::transfer(512 * 1024, 1024 * 1024, 0, 1s, 0);
        REQUIRE(sample.percentage == Approx(50.0));
        REQUIRE(sample.speed == Approx(0.5));
        REQUIRE_FALSE(sample.is_retrying);
    }

    SECTION("Resumed bytes do not count towards speed") {
        const auto sample = ProgressSample::transfer(6 * 1024 * 1024, 10 * 1024 * 1024, 4 * 1024 * 1024, 2s, 1);
        REQUIRE(sample.speed == Approx(1.0));
        REQUIRE(sample.percentage == Approx(60.0));
        REQUIRE(sample.retry_count == 1);
    }

    SECTION("Unknown total") {
        const auto sample = ProgressSample::transfer(1000, 0, 0, 1s, 0);
        REQUIRE(sample.percentage == 0.0);
        REQUIRE(sample.total == 0);
    }

    SECTION("No elapsed time") {
        const auto sample = ProgressSample::transfer(1000, 2000, 0, 0s, 0);
        REQUIRE(sample.speed == 0.0);
    }
}

TEST_CASE("ProgressSample retry notifications", "[progress][retry]") {
    const auto sample = ProgressSample::retry_notification(2, "Connection reset by peer");

    REQUIRE(sample.is_retrying);
    REQUIRE(sample.retry_count == 2);
    REQUIRE(sample.retry_reason == "Connection reset by peer");
    REQUIRE(sample.downloaded == 0);

    const auto j = sample.to_json();
    REQUIRE(j["is_retrying"] == true);
    REQUIRE(j["retry_reason"] == "Connection reset by peer");
}

TEST_CASE("ProgressSample JSON has a null reason for byte ticks", "[progress][json]") {
    const auto j = ProgressSample::transfer(10, 100, 0, 1s, 0).to_json();
    REQUIRE(j["retry_reason"].is_null());
    REQUIRE(j["downloaded"] == 10);
    REQUIRE(j["total"] == 100);
}

// ═══════════════════════════════════════════════════════════════════════════
// Observers and Throttle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CallbackProgressObserver forwards samples", "[progress]") {
    std::vector<ProgressSample> seen;
    CallbackProgressObserver observer([&seen](const ProgressSample& s) { seen.push_back(s); });

    observer.on_progress(ProgressSample::retry_notification(1, "timed out"));
    REQUIRE(seen.size() == 1);
    REQUIRE(seen.front().retry_reason == "timed out");

    CallbackProgressObserver empty(nullptr);
    empty.on_progress(ProgressSample{});
}

TEST_CASE("ProgressThrottle time-slices ticks", "[progress][throttle]") {
    using Clock = ProgressThrottle::Clock;

    SECTION("Interval gate") {
        ProgressThrottle throttle(100ms);
        const auto start = Clock::now();

        REQUIRE_FALSE(throttle.ready(start + 10ms));
        REQUIRE(throttle.ready(start + 150ms));
        REQUIRE_FALSE(throttle.ready(start + 200ms));
        REQUIRE(throttle.ready(start + 260ms));
    }

    SECTION("Zero interval lets everything through") {
        ProgressThrottle throttle(0ms);
        REQUIRE(throttle.ready());
        REQUIRE(throttle.ready());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// CancellationToken
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CancellationToken copies share state", "[cancel]") {
    CancellationToken token;
    CancellationToken copy = token;

    REQUIRE_FALSE(copy.is_cancelled());
    token.cancel();
    REQUIRE(copy.is_cancelled());
}

TEST_CASE("CancellationToken interrupts a sleep", "[cancel]") {
    CancellationToken token;

    SECTION("Uncancelled sleep runs to completion") {
        REQUIRE(token.sleep_for(5ms));
    }

    SECTION("Cancel wakes the sleeper early") {
        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(20ms);
            token.cancel();
        });

        const auto start = std::chrono::steady_clock::now();
        const bool completed = token.sleep_for(10s);
        const auto waited = std::chrono::steady_clock::now() - start;
        canceller.join();

        REQUIRE_FALSE(completed);
        REQUIRE(waited < 5s);
    }

    SECTION("Already cancelled returns immediately") {
        token.cancel();
        REQUIRE_FALSE(token.sleep_for(10s));
    }
}
