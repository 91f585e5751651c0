#include <catch2/catch_test_macros.hpp>
#include "core/clock.hpp"
#include "core/request_context.hpp"
#include "mocks/mock_clock.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

using namespace shedq;
using namespace std::chrono_literals;

TEST_CASE("ManualClock: moves only when advanced", "[clock]") {
    ManualClock clock;
    const TimePoint start = clock.now();
    CHECK(clock.now() == start);

    clock.advance(250ms);
    CHECK(clock.now() == start + 250ms);

    clock.set(start);
    CHECK(clock.now() == start);
}

TEST_CASE("SystemClock: is monotonic", "[clock]") {
    SystemClock clock;
    const TimePoint a = clock.now();
    const TimePoint b = clock.now();
    CHECK(b >= a);
}

TEST_CASE("RequestContext: live until cancelled", "[context]") {
    auto clock = std::make_shared<ManualClock>();
    auto ctx = RequestContext::background(clock);

    CHECK_FALSE(ctx->err().has_value());
    CHECK_FALSE(ctx->deadline().has_value());

    ctx->cancel();
    REQUIRE(ctx->err().has_value());
    CHECK(*ctx->err() == ContextError::CANCELLED);
    CHECK(ctx->is_cancelled());

    // Second cancel is a no-op
    ctx->cancel();
    CHECK(*ctx->err() == ContextError::CANCELLED);
}

TEST_CASE("RequestContext: deadline follows the injected clock", "[context]") {
    auto clock = std::make_shared<ManualClock>();
    auto ctx = RequestContext::with_timeout(clock, 100ms);

    REQUIRE(ctx->deadline().has_value());
    CHECK(*ctx->deadline() == clock->now() + 100ms);
    CHECK_FALSE(ctx->err().has_value());

    clock->advance(99ms);
    CHECK_FALSE(ctx->err().has_value());

    clock->advance(1ms);
    REQUIRE(ctx->err().has_value());
    CHECK(*ctx->err() == ContextError::DEADLINE_EXCEEDED);
    CHECK(std::string(context_error_to_string(*ctx->err())) == "deadline exceeded");
}

TEST_CASE("RequestContext: wait_done returns true on cancel", "[context]") {
    auto ctx = RequestContext::background(std::make_shared<SystemClock>());
    std::stop_source never;

    std::atomic<bool> woke{false};
    std::thread waiter([&] {
        woke = ctx->wait_done(never.get_token());
    });

    std::this_thread::sleep_for(20ms);
    ctx->cancel();
    waiter.join();

    CHECK(woke.load());
}

TEST_CASE("RequestContext: wait_done returns false on stop", "[context]") {
    auto ctx = RequestContext::background(std::make_shared<SystemClock>());
    std::stop_source stop;

    std::atomic<bool> result{true};
    std::thread waiter([&] {
        result = ctx->wait_done(stop.get_token());
    });

    std::this_thread::sleep_for(20ms);
    stop.request_stop();
    waiter.join();

    CHECK_FALSE(result.load());
    CHECK_FALSE(ctx->err().has_value());
}

TEST_CASE("RequestContext: wait_done wakes when a manual deadline passes", "[context]") {
    auto clock = std::make_shared<ManualClock>();
    auto ctx = RequestContext::with_timeout(clock, 1s);
    std::stop_source never;

    std::atomic<bool> woke{false};
    std::thread waiter([&] {
        woke = ctx->wait_done(never.get_token());
    });

    std::this_thread::sleep_for(20ms);
    CHECK_FALSE(woke.load());

    clock->advance(1s);
    waiter.join();
    CHECK(woke.load());
}

TEST_CASE("RequestContext: wait_done sleeps until a real-time deadline", "[context]") {
    auto clock = std::make_shared<testing::CountingClock>();
    auto ctx = RequestContext::with_timeout(clock, 200ms);
    const uint64_t reads_before = clock->now_count();
    std::stop_source never;

    const auto started = std::chrono::steady_clock::now();
    CHECK(ctx->wait_done(never.get_token()));
    CHECK(std::chrono::steady_clock::now() - started >= 200ms);
    CHECK(ctx->err() == ContextError::DEADLINE_EXCEEDED);

    // 5ms polling would read the clock about 40 times
    CHECK(clock->now_count() - reads_before < 10);
}

TEST_CASE("RequestContext: done_token fires on cancel", "[context]") {
    auto ctx = RequestContext::background(std::make_shared<ManualClock>());
    const std::stop_token done = ctx->done_token();
    CHECK_FALSE(done.stop_requested());

    std::atomic<int> fired{0};
    std::stop_callback on_done(done, [&] { ++fired; });
    ctx->cancel();
    ctx->cancel();

    CHECK(done.stop_requested());
    CHECK(fired.load() == 1);
}

TEST_CASE("RequestContext: wait_done is immediate for a dead context", "[context]") {
    auto ctx = RequestContext::background(std::make_shared<SystemClock>());
    ctx->cancel();

    std::stop_source never;
    CHECK(ctx->wait_done(never.get_token()));
}

TEST_CASE("RequestContext: null clock falls back to the system clock", "[context]") {
    auto ctx = RequestContext::with_timeout(nullptr, 1h);
    REQUIRE(ctx->deadline().has_value());
    CHECK_FALSE(ctx->err().has_value());
}
