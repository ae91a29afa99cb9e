/**
 * @file TestPeriodicLoop.cpp
 * @brief Unit tests for engine::PeriodicLoop.
 */

#include <catch2/catch.hpp>

#include "ltr/engine/PeriodicLoop.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace ltr::engine {

using namespace std::chrono_literals;

TEST_CASE("PeriodicLoop runs its body until stopped", "[engine][loop]")
{
    PeriodicLoop loop{"TEST", 5ms};
    std::atomic<int> calls{0};

    REQUIRE(loop.start([&](core::TimePoint) { ++calls; }).has_value());
    REQUIRE(loop.isRunning());

    std::this_thread::sleep_for(60ms);
    loop.stop();

    REQUIRE_FALSE(loop.isRunning());
    REQUIRE(calls.load() >= 2);
    REQUIRE(loop.iterationCount() == static_cast<core::u64>(calls.load()));

    const int after = calls.load();
    std::this_thread::sleep_for(20ms);
    REQUIRE(calls.load() == after);
}

TEST_CASE("PeriodicLoop refuses a second start", "[engine][loop]")
{
    PeriodicLoop loop{"TEST", 10ms};
    REQUIRE(loop.start([](core::TimePoint) {}).has_value());

    const auto again = loop.start([](core::TimePoint) {});
    REQUIRE(again.error().code() == core::ErrorCode::kInvalidState);
    loop.stop();
}

TEST_CASE("PeriodicLoop rejects an empty body or period", "[engine][loop]")
{
    PeriodicLoop idle{"TEST", 0ms};
    REQUIRE(idle.start([](core::TimePoint) {}).error().code() == core::ErrorCode::kInvalidArgument);

    PeriodicLoop empty{"TEST", 10ms};
    REQUIRE(empty.start(PeriodicBody{}).error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("PeriodicLoop can be stopped from its own body", "[engine][loop]")
{
    PeriodicLoop loop{"TEST", 2ms};
    std::atomic<int> calls{0};

    REQUIRE(loop.start([&](core::TimePoint) {
        if (++calls == 3)
            loop.requestStop();
    }).has_value());

    std::this_thread::sleep_for(50ms);
    loop.stop();
    REQUIRE(calls.load() == 3);
}

TEST_CASE("PeriodicLoop survives a throwing body", "[engine][loop]")
{
    PeriodicLoop loop{"TEST", 2ms};
    std::atomic<int> calls{0};

    REQUIRE(loop.start([&](core::TimePoint) {
        if (++calls == 1)
            throw std::runtime_error("boom");
    }).has_value());

    std::this_thread::sleep_for(40ms);
    loop.stop();
    REQUIRE(calls.load() >= 2);
}

} // namespace ltr::engine
