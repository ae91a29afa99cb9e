/**
 * @file TestThreadPool.cpp
 * @brief Unit tests for concurrency::ThreadPool.
 */

#include <catch2/catch.hpp>

#include "ltr/concurrency/ThreadPool.hpp"

#include <atomic>
#include <stdexcept>

namespace ltr::concurrency {

TEST_CASE("ThreadPool drains detached tasks on shutdown", "[concurrency][pool]")
{
    std::atomic<int> done{0};
    ThreadPool pool{4};
    REQUIRE(pool.threadCount() == 4);

    for (int i = 0; i < 100; ++i)
        REQUIRE(pool.enqueueDetached([&done] { done.fetch_add(1); }));

    pool.shutdown();
    REQUIRE(done.load() == 100);
    REQUIRE(pool.pendingCount() == 0);
}

TEST_CASE("ThreadPool rejects work once stopping", "[concurrency][pool]")
{
    ThreadPool pool{1};
    pool.shutdown();
    REQUIRE_FALSE(pool.enqueueDetached([] {}));
}

TEST_CASE("ThreadPool survives a throwing detached task", "[concurrency][pool]")
{
    ThreadPool pool{1, "SEND"};
    REQUIRE(pool.name() == "SEND");
    std::atomic<int> done{0};
    REQUIRE(pool.enqueueDetached([] { throw std::runtime_error{"send exploded"}; }));
    REQUIRE(pool.enqueueDetached([&done] { done.fetch_add(1); }));

    pool.shutdown();
    REQUIRE(done.load() == 1);
}

TEST_CASE("ThreadPool with zero threads still has a worker", "[concurrency][pool]")
{
    ThreadPool pool{0};
    REQUIRE(pool.threadCount() >= 1);
    REQUIRE(pool.name() == "POOL");
}

} // namespace ltr::concurrency
