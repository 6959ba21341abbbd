/**
 * @file TestThreadPool.cpp
 * @brief Unit tests for hive::concurrency::ThreadPool.
 */

#include <catch2/catch.hpp>

#include <hive/concurrency/ThreadPool.hpp>

#include <atomic>
#include <latch>
#include <vector>

using namespace hive;
using namespace hive::concurrency;

TEST_CASE("ThreadPool runs tasks and returns their results", "[concurrency][threadpool]")
{
    ThreadPool pool{2};
    REQUIRE(pool.threadCount() == 2);

    auto future = pool.enqueue([](int a, int b) { return a + b; }, 20, 22);
    REQUIRE(future.has_value());
    REQUIRE(future->get() == 42);
}

TEST_CASE("ThreadPool zero threads picks at least one worker", "[concurrency][threadpool]")
{
    ThreadPool pool{0};
    REQUIRE(pool.threadCount() >= 1);
}

TEST_CASE("ThreadPool detached tasks all complete", "[concurrency][threadpool]")
{
    ThreadPool pool{4};
    constexpr int kTasks = 64;

    std::atomic<int> counter{0};
    std::latch done{kTasks};

    for (int i = 0; i < kTasks; ++i)
    {
        auto queued = pool.enqueueDetached([&]() {
            counter.fetch_add(1);
            done.count_down();
        });
        REQUIRE(queued.has_value());
    }

    done.wait();
    REQUIRE(counter.load() == kTasks);
}

TEST_CASE("ThreadPool identifies its worker threads", "[concurrency][threadpool]")
{
    ThreadPool pool{1};
    REQUIRE_FALSE(pool.isWorkerThread());

    auto onWorker = pool.enqueue([&pool]() { return pool.isWorkerThread(); });
    REQUIRE(onWorker.has_value());
    REQUIRE(onWorker->get());
}

TEST_CASE("ThreadPool rejects work after shutdown", "[concurrency][threadpool]")
{
    ThreadPool pool{2};
    pool.shutdown();

    auto queued = pool.enqueueDetached([]() {});
    REQUIRE_FALSE(queued.has_value());
    REQUIRE(queued.error().code() == core::ErrorCode::kInvalidState);
}
