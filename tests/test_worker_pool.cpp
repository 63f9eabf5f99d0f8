#include "util/worker_pool.hpp"

#include <atomic>
#include <functional>
#include <gtest/gtest.h>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace updock;

TEST(WorkerPoolTest, RunsEveryIndexOnce) {
    WorkerPool pool(4);
    std::vector<std::atomic<int>> hits(57);

    pool.Run(hits.size(), [&](std::size_t i) { hits[i].fetch_add(1); });

    for (const auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST(WorkerPoolTest, ZeroWorkersMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.Workers(), 1U);

    int calls = 0;
    pool.Run(3, [&](std::size_t) { ++calls; });
    EXPECT_EQ(calls, 3);
}

TEST(WorkerPoolTest, EmptyRange) {
    WorkerPool pool(8);
    bool called = false;
    pool.Run(0, [&](std::size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(WorkerPoolTest, FinishesWhenThreadsRunOut) {
    int started = 0;
    WorkerPool pool(4, [&](std::function<void()> fn) {
        if (started == 1)
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        ++started;
        return std::thread(std::move(fn));
    });
    std::vector<std::atomic<int>> hits(20);

    pool.Run(hits.size(), [&](std::size_t i) { hits[i].fetch_add(1); });

    EXPECT_EQ(started, 1);
    for (const auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST(WorkerPoolTest, RunsInlineWhenNoThreadStarts) {
    WorkerPool pool(3, [](std::function<void()>) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    });
    int calls = 0;

    pool.Run(5, [&](std::size_t) { ++calls; });

    EXPECT_EQ(calls, 5);
}
