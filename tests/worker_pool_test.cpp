#include "kiln/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace kiln;

TEST(WorkerPoolTest, RunsEveryTaskOnce) {
    WorkerPool pool(4);
    std::vector<std::atomic<int>> hits(100);
    size_t started = pool.run(hits.size(), [&](size_t i) { hits[i].fetch_add(1); });
    EXPECT_EQ(started, hits.size());
    for (const auto &h : hits)
        EXPECT_EQ(h.load(), 1);
}

TEST(WorkerPoolTest, SingleWorkerRunsInlineInOrder) {
    WorkerPool pool(1);
    std::vector<size_t> seen;
    auto caller = std::this_thread::get_id();
    pool.run(std::vector<size_t>{2, 0, 1}, [&](size_t i) {
        EXPECT_EQ(std::this_thread::get_id(), caller);
        seen.push_back(i);
    });
    EXPECT_EQ(seen, (std::vector<size_t>{2, 0, 1}));
}

TEST(WorkerPoolTest, UsesMultipleThreads) {
    WorkerPool pool(4);
    std::mutex mtx;
    std::set<std::thread::id> threads;
    pool.run(64, [&](size_t) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        std::lock_guard lock(mtx);
        threads.insert(std::this_thread::get_id());
    });
    EXPECT_GT(threads.size(), 1u);
    EXPECT_LE(threads.size(), 4u);
}

TEST(WorkerPoolTest, StopPreventsNewTasks) {
    WorkerPool pool(2);
    std::stop_source stop;
    std::atomic<size_t> ran = 0;
    size_t started = pool.run(
        1000,
        [&](size_t) {
            if (ran.fetch_add(1) == 3)
                stop.request_stop();
        },
        stop.get_token());
    EXPECT_LT(started, 1000u);
    EXPECT_EQ(started, ran.load());
}

TEST(WorkerPoolTest, StoppedBeforeStartRunsNothing) {
    WorkerPool pool(1);
    std::stop_source stop;
    stop.request_stop();
    size_t started = pool.run(10, [](size_t) { FAIL(); }, stop.get_token());
    EXPECT_EQ(started, 0u);
}

TEST(WorkerPoolTest, ExceptionIsRethrownAfterJoin) {
    WorkerPool pool(3);
    EXPECT_THROW(pool.run(20,
                          [](size_t i) {
                              if (i == 5)
                                  throw std::runtime_error("boom");
                          }),
                 std::runtime_error);
}

TEST(WorkerPoolTest, ZeroWorkersMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.workers(), 1u);
}
