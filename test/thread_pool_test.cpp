#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <vector>
#include "errors.hpp"
#include "thread_pool.hpp"

using namespace glove;

TEST(ThreadPoolTest, RejectsNonPositiveSize) {
    EXPECT_THROW(ThreadPool(0), InvalidConfiguration);
    EXPECT_THROW(ThreadPool(-3), InvalidConfiguration);
}

TEST(ThreadPoolTest, RunAndWaitRunsEveryTask) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.Size(), 4);

    std::vector<int> hits(16, 0);
    pool.RunAndWait(16, [&](int i) { hits[i] += 1; });
    for (int h : hits) {
        EXPECT_EQ(h, 1);
    }

    // 同一个线程池可以反复使用
    std::atomic<int> total{0};
    for (int round = 0; round < 5; ++round) {
        pool.RunAndWait(4, [&](int) { total++; });
    }
    EXPECT_EQ(total.load(), 20);
}

TEST(ThreadPoolTest, FailureIsRethrownAfterAllTasksFinish) {
    ThreadPool pool(3);
    std::atomic<int> finished{0};

    EXPECT_THROW(pool.RunAndWait(6, [&](int i) {
        if (i == 1) throw std::runtime_error("worker failed");
        finished++;
    }), std::runtime_error);

    EXPECT_EQ(finished.load(), 5);
}

TEST(ThreadPoolTest, SubmitReturnsFuture) {
    ThreadPool pool(2);
    int value = 0;
    auto done = pool.Submit([&value] { value = 7; });
    done.get();
    EXPECT_EQ(value, 7);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> done(0);
    {
        ThreadPool pool(1);
        for (int i = 0; i < 8; ++i) {
            pool.Submit([&done] { done.fetch_add(1); });
        }
        // 析构时队列里的任务仍会执行完再回收线程
    }
    EXPECT_EQ(done.load(), 8);
}

TEST(ThreadPoolTest, RepeatedConstructionReclaimsThreads) {
    for (int round = 0; round < 50; ++round) {
        ThreadPool pool(8);
        EXPECT_EQ(pool.Size(), 8);
    }
}
