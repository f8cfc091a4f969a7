#include "mcp/WorkerPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

using namespace toolrpc;

TEST(WorkerPoolTest, RejectsZeroThreads) {
    EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}

TEST(WorkerPoolTest, RunsEveryJob) {
    WorkerPool pool(4);
    EXPECT_EQ(pool.thread_count(), 4);

    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i) {
        EXPECT_TRUE(pool.submit([&sum, i]() { sum += i; }));
    }
    pool.wait_idle();

    EXPECT_EQ(sum.load(), 5050);
}

TEST(WorkerPoolTest, FailingJobDoesNotKillWorker) {
    WorkerPool pool(1);
    std::atomic<int> completed{0};

    pool.submit([]() { throw std::runtime_error("job failed"); });
    pool.submit([&completed]() { completed++; });
    pool.wait_idle();

    EXPECT_EQ(completed.load(), 1);
}

TEST(WorkerPoolTest, ShutdownAbandonsQueuedJobs) {
    WorkerPool pool(1);

    std::mutex mutex;
    std::condition_variable cv;
    bool started = false;
    bool release = false;
    std::atomic<int> ran{0};

    // Park the only worker so the next jobs stay queued
    pool.submit([&]() {
        std::unique_lock<std::mutex> lock(mutex);
        started = true;
        cv.notify_all();
        cv.wait(lock, [&]() { return release; });
    });
    {
        std::unique_lock<std::mutex> lock(mutex);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&]() { return started; }));
    }

    pool.submit([&ran]() { ran++; });
    pool.submit([&ran]() { ran++; });

    EXPECT_EQ(pool.shutdown(), 2);
    EXPECT_FALSE(pool.submit([&ran]() { ran++; }));

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    pool.wait_idle();

    EXPECT_EQ(ran.load(), 0);
}
