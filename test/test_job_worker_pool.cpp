// Standard Library
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

// GoogleTest
#include <gtest/gtest.h>

// Project headers
#include "job_worker_pool.h"

using namespace std::chrono_literals;

TEST(JobWorkerPoolTest, RunsSubmittedJobs)
{
    JobWorkerPool pool(2, 8);
    pool.start();

    std::atomic<int> done{0};
    for (int i = 0; i < 5; ++i)
    {
        ASSERT_TRUE(pool.trySubmit([&done] { ++done; }));
    }
    pool.stop();

    EXPECT_EQ(done.load(), 5);
}

TEST(JobWorkerPoolTest, RejectsJobsBeyondCapacity)
{
    JobWorkerPool pool(1, 2);
    pool.start();

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> first_started;

    ASSERT_TRUE(pool.trySubmit([gate, &first_started] {
        first_started.set_value();
        gate.wait();
    }));
    first_started.get_future().wait();

    EXPECT_TRUE(pool.trySubmit([] {}));
    EXPECT_TRUE(pool.trySubmit([] {}));
    EXPECT_EQ(pool.queuedJobs(), 2u);
    EXPECT_FALSE(pool.trySubmit([] {}));

    release.set_value();
    pool.stop();
    EXPECT_EQ(pool.queuedJobs(), 0u);
}

TEST(JobWorkerPoolTest, StopDrainsQueuedJobs)
{
    JobWorkerPool pool(1, 16);
    pool.start();

    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i)
    {
        ASSERT_TRUE(pool.trySubmit([&done] {
            std::this_thread::sleep_for(1ms);
            ++done;
        }));
    }
    pool.stop();

    EXPECT_EQ(done.load(), 10);
}

TEST(JobWorkerPoolTest, RefusesJobsWhenNotRunning)
{
    JobWorkerPool pool(1, 4);
    EXPECT_FALSE(pool.trySubmit([] {}));

    pool.start();
    pool.stop();
    EXPECT_FALSE(pool.trySubmit([] {}));
}

TEST(JobWorkerPoolTest, FailingJobDoesNotStopWorker)
{
    JobWorkerPool pool(1, 4);
    pool.start();

    std::atomic<bool> ran{false};
    ASSERT_TRUE(pool.trySubmit([] { throw std::runtime_error("job failed"); }));
    ASSERT_TRUE(pool.trySubmit([&ran] { ran = true; }));
    pool.stop();

    EXPECT_TRUE(ran.load());
}

TEST(JobWorkerPoolTest, ClampsZeroSizesToOne)
{
    JobWorkerPool pool(0, 0);

    EXPECT_EQ(pool.capacity(), 1u);
}
