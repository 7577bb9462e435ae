#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "threadpool.hpp"

using namespace ::xfer::utils;
using namespace ::testing;

namespace
{
class ThreadPoolTest : public Test
{
protected:
    // Occupies the single worker of a pool until release() is called
    void block_worker(ThreadPool &pool)
    {
        std::promise<void> started;
        auto               future_started = started.get_future();
        pool.add_job([&started, released = released_.get_future().share()](
                         const CompletionToken &) {
            started.set_value();
            released.wait();
        });
        future_started.wait();
    }

    void release()
    {
        released_.set_value();
    }

    std::promise<void> released_;
};
}  // namespace

TEST_F(ThreadPoolTest, JobsRunInInsertionOrder)
{
    ThreadPool       pool {"test", 1};
    std::mutex       mutex;
    std::vector<int> execution_order;

    for (int i = 0; i != 20; ++i)
    {
        pool.add_job([&, job_index = i](const CompletionToken &) {
            std::lock_guard<std::mutex> lock {mutex};
            execution_order.push_back(job_index);
        });
    }
    pool.wait_idle();

    ASSERT_EQ(execution_order.size(), 20);
    EXPECT_TRUE(std::is_sorted(execution_order.cbegin(), execution_order.cend()));
}

TEST_F(ThreadPoolTest, WaitIdle_MultipleWorkers)
{
    ThreadPool      pool {"test", 4};
    std::atomic_int executed {0};

    EXPECT_EQ(pool.thread_count(), 4);
    EXPECT_EQ(pool.name(), "test");

    for (int i = 0; i != 50; ++i)
    {
        pool.add_job([&](const CompletionToken &) {
            std::this_thread::sleep_for(std::chrono::milliseconds {1});
            ++executed;
        });
    }
    pool.wait_idle();

    EXPECT_EQ(executed.load(), 50);
    EXPECT_EQ(pool.pending_jobs(), 0);
}

TEST_F(ThreadPoolTest, WaitIdle_NoJobs)
{
    ThreadPool pool {"test", 2};
    pool.wait_idle();
}

TEST_F(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool {"test", 0};
    EXPECT_EQ(pool.thread_count(), 1);

    auto token = pool.add_job([](const CompletionToken &) {});
    EXPECT_TRUE(token.wait_for_completion(std::chrono::milliseconds {1000}));
}

TEST_F(ThreadPoolTest, PendingJobs)
{
    ThreadPool pool {"test", 1};
    block_worker(pool);

    pool.add_job([](const CompletionToken &) {});
    pool.add_job([](const CompletionToken &) {});
    EXPECT_EQ(pool.pending_jobs(), 2);

    release();
    pool.wait_idle();
    EXPECT_EQ(pool.pending_jobs(), 0);
}

TEST_F(ThreadPoolTest, CancelledJobDoesNotRun)
{
    ThreadPool pool {"test", 1};
    bool       executed = false;

    block_worker(pool);
    auto token = pool.add_job([&](const CompletionToken &) { executed = true; });
    token.cancel();
    release();

    token.wait_for_completion();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_FALSE(executed);
}

TEST_F(ThreadPoolTest, ThrowingJobDoesNotStopWorker)
{
    ThreadPool pool {"test", 1};

    auto failing = pool.add_job([](const CompletionToken &) {
        throw std::runtime_error {"job failed"};
    });
    bool executed = false;
    pool.add_job([&](const CompletionToken &) { executed = true; });
    pool.wait_idle();

    EXPECT_TRUE(failing.is_completed());
    EXPECT_TRUE(executed);
}

TEST_F(ThreadPoolTest, DestructionCancelsQueuedJobs)
{
    CompletionToken dropped;
    bool            executed = false;
    {
        ThreadPool pool {"test", 1};
        block_worker(pool);
        dropped = pool.add_job([&](const CompletionToken &) { executed = true; });
        release();
    }

    // The queued job either ran before shutdown or was dropped, never left hanging
    EXPECT_TRUE(dropped.is_completed());
    EXPECT_NE(executed, dropped.is_cancelled());
}
