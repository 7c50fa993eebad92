#include <gtest/gtest.h>
#include <codesim/util/thread_pool.hpp>

#include <atomic>
#include <stdexcept>

using namespace codesim;

TEST(ThreadPoolTest, SubmitReturnsValue) {
    ThreadPool pool(2);
    auto future = pool.submit([]() { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, ParallelForVisitsEveryIndexOnce) {
    ThreadPool pool(4);
    std::vector<int> hits(1000, 0);
    pool.parallel_for(hits.size(), [&](size_t i) { hits[i] += 1; });

    for (size_t i = 0; i < hits.size(); ++i) {
        EXPECT_EQ(hits[i], 1) << "index " << i;
    }
}

TEST(ThreadPoolTest, ParallelForZeroCount) {
    ThreadPool pool(2);
    std::atomic<int> calls{0};
    pool.parallel_for(0, [&](size_t) { ++calls; });
    EXPECT_EQ(calls.load(), 0);
}

TEST(ThreadPoolTest, ExceptionPropagates) {
    ThreadPool pool(2);
    EXPECT_THROW(
        pool.parallel_for(8, [](size_t i) {
            if (i == 5) throw std::runtime_error("boom");
        }),
        std::runtime_error);
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, DestructorDrainsQueue) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            pool.submit([&done]() { ++done; });
        }
    }
    EXPECT_EQ(done.load(), 20);
}

TEST(ThreadPoolTest, DefaultThreadCount) {
    EXPECT_GE(ThreadPool::default_thread_count(), 1u);
    EXPECT_EQ(ThreadPool::default_thread_count(1), 1u);
}
