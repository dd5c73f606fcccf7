#include "bulbtrace/core/task/task_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <latch>
#include <vector>

namespace bulbtrace::core {
namespace {

TEST(TaskPoolTest, RunsSubmittedTasks) {
    TaskPool pool(2);
    EXPECT_EQ(pool.worker_count(), 2u);

    std::atomic<int> counter{0};
    std::latch done(8);
    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(pool.submit([&](std::stop_token) {
            counter.fetch_add(1);
            done.count_down();
        }));
    }
    done.wait();
    EXPECT_EQ(counter.load(), 8);
}

TEST(TaskPoolTest, RejectsTasksAfterShutdown) {
    TaskPool pool(1);
    pool.shutdown();
    pool.shutdown();
    EXPECT_FALSE(pool.submit([](std::stop_token) {}));
    EXPECT_EQ(pool.worker_count(), 0u);
}

TEST(TaskPoolTest, ParallelForVisitsEveryIndexOnce) {
    TaskPool pool(4);
    std::vector<std::atomic<int>> hits(1000);
    parallel_for(pool, hits.size(), [&](std::size_t i) {
        hits[i].fetch_add(1);
    });
    for (const auto& h : hits) {
        EXPECT_EQ(h.load(), 1);
    }
}

TEST(TaskPoolTest, ParallelForWithFewerItemsThanWorkers) {
    TaskPool pool(8);
    std::vector<int> values(3, 0);
    parallel_for(pool, values.size(), [&](std::size_t i) {
        values[i] = static_cast<int>(i) + 1;
    });
    EXPECT_EQ(values, (std::vector<int>{1, 2, 3}));
}

TEST(TaskPoolTest, ParallelForRunsInlineOnStoppedPool) {
    TaskPool pool(2);
    pool.shutdown();

    std::vector<int> values(16, 0);
    parallel_for(pool, values.size(), [&](std::size_t i) {
        values[i] = 1;
    });
    for (const int v : values) {
        EXPECT_EQ(v, 1);
    }
}

TEST(TaskPoolTest, ParallelForZeroCountIsNoop) {
    bool called = false;
    parallel_for(0, [&](std::size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(TaskPoolTest, GlobalPoolIsShared) {
    EXPECT_EQ(&global_task_pool(), &global_task_pool());

    std::atomic<std::size_t> sum{0};
    parallel_for(100, [&](std::size_t i) { sum.fetch_add(i); });
    EXPECT_EQ(sum.load(), 4950u);
    EXPECT_GT(global_task_pool().worker_count(), 0u);
}

} // namespace
} // namespace bulbtrace::core
