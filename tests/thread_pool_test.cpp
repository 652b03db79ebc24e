#include <gtest/gtest.h>

#include <atomic>
#include <vector>

#include "../src/utils/thread_pool.hpp"

TEST(thread_pool, runs_every_task_before_wait_all_returns) {
    concurrency::ThreadPool pool(4);
    std::atomic<int> done{0};

    for (int i = 0; i < 100; ++i) {
        pool.enqueue([&done] { done.fetch_add(1); });
    }
    pool.wait_all();

    EXPECT_EQ(done.load(), 100);
}

TEST(thread_pool, results_land_in_their_own_slots) {
    concurrency::ThreadPool pool(3);
    std::vector<int> squares(20, 0);

    for (int i = 0; i < 20; ++i) {
        pool.enqueue([&squares, i] { squares[size_t(i)] = i * i; });
    }
    pool.wait_all();

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(squares[size_t(i)], i * i);
    }
}

TEST(thread_pool, can_be_reused_after_wait_all) {
    concurrency::ThreadPool pool(2);
    std::atomic<int> done{0};

    pool.enqueue([&done] { done.fetch_add(1); });
    pool.wait_all();
    pool.enqueue([&done] { done.fetch_add(1); });
    pool.wait_all();

    EXPECT_EQ(done.load(), 2);
}
