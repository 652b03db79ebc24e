#ifndef SPARQL_GUARD_THREAD_POOL_HPP
#define SPARQL_GUARD_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    // Fixed-size worker pool. Each task is one logical request running its
    // own sequential pipeline; tasks never wait on each other.
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        void enqueue(std::function<void()> next_task);
        void wait_all();

       private:
        void worker_loop();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::condition_variable completion_cv_;
        bool stop_ = false;
        size_t active_tasks_ = 0;
    };
}  // namespace concurrency

#endif
