#ifndef TRANSFER_METER_THREAD_POOL_HPP
#define TRANSFER_METER_THREAD_POOL_HPP

#pragma once

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    // Fixed set of workers draining a FIFO of jobs. A job that throws does not take
    // its worker down; the first failure is kept and rethrown by wait_all().
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
        [[nodiscard]] size_t failed_tasks() const { return failed_tasks_; }

       private:
        void work();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::condition_variable completion_cv_;
        std::atomic<bool> stop_ = false;
        std::atomic<size_t> active_tasks_ = 0;
        std::atomic<size_t> failed_tasks_ = 0;
        std::exception_ptr first_error_;
    };
}  // namespace concurrency

#endif
