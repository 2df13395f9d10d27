#include "thread_pool.hpp"

#include <condition_variable>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace concurrency {

    ThreadPool::ThreadPool(size_t num_threads) {
        if (num_threads == 0) {
            num_threads = 1;
        }

        threads_.reserve(num_threads);

        for (size_t i = 0; i < num_threads; ++i) {
            threads_.emplace_back([this] { work(); });
        }
    }

    ThreadPool::~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }

        condition_variable_.notify_all();

        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void ThreadPool::work() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                condition_variable_.wait(lock, [this]() { return !tasks_.empty() || stop_; });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();

                ++active_tasks_;
            }

            try {
                task();
            } catch (...) {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                ++failed_tasks_;
                if (!first_error_) {
                    first_error_ = std::current_exception();
                }
            }

            {
                // Decrement under the lock so wait_all() cannot miss the wakeup.
                std::unique_lock<std::mutex> lock(queue_mutex_);
                --active_tasks_;
            }
            completion_cv_.notify_all();
        }
    }

    void ThreadPool::enqueue(std::function<void()> next_task) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            tasks_.emplace(std::move(next_task));
        }

        condition_variable_.notify_one();
    }

    void ThreadPool::wait_all() {
        std::exception_ptr error;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            completion_cv_.wait(lock, [this]() { return tasks_.empty() && active_tasks_ == 0; });

            error = std::exchange(first_error_, nullptr);
        }

        if (error) {
            std::rethrow_exception(error);
        }
    }
}  // namespace concurrency
