// Licensed under the MIT License. See LICENSE file for details.

#include "ThreadPool.hpp"
#include "LogGlobals.hpp"
#include <algorithm>

namespace aforge
{
    ThreadPool::ThreadPool(size_t thread_count)
    {
        const size_t n = std::max(thread_count, min_thread_count);
        workers_.reserve(n);
        for (size_t i = 0; i < n; ++i)
            workers_.emplace_back(&ThreadPool::worker_loop, this);
    }

    ThreadPool::~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_)
            w.join();
    }

    void ThreadPool::post(std::function<void()> fn)
    {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            tasks_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    void ThreadPool::worker_loop()
    {
        for (;;)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(mutex_);
                cv_.wait(lk, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty())
                    return;     // stopping and drained
                task = std::move(tasks_.front());
                tasks_.pop();
            }

            try
            {
                task();
            }
            catch (const std::exception& ex)
            {
                LogGlobals::log("[ERROR] Worker task failed: %s", ex.what());
            }
        }
    }
}
