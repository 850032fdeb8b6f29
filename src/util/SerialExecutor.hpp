// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IExecutor.hpp"
#include "LogGlobals.hpp"
#include <functional>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <exception>

namespace aforge
{
    /// A strand/serializing adapter that runs posted tasks one-at-a-time in FIFO order,
    /// using an *upstream* executor for actual execution. Thread-safe.
    /// Import passes are posted here so two passes never interleave.
    class SerialExecutor : public IExecutor
    {
    public:
        using Fn = std::function<void()>;

        explicit SerialExecutor(IExecutor& upstream) noexcept
            : upstream_(upstream)
        {
        }

        SerialExecutor(const SerialExecutor&) = delete;
        SerialExecutor& operator=(const SerialExecutor&) = delete;

        // IExecutor
        void post(Fn fn) override
        {
            bool schedule = false;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                task_queue_.push(std::move(fn));
                queued_count_.fetch_add(1, std::memory_order_relaxed);
                if (!worker_scheduled_)
                {
                    worker_scheduled_ = true;
                    schedule = true;
                }
            }
            // Schedule a single drain on the upstream executor
            if (schedule)
                upstream_.post([this] { this->drain(); });
        }

        /// True while the strand's worker loop is executing a task
        bool running() const noexcept
        {
            return running_.load(std::memory_order_relaxed);
        }

        /// Number of queued tasks, not including the task currently executing
        std::size_t queued() const noexcept
        {
            return queued_count_.load(std::memory_order_relaxed);
        }

        /// True if a task is running or there are tasks queued
        bool is_busy() const noexcept
        {
            return running() || queued() > 0;
        }

        /// Block until no task is running and the queue is empty
        void wait_idle()
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_idle_.wait(lk, [&]
                {
                    return !worker_scheduled_ && task_queue_.empty();
                });
        }

    private:
        void drain()
        {
            for (;;)
            {
                Fn f;
                {
                    std::lock_guard<std::mutex> lk(mutex_);
                    if (task_queue_.empty())
                    {
                        // Going idle; the next post() schedules a new drain
                        worker_scheduled_ = false;
                        running_.store(false, std::memory_order_relaxed);
                        cv_idle_.notify_all();
                        return;
                    }
                    f = std::move(task_queue_.front());
                    task_queue_.pop();
                    queued_count_.fetch_sub(1, std::memory_order_relaxed);
                    running_.store(true, std::memory_order_relaxed);
                }

                // Execute task outside the lock so new tasks can be enqueued
                try {
                    f();
                }
                catch (const std::exception& ex) {
                    LogGlobals::log("[ERROR] Strand task failed: %s", ex.what());
                }
            }
        }

        IExecutor& upstream_;

        mutable std::mutex mutex_;
        std::condition_variable cv_idle_;
        std::queue<Fn> task_queue_;

        bool                worker_scheduled_ = false;  // guarded by mutex_, one drain() in flight
        std::atomic<bool>   running_{ false };
        std::atomic<size_t> queued_count_{ 0 };
    };

} // namespace aforge
