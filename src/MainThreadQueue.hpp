// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "LogGlobals.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <future>
#include <functional>
#include <thread>
#include <type_traits>
#include <stdexcept>

namespace aforge
{
    /// Work that must run on the thread owning the graphics context.
    /// The owner is the thread that constructed the queue.
    class MainThreadQueue
    {
    public:
        MainThreadQueue()
            : owner_(std::this_thread::get_id()) {
        }

        bool is_owner_thread() const
        {
            return std::this_thread::get_id() == owner_;
        }

        // Enqueue a task (non-blocking). Exceptions thrown by the task are logged.
        void push(std::function<void()> fn)
        {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                q_.push(std::move(fn));
            }
            cv_.notify_one();
        }

        // Enqueue and wait until the task has executed on the main thread.
        // Exceptions are rethrown on the calling thread.
        template<typename F>
        auto push_and_wait(F&& fn) -> std::invoke_result_t<F&>
        {
            using R = std::invoke_result_t<F&>;

            if (is_owner_thread()) {
                // Already on main thread: run inline
                if constexpr (std::is_void_v<R>) { fn(); return; }
                else { return fn(); }
            }

            auto prom = std::make_shared<std::promise<R>>();
            auto fut = prom->get_future();

            push([prom, f = std::forward<F>(fn)]() mutable {
                try {
                    if constexpr (std::is_void_v<R>) { f(); prom->set_value(); }
                    else { prom->set_value(f()); }
                }
                catch (...) {
                    prom->set_exception(std::current_exception());
                }
                });

            if constexpr (std::is_void_v<R>) { fut.get(); return; }
            else { return fut.get(); }
        }

        // Called by the main thread, once per frame or more often.
        // Returns the number of tasks executed.
        size_t execute_all()
        {
            if (!is_owner_thread())
                throw std::logic_error("MainThreadQueue::execute_all called from a non-owner thread");

            std::queue<std::function<void()>> local;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                local.swap(q_);
            }

            size_t count = 0;
            while (!local.empty())
            {
                auto fn = std::move(local.front());
                local.pop();
                try { fn(); }
                catch (const std::exception& ex) {
                    LogGlobals::log("[ERROR] Main thread task failed: %s", ex.what());
                }
                ++count;
            }
            return count;
        }

        // Blocking wait (with timeout) for work to arrive
        template<class Rep, class Period>
        bool wait_for_work(const std::chrono::duration<Rep, Period>& timeout)
        {
            std::unique_lock<std::mutex> lk(mtx_);
            return cv_.wait_for(lk, timeout, [&] { return !q_.empty(); });
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lk(mtx_);
            return q_.empty();
        }

    private:
        std::thread::id         owner_;
        mutable std::mutex      mtx_;
        std::condition_variable cv_;
        std::queue<std::function<void()>> q_;
    };
}
