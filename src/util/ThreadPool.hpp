// Licensed under the MIT License. See LICENSE file for details.

#pragma once
#include "IExecutor.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace aforge
{
    /// Workers behind the import strand and the pack and font tasks.
    /// An import pass holds a worker while it waits on the tasks it queued,
    /// so the pool never has fewer than two threads. Queued work is drained
    /// before the workers join.
    class ThreadPool : public IExecutor
    {
    public:
        static constexpr size_t min_thread_count = 2;

        explicit ThreadPool(size_t thread_count = std::thread::hardware_concurrency());
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /// Exceptions thrown by `task` end up in the future
        template <typename Func>
        auto queue_task(Func task) -> std::future<std::invoke_result_t<Func>>
        {
            using R = std::invoke_result_t<Func>;
            auto job = std::make_shared<std::packaged_task<R()>>(std::move(task));
            auto fut = job->get_future();
            post([job] { (*job)(); });
            return fut;
        }

        void post(std::function<void()> fn) override;

        size_t nbr_threads() const { return workers_.size(); }

    private:
        void worker_loop();

        std::vector<std::thread> workers_;

        std::mutex mutex_;
        std::condition_variable cv_;
        std::queue<std::function<void()>> tasks_;
        bool stopping_ = false;     // guarded by mutex_
    };
}
