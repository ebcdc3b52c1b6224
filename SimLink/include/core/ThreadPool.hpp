// File: ThreadPool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace SimLink {
    namespace Threading {

        /**
         * @class TaskThreadPool
         * @brief Fixed set of worker threads draining a FIFO of tasks.
         *
         * Used for work that must not run on the event loop thread (handlers hand
         * long-running jobs here). Results come back through the returned future.
         */
        class TaskThreadPool {
        public:
            // 0 picks std::thread::hardware_concurrency(), at least one.
            explicit TaskThreadPool(std::size_t numThreads = 0, std::string name = "SimLinkWorker");
            ~TaskThreadPool();

            TaskThreadPool(const TaskThreadPool&) = delete;
            TaskThreadPool& operator=(const TaskThreadPool&) = delete;

            // Throws std::runtime_error once the pool is stopped.
            template<class F, class... Args>
            auto enqueue(F&& f, Args&&... args)
                -> std::future<std::invoke_result_t<F, Args...>>;

            // Runs what is already queued, then joins the workers. Safe to call twice.
            void stop();

            // Drops queued tasks that have not started. Their futures report broken_promise.
            std::size_t clearQueue();

            std::size_t getThreadCount() const { return threadCount_; }
            std::size_t getPendingCount() const;
            bool isStopped() const { return stop_.load(); }

        private:
            void worker_loop();

            std::vector<std::thread>          workers_;
            std::deque<std::function<void()>> tasks_;

            mutable std::mutex      queueMutex_;
            std::condition_variable condition_;
            std::atomic<bool>       stop_{ false };

            std::size_t threadCount_{ 0 };
            std::string name_;
        };

        template<class F, class... Args>
        auto TaskThreadPool::enqueue(F&& f, Args&&... args)
            -> std::future<std::invoke_result_t<F, Args...>>
        {
            using ReturnType = std::invoke_result_t<F, Args...>;

            auto task = std::make_shared<std::packaged_task<ReturnType()>>(
                std::bind(std::forward<F>(f), std::forward<Args>(args)...));
            std::future<ReturnType> result = task->get_future();

            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                if (stop_.load()) {
                    throw std::runtime_error("enqueue on stopped TaskThreadPool");
                }
                tasks_.emplace_back([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

    } // namespace Threading
} // namespace SimLink
