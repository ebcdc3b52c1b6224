// File: ThreadPool.cpp
#include "../../include/core/ThreadPool.hpp"
#include "../../include/core/Logger.hpp"

#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

namespace SimLink {
    namespace Threading {

        TaskThreadPool::TaskThreadPool(std::size_t numThreads, std::string name)
            : name_(std::move(name))
        {
            threadCount_ = numThreads;
            if (threadCount_ == 0) {
                threadCount_ = std::thread::hardware_concurrency();
                if (threadCount_ == 0) threadCount_ = 1;
            }

            workers_.reserve(threadCount_);
            for (std::size_t i = 0; i < threadCount_; ++i) {
                workers_.emplace_back(&TaskThreadPool::worker_loop, this);
            }
            SL_NETWORK_DEBUG("TaskThreadPool '{}' started with {} thread(s)", name_, threadCount_);
        }

        TaskThreadPool::~TaskThreadPool() {
            stop();
        }

        void TaskThreadPool::stop() {
            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                stop_.store(true);
            }
            condition_.notify_all();

            for (std::thread& worker : workers_) {
                if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                    worker.join();
                }
            }
        }

        std::size_t TaskThreadPool::clearQueue() {
            std::lock_guard<std::mutex> lock(queueMutex_);
            const std::size_t dropped = tasks_.size();
            tasks_.clear();
            return dropped;
        }

        std::size_t TaskThreadPool::getPendingCount() const {
            std::lock_guard<std::mutex> lock(queueMutex_);
            return tasks_.size();
        }

        void TaskThreadPool::worker_loop() {
#if defined(__linux__)
            // Linux caps thread names at 15 characters.
            const int rc = pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
#elif defined(__APPLE__)
            const int rc = pthread_setname_np(name_.c_str());
#else
            const int rc = 0;
#endif
            if (rc != 0) {
                SL_NETWORK_DEBUG("TaskThreadPool '{}': could not name worker thread ({})", name_, rc);
            }

            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(queueMutex_);
                    condition_.wait(lock, [this] { return stop_.load() || !tasks_.empty(); });

                    // Drain before exiting so queued work still completes.
                    if (tasks_.empty()) return;

                    task = std::move(tasks_.front());
                    tasks_.pop_front();
                }
                // packaged_task stores exceptions in the future.
                task();
            }
        }

    } // namespace Threading
} // namespace SimLink
