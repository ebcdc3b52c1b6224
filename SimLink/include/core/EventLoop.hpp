// File: EventLoop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace SimLink::Networking {

    /**
     * @class EventLoop
     * @brief Single-threaded poll(2) loop driving socket readers and timers.
     *
     * Readers, timers and Run/RunOnce belong to the loop thread. Post() may be
     * called from any thread and wakes the loop through a self-pipe.
     */
    class EventLoop {
    public:
        using Task = std::function<void()>;
        using TimerId = uint64_t;
        using Clock = std::chrono::steady_clock;

        EventLoop();
        ~EventLoop();

        EventLoop(const EventLoop&) = delete;
        EventLoop& operator=(const EventLoop&) = delete;

        // --- Readers ---
        bool AddReader(int fd, Task onReadable);
        void RemoveReader(int fd);

        // --- Timers ---
        TimerId ScheduleOnce(std::chrono::milliseconds delay, Task task);
        TimerId ScheduleRepeating(std::chrono::milliseconds interval, Task task);
        void CancelTimer(TimerId id);

        // --- Cross-thread ---
        void Post(Task task);

        // --- Driving ---
        // Waits at most `maxWait` for readiness, then runs due readers, timers and posted tasks.
        void RunOnce(std::chrono::milliseconds maxWait);
        void Run();
        void Stop();

        bool IsRunning() const { return m_running.load(std::memory_order_acquire); }
        bool IsValid() const { return m_wakeRead >= 0; }

    private:
        struct Timer {
            Clock::time_point         due;
            std::chrono::milliseconds interval;  // zero for one-shot
            Task                      task;
        };

        TimerId AddTimer(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task);
        std::chrono::milliseconds NextTimeout(std::chrono::milliseconds maxWait) const;
        void RunDueTimers();
        void RunPosted();
        void DrainWakePipe();
        void Wake();

        int m_wakeRead{ -1 };
        int m_wakeWrite{ -1 };

        std::map<int, Task>       m_readers;
        std::map<TimerId, Timer>  m_timers;
        TimerId                   m_nextTimerId{ 1 };

        mutable std::mutex m_postMutex;
        std::deque<Task>  m_posted;

        std::atomic<bool> m_running{ false };
        std::atomic<bool> m_stopRequested{ false };
    };

} // namespace SimLink::Networking
