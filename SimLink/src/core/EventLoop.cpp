// File: EventLoop.cpp
#include "../../include/core/EventLoop.hpp"
#include "../../include/core/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace SimLink::Networking {

    EventLoop::EventLoop() {
        int fds[2] = { -1, -1 };
        if (::pipe(fds) != 0) {
            SL_NETWORK_CRITICAL("EventLoop: pipe() failed: {}", std::strerror(errno));
            return;
        }
        for (int fd : fds) {
            const int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0 || ::fcntl(fd, F_SETFD, FD_CLOEXEC) < 0) {
                SL_NETWORK_CRITICAL("EventLoop: fcntl on wake pipe failed: {}", std::strerror(errno));
                ::close(fds[0]);
                ::close(fds[1]);
                return;
            }
        }
        m_wakeRead = fds[0];
        m_wakeWrite = fds[1];
    }

    EventLoop::~EventLoop() {
        if (m_wakeRead >= 0) ::close(m_wakeRead);
        if (m_wakeWrite >= 0) ::close(m_wakeWrite);
    }

    bool EventLoop::AddReader(int fd, Task onReadable) {
        if (fd < 0 || !onReadable) return false;
        if (m_readers.count(fd)) {
            SL_NETWORK_WARN("EventLoop: fd {} already has a reader", fd);
            return false;
        }
        m_readers.emplace(fd, std::move(onReadable));
        return true;
    }

    void EventLoop::RemoveReader(int fd) {
        m_readers.erase(fd);
    }

    EventLoop::TimerId EventLoop::ScheduleOnce(std::chrono::milliseconds delay, Task task) {
        return AddTimer(delay, std::chrono::milliseconds::zero(), std::move(task));
    }

    EventLoop::TimerId EventLoop::ScheduleRepeating(std::chrono::milliseconds interval, Task task) {
        if (interval <= std::chrono::milliseconds::zero()) interval = std::chrono::milliseconds(1);
        return AddTimer(interval, interval, std::move(task));
    }

    EventLoop::TimerId EventLoop::AddTimer(std::chrono::milliseconds delay, std::chrono::milliseconds interval, Task task) {
        const TimerId id = m_nextTimerId++;
        m_timers.emplace(id, Timer{ Clock::now() + delay, interval, std::move(task) });
        return id;
    }

    void EventLoop::CancelTimer(TimerId id) {
        m_timers.erase(id);
    }

    void EventLoop::Post(Task task) {
        {
            std::lock_guard<std::mutex> lock(m_postMutex);
            m_posted.push_back(std::move(task));
        }
        Wake();
    }

    void EventLoop::Wake() {
        if (m_wakeWrite < 0) return;
        const uint8_t byte = 1;
        // A full pipe already guarantees a wakeup.
        if (::write(m_wakeWrite, &byte, 1) < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            SL_NETWORK_WARN("EventLoop: wake write failed: {}", std::strerror(errno));
        }
    }

    void EventLoop::DrainWakePipe() {
        uint8_t buf[64];
        while (::read(m_wakeRead, buf, sizeof(buf)) > 0) {
        }
    }

    std::chrono::milliseconds EventLoop::NextTimeout(std::chrono::milliseconds maxWait) const {
        {
            std::lock_guard<std::mutex> lock(m_postMutex);
            if (!m_posted.empty()) return std::chrono::milliseconds::zero();
        }
        std::chrono::milliseconds wait = maxWait;
        const auto now = Clock::now();
        for (const auto& [id, timer] : m_timers) {
            const auto until = std::chrono::duration_cast<std::chrono::milliseconds>(timer.due - now);
            wait = std::min(wait, std::max(until, std::chrono::milliseconds::zero()));
        }
        return wait;
    }

    void EventLoop::RunOnce(std::chrono::milliseconds maxWait) {
        std::vector<pollfd> fds;
        fds.reserve(m_readers.size() + 1);
        if (m_wakeRead >= 0) fds.push_back(pollfd{ m_wakeRead, POLLIN, 0 });
        for (const auto& [fd, task] : m_readers) {
            fds.push_back(pollfd{ fd, POLLIN, 0 });
        }

        const int timeoutMs = static_cast<int>(NextTimeout(maxWait).count());
        const int ready = ::poll(fds.data(), static_cast<nfds_t>(fds.size()), timeoutMs);
        if (ready < 0 && errno != EINTR) {
            SL_NETWORK_ERROR("EventLoop: poll failed: {}", std::strerror(errno));
        }

        if (ready > 0) {
            for (const pollfd& p : fds) {
                if (p.revents == 0) continue;
                if (p.fd == m_wakeRead) {
                    DrainWakePipe();
                    continue;
                }
                // Look the reader up again: an earlier callback may have removed it.
                auto it = m_readers.find(p.fd);
                if (it == m_readers.end()) continue;
                Task task = it->second;
                task();
            }
        }

        RunDueTimers();
        RunPosted();
    }

    void EventLoop::RunDueTimers() {
        const auto now = Clock::now();
        std::vector<TimerId> due;
        for (const auto& [id, timer] : m_timers) {
            if (timer.due <= now) due.push_back(id);
        }

        for (TimerId id : due) {
            auto it = m_timers.find(id);
            if (it == m_timers.end()) continue;  // cancelled by an earlier timer

            Task task = it->second.task;
            if (it->second.interval > std::chrono::milliseconds::zero()) {
                it->second.due = now + it->second.interval;
            }
            else {
                m_timers.erase(it);
            }
            task();
        }
    }

    void EventLoop::RunPosted() {
        std::deque<Task> local;
        {
            std::lock_guard<std::mutex> lock(m_postMutex);
            local.swap(m_posted);
        }
        for (auto& task : local) {
            if (task) task();
        }
    }

    void EventLoop::Run() {
        m_stopRequested.store(false, std::memory_order_release);
        m_running.store(true, std::memory_order_release);
        while (!m_stopRequested.load(std::memory_order_acquire)) {
            RunOnce(std::chrono::milliseconds(1000));
        }
        m_running.store(false, std::memory_order_release);
    }

    void EventLoop::Stop() {
        m_stopRequested.store(true, std::memory_order_release);
        Wake();
    }

} // namespace SimLink::Networking
