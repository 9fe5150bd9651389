/**
 * EventLoop.cpp
 *
 * Implementation of the single-threaded timer loop.
 */

#include "EventLoop.hpp"
#include "Logger.hpp"

namespace kitzi::core {

EventLoop::EventLoop() {
    m_worker = std::thread([this] { workerLoop(); });
}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(Task task) {
    postDelayed(Millis(0), std::move(task));
}

void EventLoop::postDelayed(Millis delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop) {
            throw std::runtime_error("Cannot post to a stopped EventLoop");
        }
        m_tasks.push({Clock::now() + delay, m_sequence++, std::move(task)});
    }
    m_condition.notify_one();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop) {
            return;
        }
        m_stop = true;
    }
    m_condition.notify_all();

    if (m_worker.joinable() && !isLoopThread()) {
        m_worker.join();
    } else if (m_worker.joinable()) {
        m_worker.detach();
    }
}

bool EventLoop::isLoopThread() const {
    return std::this_thread::get_id() == m_worker.get_id();
}

size_t EventLoop::pendingTasks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void EventLoop::workerLoop() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);

            while (!m_stop) {
                if (m_tasks.empty()) {
                    m_condition.wait(lock);
                    continue;
                }
                TimePoint due = m_tasks.top().due;
                if (due <= Clock::now()) {
                    break;
                }
                m_condition.wait_until(lock, due);
            }

            if (m_stop) {
                return;
            }

            // top() is const; the task is moved out right before pop()
            task = std::move(const_cast<TimedTask&>(m_tasks.top()).task);
            m_tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("EventLoop task threw: {}", e.what());
        }
    }
}

} // namespace kitzi::core
