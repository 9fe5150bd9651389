#pragma once

/**
 * EventLoop.hpp
 *
 * Single-threaded timer loop implementing Dispatcher.
 * The download coordinator lives on one of these.
 */

#include "Dispatcher.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace kitzi::core {

/**
 * EventLoop - one worker thread draining a due-time ordered task heap
 *
 * Tasks with equal due time run in submission order.
 */
class EventLoop : public Dispatcher {
public:
    EventLoop();

    /**
     * Destructor - stops the loop; pending tasks are dropped
     */
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task) override;
    void postDelayed(Millis delay, Task task) override;
    TimePoint now() const override { return Clock::now(); }

    /**
     * Run a callable on the loop and get its result.
     * Never wait on the returned future from the loop thread itself.
     */
    template<class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        post([task]() { (*task)(); });
        return result;
    }

    /**
     * Stop the loop and join the worker
     */
    void stop();

    /**
     * @return true if called from the loop's own thread
     */
    bool isLoopThread() const;

    size_t pendingTasks() const;

private:
    struct TimedTask {
        TimePoint due;
        uint64_t sequence;
        Task task;

        bool operator<(const TimedTask& other) const {
            // std::priority_queue is a max-heap; invert for earliest-first
            if (due != other.due) return due > other.due;
            return sequence > other.sequence;
        }
    };

    void workerLoop();

    std::priority_queue<TimedTask> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::atomic<bool> m_stop{false};
    uint64_t m_sequence{0};
    std::thread m_worker;
};

} // namespace kitzi::core
