#pragma once

/**
 * ThreadPool.hpp
 *
 * Named worker pool. The HTTP transfer engine runs its byte transfers
 * here, off the coordinator's event loop.
 */

#include "Logger.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace kitzi::core {

/**
 * ThreadPool - FIFO worker pool for blocking jobs
 *
 * Jobs already queued when the pool is destroyed still run; the
 * destructor joins every worker after the queue is empty.
 */
class ThreadPool {
public:
    using Job = std::function<void()>;

    /**
     * @param numThreads Worker count (0 = hardware concurrency)
     * @param name Prefix for log messages
     */
    explicit ThreadPool(size_t numThreads = 0, std::string name = "pool")
        : m_name(std::move(name)) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 2;
        }

        m_workers.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this, i] { workerLoop(i); });
        }

        LOG_DEBUG("{}: started {} workers", m_name, numThreads);
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop = true;
        }
        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job
     * @throws std::runtime_error once the pool is stopping
     */
    void post(Job job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop) {
                throw std::runtime_error(m_name + ": pool is stopping");
            }
            m_jobs.push_back(std::move(job));
        }
        m_condition.notify_one();
    }

    size_t size() const { return m_workers.size(); }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_jobs.size();
    }

private:
    void workerLoop(size_t index) {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_condition.wait(lock, [this] { return m_stop || !m_jobs.empty(); });

                if (m_jobs.empty()) {
                    return;
                }
                job = std::move(m_jobs.front());
                m_jobs.pop_front();
            }

            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR("{}[{}]: job failed: {}", m_name, index, e.what());
            }
        }
    }

    std::string m_name;
    std::vector<std::thread> m_workers;
    std::deque<Job> m_jobs;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    bool m_stop{false};
};

} // namespace kitzi::core
