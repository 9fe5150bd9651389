#pragma once

/**
 * HttpTransferEngine.hpp
 *
 * TransferEngine over plain HTTP(S). Tasks run on a worker pool and
 * keep durable records in a TaskDatabase.
 */

#include "TaskDatabase.hpp"
#include "TransferEngine.hpp"
#include "../EventBus.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

/**
 * HttpTransferEngine - background downloader
 *
 * Features:
 * - Downloads into "<file>.part", renamed on success
 * - Durable records, interrupted tasks become failed on the next start
 * - Progress broadcast in 1% steps
 * - Tasks that require Wi-Fi wait while the network is metered
 *
 * Updates are broadcast from worker threads.
 */
class HttpTransferEngine : public TransferEngine {
public:
    static constexpr double PROGRESS_STEP = 0.01;

    /**
     * @param documentsRoot Root that task directories are relative to
     * @param databasePath Task database file (empty = memory only)
     * @param workers Number of concurrent transfers
     */
    HttpTransferEngine(std::filesystem::path documentsRoot,
                       std::filesystem::path databasePath,
                       size_t workers = 1);

    ~HttpTransferEngine() override;

    HttpTransferEngine(const HttpTransferEngine&) = delete;
    HttpTransferEngine& operator=(const HttpTransferEngine&) = delete;

    /**
     * Load durable records and start the workers
     */
    void initialize();

    /**
     * Abort running transfers and join the workers. Records of aborted
     * tasks stay "running" on disk and are failed by the next initialize().
     */
    void shutdown();

    bool isInitialized() const { return m_initialized; }

    void enqueue(const TransferTask& task) override;
    void cancelByIds(const std::vector<std::string>& taskIds) override;
    std::vector<TaskRecord> allRecords() const override;
    void deleteRecord(const std::string& taskId) override;
    SubscriptionPtr subscribe(TaskUpdateCallback callback) override;
    void unsubscribe(const SubscriptionPtr& subscription) override;

    /**
     * Report whether the current network is unmetered (Wi-Fi)
     */
    void setUnmeteredNetwork(bool unmetered);
    bool isUnmeteredNetwork() const { return m_unmetered; }

    /**
     * Per-transfer timeout (0 = none)
     */
    void setTimeout(int timeoutMs) { m_timeoutMs = timeoutMs; }

    /**
     * Cancel requests a worker has not consumed yet
     */
    size_t pendingCancelCount() const;

    /**
     * Absolute destination of a task
     */
    std::filesystem::path destinationOf(const TransferTask& task) const;

private:
    void runTask(const std::string& taskId);

    /**
     * Wait until a Wi-Fi-only task may start
     * @return false if the task was canceled or the engine stopped meanwhile
     */
    bool waitForNetwork(const TransferTask& task);

    /**
     * Perform the HTTP transfer
     * @return true on success; error describes the failure otherwise
     */
    bool transfer(const TransferTask& task, std::string& error);

    bool isCanceled(const std::string& taskId) const;
    void forgetCancel(const std::string& taskId);
    void finish(const TransferTask& task, TaskStatus status, const std::string& error = "");

    void publishStatus(const TransferTask& task, TaskStatus status);
    void publishProgress(const TransferTask& task, double progress);

    std::filesystem::path m_documentsRoot;
    TaskDatabase m_database;
    size_t m_workers;
    std::unique_ptr<ThreadPool> m_pool;

    EventBus<TaskUpdate> m_updates;

    mutable std::mutex m_stateMutex;
    std::condition_variable m_networkCondition;
    std::set<std::string> m_canceled;

    std::atomic<bool> m_unmetered{true};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_initialized{false};
    std::atomic<int> m_timeoutMs{0};
};

} // namespace kitzi::core::downloads
