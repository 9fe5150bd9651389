#pragma once

/**
 * TransferEngine.hpp
 *
 * Boundary to the component that performs byte-level downloads and
 * keeps a durable record per task.
 */

#include "DownloadTypes.hpp"
#include "../EventBus.hpp"

#include <functional>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

using TaskUpdateCallback = std::function<void(const TaskUpdate&)>;

/**
 * TransferEngine - executes download tasks
 *
 * Implementations may deliver updates from any thread. Calls may
 * throw std::runtime_error on storage failures.
 */
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    /**
     * Accept a task; creates its durable record in Enqueued state
     */
    virtual void enqueue(const TransferTask& task) = 0;

    /**
     * Request cancellation. Takes effect eventually; unknown ids are ignored.
     */
    virtual void cancelByIds(const std::vector<std::string>& taskIds) = 0;

    /**
     * Snapshot of every durable record
     */
    virtual std::vector<TaskRecord> allRecords() const = 0;

    /**
     * Remove a durable record. Unknown ids are ignored.
     */
    virtual void deleteRecord(const std::string& taskId) = 0;

    /**
     * Subscribe to the broadcast update stream
     */
    virtual SubscriptionPtr subscribe(TaskUpdateCallback callback) = 0;

    virtual void unsubscribe(const SubscriptionPtr& subscription) = 0;
};

} // namespace kitzi::core::downloads
