/**
 * HttpTransferEngine.cpp
 *
 * Worker-pool HTTP downloader with durable task records.
 */

#include "HttpTransferEngine.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <cpr/cpr.h>

#include <fstream>
#include <stdexcept>

namespace kitzi::core::downloads {

namespace {

const std::string UPDATES_TOPIC = "updates";

} // anonymous namespace

HttpTransferEngine::HttpTransferEngine(std::filesystem::path documentsRoot,
                                       std::filesystem::path databasePath,
                                       size_t workers)
    : m_documentsRoot(std::move(documentsRoot))
    , m_database(std::move(databasePath))
    , m_workers(workers == 0 ? 1 : workers) {
}

HttpTransferEngine::~HttpTransferEngine() {
    shutdown();
}

void HttpTransferEngine::initialize() {
    if (m_initialized) return;

    LOG_INFO("Initializing HttpTransferEngine ({} workers)", m_workers);

    size_t loaded = m_database.load();
    m_pool = std::make_unique<ThreadPool>(m_workers, "transfer");

    m_running = true;
    m_initialized = true;

    LOG_INFO("HttpTransferEngine initialized ({} records)", loaded);
}

void HttpTransferEngine::shutdown() {
    if (!m_initialized) return;

    LOG_INFO("Shutting down HttpTransferEngine");

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_running = false;
    }
    m_networkCondition.notify_all();

    m_pool.reset();
    m_initialized = false;
}

void HttpTransferEngine::enqueue(const TransferTask& task) {
    if (!m_running || !m_pool) {
        throw std::runtime_error("Transfer engine is not running");
    }
    if (task.taskId.empty() || task.url.empty() || task.filename.empty()) {
        throw std::runtime_error("Incomplete transfer task");
    }

    TaskRecord record;
    record.task = task;
    record.status = TaskStatus::Enqueued;
    m_database.put(record);

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_canceled.erase(task.taskId);
    }

    publishStatus(task, TaskStatus::Enqueued);

    std::string taskId = task.taskId;
    m_pool->post([this, taskId]() {
        runTask(taskId);
    });

    LOG_DEBUG("Enqueued transfer {} -> {}", task.url, destinationOf(task).string());
}

void HttpTransferEngine::cancelByIds(const std::vector<std::string>& taskIds) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        for (const auto& taskId : taskIds) {
            auto record = m_database.get(taskId);
            if (record && isActive(record->status)) {
                m_canceled.insert(taskId);
            }
        }
    }
    m_networkCondition.notify_all();
}

std::vector<TaskRecord> HttpTransferEngine::allRecords() const {
    return m_database.all();
}

void HttpTransferEngine::deleteRecord(const std::string& taskId) {
    if (m_database.remove(taskId)) {
        LOG_DEBUG("Deleted task record {}", taskId);
    }
}

SubscriptionPtr HttpTransferEngine::subscribe(TaskUpdateCallback callback) {
    return m_updates.subscribe(UPDATES_TOPIC, std::move(callback));
}

void HttpTransferEngine::unsubscribe(const SubscriptionPtr& subscription) {
    m_updates.unsubscribe(subscription);
}

void HttpTransferEngine::setUnmeteredNetwork(bool unmetered) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_unmetered = unmetered;
    }
    m_networkCondition.notify_all();
    LOG_INFO("Network is now {}", unmetered ? "unmetered" : "metered");
}

std::filesystem::path HttpTransferEngine::destinationOf(const TransferTask& task) const {
    return m_documentsRoot / task.directory / task.filename;
}

void HttpTransferEngine::runTask(const std::string& taskId) {
    auto record = m_database.get(taskId);
    if (!record) {
        // Deleted before a worker picked it up
        forgetCancel(taskId);
        return;
    }
    const TransferTask& task = record->task;

    if (!waitForNetwork(task)) {
        if (m_running) {
            finish(task, TaskStatus::Canceled);
        }
        return;
    }

    if (!m_database.updateStatus(taskId, TaskStatus::Running)) {
        forgetCancel(taskId);
        return;
    }
    publishStatus(task, TaskStatus::Running);

    std::string error;
    bool success = transfer(task, error);

    if (!m_running) {
        // Aborted by shutdown; the record stays "running" on disk
        return;
    }

    if (isCanceled(taskId)) {
        finish(task, TaskStatus::Canceled);
    } else if (success) {
        finish(task, TaskStatus::Complete);
    } else {
        LOG_ERROR("Transfer {} failed: {}", taskId, error);
        finish(task, TaskStatus::Failed, error);
    }
}

bool HttpTransferEngine::waitForNetwork(const TransferTask& task) {
    std::unique_lock<std::mutex> lock(m_stateMutex);

    if (task.requiresWiFi && !m_unmetered) {
        LOG_INFO("Transfer {} waits for an unmetered network", task.taskId);
    }

    m_networkCondition.wait(lock, [this, &task] {
        return !m_running || m_canceled.count(task.taskId) > 0 ||
               !task.requiresWiFi || m_unmetered;
    });

    return m_running && m_canceled.count(task.taskId) == 0;
}

bool HttpTransferEngine::transfer(const TransferTask& task, std::string& error) {
    std::filesystem::path destination = destinationOf(task);
    std::filesystem::path partial = destination;
    partial += ".part";

    if (!utils::FileUtils::createDirectories(destination.parent_path())) {
        error = "Cannot create " + destination.parent_path().string();
        return false;
    }

    cpr::Response response;
    {
        std::ofstream file(partial, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            error = "Failed to open output file";
            return false;
        }

        double lastReported = 0.0;

        response = cpr::Download(
            file,
            cpr::Url{task.url},
            cpr::Timeout{m_timeoutMs.load()},
            cpr::ProgressCallback([&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                                      cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                      intptr_t /*userdata*/) -> bool {
                if (!m_running || isCanceled(task.taskId)) {
                    return false; // Abort transfer
                }

                if (downloadTotal > 0) {
                    double fraction = static_cast<double>(downloadNow) / static_cast<double>(downloadTotal);
                    if (fraction - lastReported >= PROGRESS_STEP) {
                        lastReported = fraction;
                        m_database.updateProgress(task.taskId, fraction);
                        publishProgress(task, fraction);
                    }
                }
                return true;
            })
        );
    }

    bool ok = response.error.code == cpr::ErrorCode::OK &&
              (response.status_code == 200 || response.status_code == 206);

    if (!ok || !m_running || isCanceled(task.taskId)) {
        if (response.error.code != cpr::ErrorCode::OK) {
            error = response.error.message;
        } else if (!ok) {
            error = "HTTP " + std::to_string(response.status_code);
        }
        utils::FileUtils::deleteFile(partial);
        return false;
    }

    if (!utils::FileUtils::moveFile(partial, destination)) {
        error = "Cannot move " + partial.string() + " into place";
        utils::FileUtils::deleteFile(partial);
        return false;
    }

    LOG_DEBUG("Downloaded: {}", destination.string());
    return true;
}

void HttpTransferEngine::forgetCancel(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_canceled.erase(taskId);
}

size_t HttpTransferEngine::pendingCancelCount() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_canceled.size();
}

bool HttpTransferEngine::isCanceled(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_canceled.count(taskId) > 0;
}

void HttpTransferEngine::finish(const TransferTask& task, TaskStatus status, const std::string& error) {
    m_database.updateStatus(task.taskId, status, error);
    forgetCancel(task.taskId);
    publishStatus(task, status);
}

void HttpTransferEngine::publishStatus(const TransferTask& task, TaskStatus status) {
    TaskUpdate update;
    update.kind = TaskUpdate::Kind::Status;
    update.task = task;
    update.status = status;
    update.progress = status == TaskStatus::Complete ? 1.0 : 0.0;
    m_updates.emit(UPDATES_TOPIC, update);
}

void HttpTransferEngine::publishProgress(const TransferTask& task, double progress) {
    TaskUpdate update;
    update.kind = TaskUpdate::Kind::Progress;
    update.task = task;
    update.status = TaskStatus::Running;
    update.progress = progress;
    m_updates.emit(UPDATES_TOPIC, update);
}

} // namespace kitzi::core::downloads
