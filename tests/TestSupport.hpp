#pragma once

/**
 * TestSupport.hpp
 *
 * Assertion macros and in-memory collaborators shared by the test
 * executables: a manual clock dispatcher, a scripted transfer engine,
 * a scripted track source and a recording notification sink.
 */

#include "core/Config.hpp"
#include "core/Dispatcher.hpp"
#include "core/EventBus.hpp"
#include "core/downloads/DownloadStorage.hpp"
#include "core/downloads/DownloadTypes.hpp"
#include "core/downloads/NotificationSink.hpp"
#include "core/downloads/TrackSource.hpp"
#include "core/downloads/TransferEngine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

template<typename T>
bool AssertEqual(const T& actual, const T& expected, const std::string& msg) {
    if (actual != expected) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << expected << std::endl;
        std::cerr << "  Got:      " << actual << std::endl;
        return false;
    }
    return true;
}

inline bool AssertNear(double actual, double expected, double tolerance, const std::string& msg) {
    if (actual < expected - tolerance || actual > expected + tolerance) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << expected << " (+/- " << tolerance << ")" << std::endl;
        std::cerr << "  Got:      " << actual << std::endl;
        return false;
    }
    return true;
}

#define ASSERT_EQ(actual, expected, msg) \
    if (!AssertEqual(actual, expected, msg)) return false;

#define ASSERT_NEAR(actual, expected, tolerance, msg) \
    if (!AssertNear(actual, expected, tolerance, msg)) return false;

#define ASSERT_TRUE(condition, msg) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to false" << std::endl; \
        return false; \
    }

#define ASSERT_FALSE(condition, msg) \
    if (condition) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to true (expected false)" << std::endl; \
        return false; \
    }

namespace kitzi::test {

using namespace kitzi::core;
using namespace kitzi::core::downloads;
namespace fs = std::filesystem;

inline std::string str(ItemStatus status) { return toString(status); }
inline std::string str(TaskStatus status) { return toString(status); }

/**
 * Unique scratch directory, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        m_path = fs::temp_directory_path() / ("kitzi-test-" + std::to_string(gen()));
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

/**
 * Reset the Config singleton to defaults, persisted inside dir
 */
inline void resetConfig(const fs::path& dir) {
    auto& config = Config::instance();
    config.setDefaults();
    config.setStoragePath((dir / "config.json").string());
}

inline void writeFile(const fs::path& path, const std::string& content = "audio") {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

/**
 * Dispatcher driven by hand. Time only moves in advance().
 */
class ManualDispatcher : public Dispatcher {
public:
    void post(Task task) override {
        postDelayed(Millis(0), std::move(task));
    }

    void postDelayed(Millis delay, Task task) override {
        if (delay.count() < 0) delay = Millis(0);
        m_tasks.push_back({m_now + delay, m_sequence++, std::move(task)});
    }

    TimePoint now() const override { return m_now; }

    /**
     * Run everything due within the next `duration`, in due-time order,
     * including tasks posted while running
     */
    void advance(Millis duration) {
        TimePoint target = m_now + duration;
        while (true) {
            auto next = std::min_element(m_tasks.begin(), m_tasks.end(),
                [](const Pending& a, const Pending& b) {
                    if (a.due != b.due) return a.due < b.due;
                    return a.sequence < b.sequence;
                });
            if (next == m_tasks.end() || next->due > target) {
                break;
            }

            Pending pending = std::move(*next);
            m_tasks.erase(next);
            if (pending.due > m_now) {
                m_now = pending.due;
            }
            pending.task();
        }
        m_now = target;
    }

    /**
     * Run tasks that are already due
     */
    void runReady() { advance(Millis(0)); }

    size_t pending() const { return m_tasks.size(); }

private:
    struct Pending {
        TimePoint due;
        uint64_t sequence;
        Task task;
    };

    TimePoint m_now{TimePoint{} + std::chrono::hours(1)};
    uint64_t m_sequence{0};
    std::vector<Pending> m_tasks;
};

/**
 * In-memory engine. Updates are broadcast only when a test asks for them.
 */
class FakeTransferEngine : public TransferEngine {
public:
    void enqueue(const TransferTask& task) override {
        if (rejectEnqueue) {
            throw std::runtime_error("engine storage unavailable");
        }
        submitted.push_back(task);

        TaskRecord record;
        record.task = task;
        record.status = TaskStatus::Enqueued;
        records.push_back(record);
    }

    void cancelByIds(const std::vector<std::string>& taskIds) override {
        for (const auto& taskId : taskIds) {
            canceledIds.push_back(taskId);
            if (TaskRecord* record = find(taskId)) {
                if (isActive(record->status)) {
                    record->status = TaskStatus::Canceled;
                }
            }
        }
    }

    std::vector<TaskRecord> allRecords() const override {
        return records;
    }

    void deleteRecord(const std::string& taskId) override {
        auto it = std::remove_if(records.begin(), records.end(),
            [&](const TaskRecord& r) { return r.taskId() == taskId; });
        if (it != records.end()) {
            deletedIds.push_back(taskId);
        }
        records.erase(it, records.end());
    }

    SubscriptionPtr subscribe(TaskUpdateCallback callback) override {
        return m_bus.subscribe("updates", std::move(callback));
    }

    void unsubscribe(const SubscriptionPtr& subscription) override {
        m_bus.unsubscribe(subscription);
    }

    // Scripting helpers

    void addRecord(const TransferTask& task, TaskStatus status) {
        TaskRecord record;
        record.task = task;
        record.status = status;
        records.push_back(record);
    }

    /**
     * Change a record's status and broadcast it
     */
    void setStatus(const std::string& taskId, TaskStatus status) {
        if (TaskRecord* record = find(taskId)) {
            record->status = status;
            if (status == TaskStatus::Complete) record->progress = 1.0;
        }
        emitStatus(taskById(taskId), status);
    }

    /**
     * Broadcast without touching records (late or stray updates)
     */
    void emitStatus(const TransferTask& task, TaskStatus status) {
        TaskUpdate update;
        update.kind = TaskUpdate::Kind::Status;
        update.task = task;
        update.status = status;
        m_bus.emit("updates", update);
    }

    void emitProgress(const std::string& taskId, double fraction) {
        if (TaskRecord* record = find(taskId)) {
            record->progress = fraction;
        }
        TaskUpdate update;
        update.kind = TaskUpdate::Kind::Progress;
        update.task = taskById(taskId);
        update.status = TaskStatus::Running;
        update.progress = fraction;
        m_bus.emit("updates", update);
    }

    TaskRecord* find(const std::string& taskId) {
        for (auto& record : records) {
            if (record.taskId() == taskId) return &record;
        }
        return nullptr;
    }

    TransferTask taskById(const std::string& taskId) const {
        for (const auto& task : submitted) {
            if (task.taskId == taskId) return task;
        }
        for (const auto& record : records) {
            if (record.taskId() == taskId) return record.task;
        }
        throw std::runtime_error("unknown task " + taskId);
    }

    size_t activeCount() const {
        return static_cast<size_t>(std::count_if(records.begin(), records.end(),
            [](const TaskRecord& r) { return isActive(r.status); }));
    }

    size_t timesCanceled(const std::string& taskId) const {
        return static_cast<size_t>(std::count(canceledIds.begin(), canceledIds.end(), taskId));
    }

    const TransferTask& lastSubmitted() const { return submitted.back(); }

    std::vector<TransferTask> submitted;
    std::vector<TaskRecord> records;
    std::vector<std::string> canceledIds;
    std::vector<std::string> deletedIds;
    bool rejectEnqueue{false};

private:
    EventBus<TaskUpdate> m_bus;
};

/**
 * Track lists per item; unknown or failing items throw TrackSourceError
 */
class FakeTrackSource : public TrackSource {
public:
    std::vector<Track> getTracks(const std::string& itemId,
                                 const std::optional<std::string>& episodeId) override {
        ++calls;
        lastEpisodeId = episodeId;
        if (failing.count(itemId) > 0) {
            throw TrackSourceError("server unreachable");
        }
        auto it = tracks.find(itemId);
        if (it == tracks.end()) {
            throw TrackSourceError("unknown item " + itemId);
        }
        return it->second;
    }

    void setTracks(const std::string& itemId, int count, const std::string& mimeType = "audio/mpeg") {
        std::vector<Track> list;
        // Reverse order; callers must sort
        for (int i = count - 1; i >= 0; --i) {
            Track track;
            track.index = i;
            track.url = "https://abs.example.org/s/" + itemId + "/" + std::to_string(i);
            track.mimeType = mimeType;
            track.durationSeconds = 600.0;
            list.push_back(track);
        }
        tracks[itemId] = list;
    }

    std::map<std::string, std::vector<Track>> tracks;
    std::set<std::string> failing;
    std::optional<std::string> lastEpisodeId;
    int calls{0};
};

class RecordingNotificationSink : public NotificationSink {
public:
    void onDownloadStarted(const std::string& title) override { started.push_back(title); }
    void onDownloadComplete(const std::string& title) override { completed.push_back(title); }
    void onDownloadCanceled() override { ++canceled; }

    std::vector<std::string> started;
    std::vector<std::string> completed;
    int canceled{0};
};

} // namespace kitzi::test
