#pragma once

/**
 * DownloadTypes.hpp
 *
 * Value types shared by the download queue, the transfer engine
 * boundary and the progress aggregator.
 */

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kitzi::core::downloads {

/**
 * Durable task status as reported by the transfer engine
 */
enum class TaskStatus {
    Enqueued,
    Running,
    Complete,
    Failed,
    Canceled
};

inline const char* toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Enqueued: return "enqueued";
        case TaskStatus::Running:  return "running";
        case TaskStatus::Complete: return "complete";
        case TaskStatus::Failed:   return "failed";
        case TaskStatus::Canceled: return "canceled";
    }
    return "unknown";
}

inline std::optional<TaskStatus> taskStatusFromString(const std::string& name) {
    if (name == "enqueued") return TaskStatus::Enqueued;
    if (name == "running")  return TaskStatus::Running;
    if (name == "complete") return TaskStatus::Complete;
    if (name == "failed")   return TaskStatus::Failed;
    if (name == "canceled") return TaskStatus::Canceled;
    return std::nullopt;
}

inline bool isActive(TaskStatus status) {
    return status == TaskStatus::Enqueued || status == TaskStatus::Running;
}

inline bool isTerminal(TaskStatus status) {
    return !isActive(status);
}

/**
 * One remote audio file of an item, as supplied by the track source
 */
struct Track {
    int index{0};
    std::string url;
    std::string mimeType;
    double durationSeconds{0.0};
};

/**
 * Descriptor handed to the transfer engine. One task = one track.
 */
struct TransferTask {
    std::string taskId;
    std::string url;
    std::string filename;
    // Relative to the engine's documents root
    std::string directory;
    bool requiresWiFi{true};
    // JSON: {"libraryItemId": "<id>"}
    std::string metadata;
    // "book-<itemId>"
    std::string group;
    std::string displayName;
};

/**
 * Durable record kept by the transfer engine for every task
 */
struct TaskRecord {
    TransferTask task;
    TaskStatus status{TaskStatus::Enqueued};
    double progress{0.0};
    std::string error;

    const std::string& taskId() const { return task.taskId; }
};

/**
 * Raw update broadcast by the transfer engine
 */
struct TaskUpdate {
    enum class Kind {
        Progress,
        Status
    };

    Kind kind{Kind::Status};
    TransferTask task;
    double progress{0.0};
    TaskStatus status{TaskStatus::Enqueued};
};

/**
 * Typed events the coordinator consumes; produced by the adapter in
 * TaskMetadata so no JSON parsing happens inside the scheduler
 */
struct ProgressEvent {
    std::string itemId;
    std::string taskId;
    double fraction{0.0};
};

struct StatusEvent {
    std::string itemId;
    std::string taskId;
    TaskStatus status{TaskStatus::Enqueued};
};

using ItemEvent = std::variant<ProgressEvent, StatusEvent>;

inline const std::string& itemIdOf(const ItemEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.itemId; }, event);
}

inline const std::string& taskIdOf(const ItemEvent& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.taskId; }, event);
}

/**
 * Entry of the global download queue
 */
struct QueueEntry {
    std::string itemId;
    std::optional<std::string> episodeId;
    std::string title;
};

/**
 * Aggregated status of an item shown to the UI
 */
enum class ItemStatus {
    None,
    Queued,
    Running,
    Complete,
    Failed
};

inline const char* toString(ItemStatus status) {
    switch (status) {
        case ItemStatus::None:     return "none";
        case ItemStatus::Queued:   return "queued";
        case ItemStatus::Running:  return "running";
        case ItemStatus::Complete: return "complete";
        case ItemStatus::Failed:   return "failed";
    }
    return "unknown";
}

struct ItemProgress {
    std::string itemId;
    ItemStatus status{ItemStatus::None};
    double progress{0.0};
    int totalTasks{0};
    int completed{0};
};

/**
 * Snapshot returned by DownloadCoordinator::queueStatus()
 */
struct QueueStatus {
    size_t length{0};
    std::vector<QueueEntry> items;
    bool isProcessing{false};
    std::vector<std::string> blocked;
};

} // namespace kitzi::core::downloads
