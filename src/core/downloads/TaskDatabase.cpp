/**
 * TaskDatabase.cpp
 *
 * JSON persistence of transfer task records.
 */

#include "TaskDatabase.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace kitzi::core::downloads {

using json = nlohmann::json;

namespace {

json recordToJson(const TaskRecord& record) {
    const TransferTask& task = record.task;
    return {
        {"taskId", task.taskId},
        {"url", task.url},
        {"filename", task.filename},
        {"directory", task.directory},
        {"requiresWiFi", task.requiresWiFi},
        {"metaData", task.metadata},
        {"group", task.group},
        {"displayName", task.displayName},
        {"status", toString(record.status)},
        {"progress", record.progress},
        {"error", record.error}
    };
}

std::optional<TaskRecord> recordFromJson(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    TaskRecord record;
    record.task.taskId = j.value("taskId", "");
    if (record.task.taskId.empty()) {
        return std::nullopt;
    }

    record.task.url = j.value("url", "");
    record.task.filename = j.value("filename", "");
    record.task.directory = j.value("directory", "");
    record.task.requiresWiFi = j.value("requiresWiFi", true);
    record.task.metadata = j.value("metaData", "");
    record.task.group = j.value("group", "");
    record.task.displayName = j.value("displayName", "");

    auto status = taskStatusFromString(j.value("status", ""));
    if (!status) {
        return std::nullopt;
    }
    record.status = *status;
    record.progress = j.value("progress", 0.0);
    record.error = j.value("error", "");
    return record;
}

} // anonymous namespace

TaskDatabase::TaskDatabase(std::filesystem::path path)
    : m_path(std::move(path)) {
}

size_t TaskDatabase::load() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_records.clear();
    m_order.clear();

    if (m_path.empty()) {
        return 0;
    }

    auto content = utils::FileUtils::readFile(m_path);
    if (!content) {
        return 0;
    }

    json j = json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.contains("tasks") || !j["tasks"].is_array()) {
        LOG_WARN("Ignoring unreadable task database {}", m_path.string());
        return 0;
    }

    size_t interrupted = 0;
    for (const auto& entry : j["tasks"]) {
        auto record = recordFromJson(entry);
        if (!record) {
            LOG_WARN("Skipping malformed task record");
            continue;
        }

        // The worker that owned it died with the previous process
        if (isActive(record->status)) {
            record->status = TaskStatus::Failed;
            record->error = "interrupted";
            ++interrupted;
        }

        if (m_records.count(record->taskId()) == 0) {
            m_order.push_back(record->taskId());
        }
        m_records[record->taskId()] = *record;
    }

    if (interrupted > 0) {
        LOG_INFO("Marked {} interrupted tasks as failed", interrupted);
        saveLocked();
    }

    LOG_DEBUG("Loaded {} task records from {}", m_records.size(), m_path.string());
    return m_records.size();
}

void TaskDatabase::put(const TaskRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_records.count(record.taskId()) == 0) {
        m_order.push_back(record.taskId());
    }
    m_records[record.taskId()] = record;
    saveLocked();
}

bool TaskDatabase::updateStatus(const std::string& taskId, TaskStatus status, const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_records.find(taskId);
    if (it == m_records.end()) {
        return false;
    }

    it->second.status = status;
    it->second.error = error;
    if (status == TaskStatus::Complete) {
        it->second.progress = 1.0;
    }
    saveLocked();
    return true;
}

bool TaskDatabase::updateProgress(const std::string& taskId, double progress) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_records.find(taskId);
    if (it == m_records.end()) {
        return false;
    }
    it->second.progress = std::clamp(progress, 0.0, 1.0);
    return true;
}

std::optional<TaskRecord> TaskDatabase::get(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_records.find(taskId);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TaskDatabase::remove(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_records.erase(taskId) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), taskId), m_order.end());
    saveLocked();
    return true;
}

std::vector<TaskRecord> TaskDatabase::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<TaskRecord> result;
    result.reserve(m_order.size());
    for (const auto& taskId : m_order) {
        result.push_back(m_records.at(taskId));
    }
    return result;
}

size_t TaskDatabase::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

void TaskDatabase::saveLocked() const {
    if (m_path.empty()) {
        return;
    }

    json tasks = json::array();
    for (const auto& taskId : m_order) {
        tasks.push_back(recordToJson(m_records.at(taskId)));
    }

    json j = {
        {"version", 1},
        {"tasks", tasks}
    };

    if (!utils::FileUtils::writeFileAtomic(m_path, j.dump(2))) {
        LOG_WARN("Failed to save task database {}", m_path.string());
    }
}

} // namespace kitzi::core::downloads
