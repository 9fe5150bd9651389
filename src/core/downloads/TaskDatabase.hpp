#pragma once

/**
 * TaskDatabase.hpp
 *
 * Durable task records of the HTTP transfer engine, persisted as a
 * JSON document so they survive restarts.
 */

#include "DownloadTypes.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kitzi::core::downloads {

/**
 * TaskDatabase - thread-safe record store
 *
 * Every mutation is written through to disk. Write failures are logged
 * and the in-memory state stays authoritative.
 */
class TaskDatabase {
public:
    /**
     * @param path Database file (empty = memory only)
     */
    explicit TaskDatabase(std::filesystem::path path = {});

    /**
     * Read the file. Records left enqueued or running by a previous
     * process are marked failed.
     * @return Number of records loaded
     */
    size_t load();

    /**
     * Insert or replace a record
     */
    void put(const TaskRecord& record);

    /**
     * @return false if the task is unknown
     */
    bool updateStatus(const std::string& taskId, TaskStatus status, const std::string& error = "");

    /**
     * Progress is kept in memory only; it is persisted with the next status change
     */
    bool updateProgress(const std::string& taskId, double progress);

    std::optional<TaskRecord> get(const std::string& taskId) const;

    bool remove(const std::string& taskId);

    /**
     * Records in insertion order
     */
    std::vector<TaskRecord> all() const;

    size_t size() const;

    const std::filesystem::path& path() const { return m_path; }

private:
    void saveLocked() const;

    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, TaskRecord> m_records;
    std::vector<std::string> m_order;
};

} // namespace kitzi::core::downloads
