#pragma once

/**
 * Config.hpp
 *
 * Configuration and persisted preferences using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace kitzi::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Holds every preference the download core reads (Wi-Fi rule, storage
 * layout, scheduler timings) and the one piece of durable state it owns,
 * the blocked item list. Keys use dot notation ("downloads.wifiOnly").
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file. Keys missing from the file keep
     * their defaults.
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_configPath = path;
        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                return false;
            }
            m_config = defaults();
            m_config.merge_patch(loaded);
            return true;

        } catch (const json::exception&) {
            return false;
        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses the storage path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            // Write-then-rename so a crash never leaves a truncated file
            std::string tmpPath = savePath + ".tmp";
            {
                std::ofstream file(tmpPath, std::ios::trunc);
                if (!file.is_open()) {
                    return false;
                }
                file << m_config.dump(4);
                if (!file.good()) {
                    return false;
                }
            }
            std::filesystem::rename(tmpPath, savePath);
            return true;

        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Re-read one key from the config file, keeping every other in-memory
     * value. For values another process may have written since load().
     * @param key Key path
     * @return true if the file was read; a key the file lacks is left as is
     */
    bool refresh(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_configPath.empty()) {
            return false;
        }

        try {
            std::ifstream file(m_configPath);
            if (!file.is_open()) {
                return false;
            }

            json stored = json::parse(file);
            json::json_pointer ptr = toJsonPointer(key);
            if (stored.is_object() && stored.contains(ptr)) {
                m_config[ptr] = stored.at(ptr);
            }
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Set the file that save() writes to when called without a path
     * @param path Config file path
     */
    void setStoragePath(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configPath = path;
    }

    /**
     * Reset every key to its default value
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.wifiOnly")
     * @param defaultValue Default value if key not found or mistyped
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Read a string list. Non-string entries are skipped.
     * @param key Key path
     * @return List (empty if absent)
     */
    std::vector<std::string> getStringList(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<std::string> result;
        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (!m_config.contains(ptr) || !m_config.at(ptr).is_array()) {
                return result;
            }
            for (const auto& entry : m_config.at(ptr)) {
                if (entry.is_string()) {
                    result.push_back(entry.get<std::string>());
                }
            }
        } catch (const json::exception&) {
            result.clear();
        }
        return result;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     * @return false if the key path could not be written
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

private:
    Config() : m_config(defaults()) {}

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json defaults() {
        return {
            {"version", "1.0.0"},
            {"logging", {
                {"level", "info"}
            }},
            {"server", {
                {"url", ""},
                {"token", ""},
                {"timeoutMs", 30000}
            }},
            {"library", {
                {"id", "default"}
            }},
            {"downloads", {
                {"wifiOnly", true},
                {"baseSubfolder", "abs"},
                {"blockedItems", json::array()},
                {"debounceMs", 150},
                {"staleAfterMs", 2000},
                {"rescheduleThrottleMs", 750},
                {"haltWindowMs", 1500},
                {"queuedGraceMs", 3000},
                {"settleDelayMs", 100}
            }},
            {"transfer", {
                {"workers", 1},
                {"timeoutMs", 0},
                {"unmeteredNetwork", true}
            }}
        };
    }

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace kitzi::core
