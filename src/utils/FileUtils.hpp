// Kitzi - File Utilities
// Non-throwing file system helpers used by the download storage

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace kitzi::utils {

/**
 * @brief File and directory utilities
 *
 * Every function reports failure through its return value and never
 * throws; callers on cleanup paths rely on that.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool removeDirectoryRecursive(const fs::path& path);
    static bool directoryExists(const fs::path& path);
    static std::vector<fs::path> listFiles(const fs::path& path, const std::string& extension = "");
    static std::vector<fs::path> listDirectories(const fs::path& path);
    static bool copyDirectory(const fs::path& source, const fs::path& destination);
    static bool moveDirectory(const fs::path& source, const fs::path& destination);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);
    static bool writeFileAtomic(const fs::path& path, const std::string& content);
};

} // namespace kitzi::utils
