/**
 * FileUtils.cpp
 *
 * Non-throwing file system operations.
 */

#include "FileUtils.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace kitzi::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::removeDirectoryRecursive(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool FileUtils::directoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<fs::path> FileUtils::listFiles(const fs::path& path, const std::string& extension) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return files;

    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            if (extension.empty() || it->path().extension() == extension) {
                files.push_back(it->path());
            }
        }
    }
    return files;
}

std::vector<fs::path> FileUtils::listDirectories(const fs::path& path) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return dirs;

    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_directory(typeEc)) dirs.push_back(it->path());
    }
    return dirs;
}

bool FileUtils::copyDirectory(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) return false;
    fs::copy(source, destination,
             fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    return !ec;
}

bool FileUtils::moveDirectory(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
    }
    // rename() refuses a non-empty target; an empty one is replaced
    if (fs::is_directory(destination, ec) && fs::is_empty(destination, ec)) {
        fs::remove(destination, ec);
    }
    fs::rename(source, destination, ec);
    return !ec;
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    return !ec;
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeFileAtomic(const fs::path& path, const std::string& content) {
    if (path.has_parent_path() && !createDirectories(path.parent_path())) {
        return false;
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) return false;
        file << content;
        if (!file.good()) return false;
    }
    return moveFile(tmp, path);
}

} // namespace kitzi::utils
