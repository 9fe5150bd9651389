/**
 * DownloadStorage.cpp
 *
 * Storage layout, subfolder migration and cleanup.
 */

#include "DownloadStorage.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace kitzi::core::downloads {

using utils::FileUtils;

namespace {

std::string trimmed(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

DownloadStorage::DownloadStorage(fs::path documentsRoot)
    : m_documentsRoot(std::move(documentsRoot)) {
}

std::string DownloadStorage::baseSubfolder() const {
    std::string name = trimmed(Config::instance().get<std::string>(
        "downloads.baseSubfolder", DEFAULT_BASE_SUBFOLDER));
    return name.empty() ? DEFAULT_BASE_SUBFOLDER : name;
}

std::string DownloadStorage::libraryId() const {
    std::string id = trimmed(Config::instance().get<std::string>("library.id", DEFAULT_LIBRARY_ID));
    return id.empty() ? DEFAULT_LIBRARY_ID : id;
}

std::string DownloadStorage::taskDirectoryPrefix() const {
    return baseSubfolder() + "/lib_" + libraryId();
}

fs::path DownloadStorage::baseDirectory() const {
    return m_documentsRoot / baseSubfolder() / ("lib_" + libraryId());
}

bool DownloadStorage::isValidItemId(const std::string& itemId) {
    if (itemId.empty() || itemId == "." || itemId == "..") {
        return false;
    }
    if (itemId.find_first_of("/\\") != std::string::npos || itemId.find('\0') != std::string::npos) {
        return false;
    }
    return !fs::path(itemId).has_root_name();
}

std::string DownloadStorage::taskDirectory(const std::string& itemId) const {
    if (!isValidItemId(itemId)) {
        throw std::invalid_argument("Invalid item id: " + itemId);
    }
    return taskDirectoryPrefix() + "/" + itemId;
}

fs::path DownloadStorage::itemDirectory(const std::string& itemId) const {
    if (!isValidItemId(itemId)) {
        throw std::invalid_argument("Invalid item id: " + itemId);
    }
    return baseDirectory() / itemId;
}

fs::path DownloadStorage::trackPath(const std::string& itemId, int index,
                                    const std::string& mimeType) const {
    return itemDirectory(itemId) / trackFileName(index, mimeType);
}

std::string DownloadStorage::extensionForMime(const std::string& mimeType) {
    std::string mime = lowercase(mimeType);
    if (mime.find("mpeg") != std::string::npos) return "mp3";
    if (mime.find("mp4") != std::string::npos || mime.find("aac") != std::string::npos) return "m4a";
    if (mime.find("flac") != std::string::npos) return "flac";
    return "bin";
}

std::string DownloadStorage::trackFileName(int index, const std::string& mimeType) {
    std::ostringstream name;
    name << "track_" << std::setw(3) << std::setfill('0') << index
         << '.' << extensionForMime(mimeType);
    return name.str();
}

bool DownloadStorage::setBaseSubfolder(const std::string& name) {
    auto& config = Config::instance();

    std::string oldName = baseSubfolder();
    std::string newName = trimmed(name);
    if (newName.empty()) {
        newName = DEFAULT_BASE_SUBFOLDER;
    }

    if (oldName == newName) {
        return true;
    }

    fs::path oldBase = m_documentsRoot / oldName;
    fs::path newBase = m_documentsRoot / newName;

    LOG_INFO("Migrating downloads from {} -> {}", oldBase.string(), newBase.string());

    bool migrated = true;
    if (FileUtils::directoryExists(oldBase)) {
        if (!FileUtils::moveDirectory(oldBase, newBase)) {
            LOG_DEBUG("Rename failed, copying {} instead", oldBase.string());
            migrated = FileUtils::copyDirectory(oldBase, newBase);
            if (migrated && !FileUtils::removeDirectoryRecursive(oldBase)) {
                LOG_WARN("Could not remove old download folder {}", oldBase.string());
            }
        }
    } else {
        migrated = FileUtils::createDirectories(newBase);
    }

    if (!migrated) {
        LOG_ERROR("Migration to {} failed; new downloads will still use it", newBase.string());
    }

    // Stored regardless so future downloads land in the new folder
    config.set("downloads.baseSubfolder", newName);
    if (!config.save()) {
        LOG_WARN("Could not persist downloads.baseSubfolder");
    }
    return migrated;
}

size_t DownloadStorage::removeTempFiles(const std::string& itemId) const {
    if (!isValidItemId(itemId)) {
        LOG_WARN("Refusing cleanup for invalid item id '{}'", itemId);
        return 0;
    }

    size_t removed = 0;
    for (const auto& file : FileUtils::listFiles(itemDirectory(itemId))) {
        auto ext = file.extension().string();
        if (ext != ".part" && ext != ".tmp") {
            continue;
        }
        if (FileUtils::deleteFile(file)) {
            ++removed;
        } else {
            LOG_WARN("Could not delete leftover {}", file.string());
        }
    }
    return removed;
}

bool DownloadStorage::removeFile(const fs::path& path) const {
    if (!FileUtils::fileExists(path)) {
        return false;
    }
    if (!isInsideBaseDirectory(path)) {
        LOG_WARN("Refusing to delete {} outside {}", path.string(), baseDirectory().string());
        return false;
    }
    if (!FileUtils::deleteFile(path)) {
        LOG_WARN("Could not delete {}", path.string());
        return false;
    }
    return true;
}

bool DownloadStorage::removeItemDirectory(const std::string& itemId) const {
    if (!isValidItemId(itemId)) {
        LOG_WARN("Refusing to delete directory of invalid item id '{}'", itemId);
        return false;
    }

    fs::path dir = itemDirectory(itemId);
    if (!FileUtils::directoryExists(dir)) {
        return true;
    }
    if (!isInsideBaseDirectory(dir)) {
        LOG_WARN("Refusing to delete {}: resolves outside {}", dir.string(), baseDirectory().string());
        return false;
    }
    if (!FileUtils::removeDirectoryRecursive(dir)) {
        LOG_WARN("Could not delete {}", dir.string());
        return false;
    }
    return true;
}

bool DownloadStorage::isInsideBaseDirectory(const fs::path& path) const {
    std::error_code ec;
    fs::path base = fs::weakly_canonical(baseDirectory(), ec);
    if (ec) {
        return false;
    }
    fs::path target = fs::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }

    fs::path relative = target.lexically_relative(base);
    if (relative.empty() || relative == ".") {
        return false;
    }
    return *relative.begin() != "..";
}

std::vector<std::string> DownloadStorage::listItemIdsWithLocalDownloads() const {
    std::vector<std::string> ids;
    for (const auto& dir : FileUtils::listDirectories(baseDirectory())) {
        if (!FileUtils::listFiles(dir).empty()) {
            ids.push_back(dir.filename().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace kitzi::core::downloads
