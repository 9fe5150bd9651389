#pragma once

/**
 * DownloadStorage.hpp
 *
 * On-disk layout of downloaded books and the best-effort cleanup used
 * by cancellation and deletion.
 *
 * Layout: <documentsRoot>/<baseSubfolder>/lib_<libraryId>/<itemId>/track_NNN.ext
 */

#include <filesystem>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

namespace fs = std::filesystem;

class DownloadStorage {
public:
    static constexpr const char* DEFAULT_BASE_SUBFOLDER = "abs";
    static constexpr const char* DEFAULT_LIBRARY_ID = "default";

    /**
     * @param documentsRoot Root the transfer engine resolves task directories against
     */
    explicit DownloadStorage(fs::path documentsRoot);

    const fs::path& documentsRoot() const { return m_documentsRoot; }

    /**
     * Configured base subfolder ("downloads.baseSubfolder"), "abs" when blank
     */
    std::string baseSubfolder() const;

    /**
     * Active library id ("library.id"), "default" when blank
     */
    std::string libraryId() const;

    /**
     * "<baseSubfolder>/lib_<libraryId>"
     */
    std::string taskDirectoryPrefix() const;

    fs::path baseDirectory() const;

    /**
     * An item id names exactly one directory below baseDirectory():
     * not empty, not "." or "..", not rooted, no '/' or '\\'.
     */
    static bool isValidItemId(const std::string& itemId);

    /**
     * Directory handed to the transfer engine, relative to documentsRoot
     * @throws std::invalid_argument if !isValidItemId(itemId)
     */
    std::string taskDirectory(const std::string& itemId) const;

    /**
     * @throws std::invalid_argument if !isValidItemId(itemId)
     */
    fs::path itemDirectory(const std::string& itemId) const;

    fs::path trackPath(const std::string& itemId, int index, const std::string& mimeType) const;

    /**
     * mpeg -> mp3, mp4/aac -> m4a, flac -> flac, anything else -> bin
     */
    static std::string extensionForMime(const std::string& mimeType);

    /**
     * "track_<index zero-padded to 3>.<ext>"
     */
    static std::string trackFileName(int index, const std::string& mimeType);

    /**
     * Change the base subfolder and migrate existing downloads.
     * Tries a rename first, falls back to copy + delete. The new name is
     * stored even when migration fails.
     * @param name New subfolder (blank = default)
     * @return true if the data ended up under the new folder
     */
    bool setBaseSubfolder(const std::string& name);

    /**
     * Delete *.part and *.tmp leftovers of an item
     * @return Number of files removed, 0 for an invalid item id
     */
    size_t removeTempFiles(const std::string& itemId) const;

    /**
     * Best-effort single file delete. Refuses paths outside baseDirectory().
     */
    bool removeFile(const fs::path& path) const;

    /**
     * Recursively delete an item's directory
     * @return false for an invalid item id or a directory that resolves
     *         outside baseDirectory() (e.g. through a symlink)
     */
    bool removeItemDirectory(const std::string& itemId) const;

    /**
     * True if path, with symlinks resolved, lies strictly below baseDirectory()
     */
    bool isInsideBaseDirectory(const fs::path& path) const;

    /**
     * Sorted ids of item directories containing at least one file
     */
    std::vector<std::string> listItemIdsWithLocalDownloads() const;

private:
    fs::path m_documentsRoot;
};

} // namespace kitzi::core::downloads
