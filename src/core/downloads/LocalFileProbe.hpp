#pragma once

/**
 * LocalFileProbe.hpp
 *
 * Read-only scans of an item's download directory. Invalid item ids
 * have no directory: they report no tracks.
 */

#include "DownloadStorage.hpp"
#include "DownloadTypes.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

class LocalFileProbe {
public:
    explicit LocalFileProbe(const DownloadStorage& storage);

    /**
     * Indices of finished track files (track_NNN.<ext>), any extension.
     * .part and .tmp files are not tracks.
     */
    std::set<int> existingTrackIndices(const std::string& itemId) const;

    int countLocalTracks(const std::string& itemId) const;

    /**
     * First track (in index order) whose expected file does not exist
     * @param tracks Track list, any order
     * @return nullopt if every track is present
     */
    std::optional<Track> firstMissingTrack(const std::string& itemId,
                                           std::vector<Track> tracks) const;

    bool hasTrack(const std::string& itemId, const Track& track) const;

    /**
     * Parse "track_NNN.ext" into NNN
     */
    static std::optional<int> parseTrackIndex(const std::string& fileName);

private:
    const DownloadStorage& m_storage;
};

} // namespace kitzi::core::downloads
