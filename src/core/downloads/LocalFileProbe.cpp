#include "LocalFileProbe.hpp"
#include "../../utils/FileUtils.hpp"

#include <algorithm>
#include <cctype>

namespace kitzi::core::downloads {

using utils::FileUtils;

LocalFileProbe::LocalFileProbe(const DownloadStorage& storage)
    : m_storage(storage) {
}

std::optional<int> LocalFileProbe::parseTrackIndex(const std::string& fileName) {
    static const std::string prefix = "track_";
    if (fileName.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    size_t pos = prefix.size();
    size_t digitsEnd = pos;
    while (digitsEnd < fileName.size() && std::isdigit(static_cast<unsigned char>(fileName[digitsEnd]))) {
        ++digitsEnd;
    }
    if (digitsEnd - pos < 3 || digitsEnd >= fileName.size() || fileName[digitsEnd] != '.') {
        return std::nullopt;
    }

    std::string ext = fileName.substr(digitsEnd + 1);
    if (ext.empty() || ext.find('.') != std::string::npos || ext == "part" || ext == "tmp") {
        return std::nullopt;
    }

    try {
        return std::stoi(fileName.substr(pos, digitsEnd - pos));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::set<int> LocalFileProbe::existingTrackIndices(const std::string& itemId) const {
    std::set<int> indices;
    if (!DownloadStorage::isValidItemId(itemId)) {
        return indices;
    }
    for (const auto& file : FileUtils::listFiles(m_storage.itemDirectory(itemId))) {
        if (auto index = parseTrackIndex(file.filename().string())) {
            indices.insert(*index);
        }
    }
    return indices;
}

int LocalFileProbe::countLocalTracks(const std::string& itemId) const {
    return static_cast<int>(existingTrackIndices(itemId).size());
}

bool LocalFileProbe::hasTrack(const std::string& itemId, const Track& track) const {
    if (!DownloadStorage::isValidItemId(itemId)) {
        return false;
    }
    return FileUtils::fileExists(m_storage.trackPath(itemId, track.index, track.mimeType));
}

std::optional<Track> LocalFileProbe::firstMissingTrack(const std::string& itemId,
                                                       std::vector<Track> tracks) const {
    std::sort(tracks.begin(), tracks.end(),
              [](const Track& a, const Track& b) { return a.index < b.index; });

    for (const auto& track : tracks) {
        if (!hasTrack(itemId, track)) {
            return track;
        }
    }
    return std::nullopt;
}

} // namespace kitzi::core::downloads
