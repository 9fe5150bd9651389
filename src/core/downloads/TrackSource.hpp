#pragma once

/**
 * TrackSource.hpp
 *
 * Supplies the ordered remote track list of an item.
 */

#include "DownloadTypes.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

/**
 * Raised when the track list cannot be fetched or parsed
 */
class TrackSourceError : public std::runtime_error {
public:
    explicit TrackSourceError(const std::string& what)
        : std::runtime_error(what) {}
};

class TrackSource {
public:
    virtual ~TrackSource() = default;

    /**
     * Fetch the tracks of an item (or one podcast episode)
     * @throws TrackSourceError
     */
    virtual std::vector<Track> getTracks(const std::string& itemId,
                                         const std::optional<std::string>& episodeId) = 0;
};

} // namespace kitzi::core::downloads
