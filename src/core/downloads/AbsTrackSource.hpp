#pragma once

/**
 * AbsTrackSource.hpp
 *
 * Track source backed by an audiobook server's playback session API.
 */

#include "TrackSource.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

/**
 * AbsTrackSource - opens a playback session to list an item's tracks
 *
 * POST <server>/api/items/<itemId>/play[/<episodeId>] with a bearer token.
 * Track URLs come back absolute and carry the access token, so the
 * transfer engine can fetch them without extra headers.
 */
class AbsTrackSource : public TrackSource {
public:
    static constexpr const char* CLIENT_VERSION = "kitzi-dl-1.0.0";
    static constexpr const char* DEFAULT_MIME = "audio/mpeg";

    /**
     * @param serverUrl Server base URL, e.g. "https://abs.example.org"
     * @param token Access token
     * @param timeoutMs Request timeout
     */
    AbsTrackSource(std::string serverUrl, std::string token, int timeoutMs = 30000);

    /**
     * Build from the "server.*" config keys
     */
    static AbsTrackSource fromConfig();

    std::vector<Track> getTracks(const std::string& itemId,
                                 const std::optional<std::string>& episodeId) override;

    /**
     * Parse a session response body
     * @throws TrackSourceError on malformed JSON
     */
    static std::vector<Track> parseTracks(const std::string& body,
                                          const std::string& serverUrl,
                                          const std::string& token);

    /**
     * Make a contentUrl absolute against the server URL
     */
    static std::string resolveUrl(const std::string& serverUrl, const std::string& contentUrl);

    /**
     * Append "token=<token>" unless the URL already carries one
     */
    static std::string withToken(const std::string& url, const std::string& token);

    static std::string sessionPath(const std::string& itemId,
                                   const std::optional<std::string>& episodeId);

    const std::string& serverUrl() const { return m_serverUrl; }

private:
    std::string m_serverUrl;
    std::string m_token;
    int m_timeoutMs;
};

} // namespace kitzi::core::downloads
