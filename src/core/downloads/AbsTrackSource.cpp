/**
 * AbsTrackSource.cpp
 *
 * Playback session requests and audioTracks parsing.
 */

#include "AbsTrackSource.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace kitzi::core::downloads {

using json = nlohmann::json;

namespace {

std::string trimTrailingSlashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

bool hasScheme(const std::string& url) {
    auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    return std::all_of(url.begin(), url.begin() + pos, [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

} // anonymous namespace

AbsTrackSource::AbsTrackSource(std::string serverUrl, std::string token, int timeoutMs)
    : m_serverUrl(trimTrailingSlashes(std::move(serverUrl)))
    , m_token(std::move(token))
    , m_timeoutMs(timeoutMs) {
}

AbsTrackSource AbsTrackSource::fromConfig() {
    auto& config = Config::instance();
    return AbsTrackSource(
        config.get<std::string>("server.url", ""),
        config.get<std::string>("server.token", ""),
        config.get<int>("server.timeoutMs", 30000)
    );
}

std::vector<Track> AbsTrackSource::getTracks(const std::string& itemId,
                                             const std::optional<std::string>& episodeId) {
    if (m_serverUrl.empty()) {
        throw TrackSourceError("No server configured");
    }

    json body = {
        {"deviceInfo", {{"clientVersion", CLIENT_VERSION}}},
        {"supportedMimeTypes", {"audio/mpeg", "audio/mp4", "audio/aac", "audio/flac"}}
    };

    std::string url = m_serverUrl + sessionPath(itemId, episodeId);
    LOG_DEBUG("Opening playback session: {}", url);

    cpr::Response response = cpr::Post(
        cpr::Url{url},
        cpr::Header{
            {"Content-Type", "application/json"},
            {"Authorization", "Bearer " + m_token}
        },
        cpr::Body{body.dump()},
        cpr::Timeout{m_timeoutMs}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        throw TrackSourceError("Session request failed: " + response.error.message);
    }
    if (response.status_code != 200) {
        throw TrackSourceError("Failed to open session: HTTP " + std::to_string(response.status_code));
    }

    auto tracks = parseTracks(response.text, m_serverUrl, m_token);
    LOG_INFO("{} has {} remote tracks", itemId, tracks.size());
    return tracks;
}

std::vector<Track> AbsTrackSource::parseTracks(const std::string& body,
                                               const std::string& serverUrl,
                                               const std::string& token) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw TrackSourceError("Malformed session response");
    }

    std::vector<Track> tracks;

    auto it = data.find("audioTracks");
    if (it == data.end() || !it->is_array()) {
        return tracks;
    }

    try {
        for (const auto& entry : *it) {
            if (!entry.is_object()) continue;

            Track track;
            track.index = entry.value("index", 0);
            track.durationSeconds = entry.value("duration", 0.0);

            auto mime = entry.find("mimeType");
            track.mimeType = (mime != entry.end() && mime->is_string() && !mime->get<std::string>().empty())
                ? mime->get<std::string>()
                : DEFAULT_MIME;

            std::string contentUrl = entry.value("contentUrl", "");
            track.url = withToken(resolveUrl(serverUrl, contentUrl), token);

            tracks.push_back(std::move(track));
        }
    } catch (const json::exception& e) {
        throw TrackSourceError(std::string("Malformed audio track: ") + e.what());
    }

    std::sort(tracks.begin(), tracks.end(), [](const Track& a, const Track& b) {
        return a.index < b.index;
    });
    return tracks;
}

std::string AbsTrackSource::resolveUrl(const std::string& serverUrl, const std::string& contentUrl) {
    if (hasScheme(contentUrl)) {
        return contentUrl;
    }

    std::string relative = contentUrl;
    if (!relative.empty() && relative.front() == '/') {
        relative.erase(0, 1);
    }
    return trimTrailingSlashes(serverUrl) + "/" + relative;
}

std::string AbsTrackSource::withToken(const std::string& url, const std::string& token) {
    if (token.empty()) {
        return url;
    }

    auto query = url.find('?');
    if (query != std::string::npos) {
        std::string params = "&" + url.substr(query + 1);
        if (params.find("&token=") != std::string::npos) {
            return url;
        }
        return url + "&token=" + token;
    }
    return url + "?token=" + token;
}

std::string AbsTrackSource::sessionPath(const std::string& itemId,
                                        const std::optional<std::string>& episodeId) {
    std::string path = "/api/items/" + itemId + "/play";
    if (episodeId && !episodeId->empty()) {
        path += "/" + *episodeId;
    }
    return path;
}

} // namespace kitzi::core::downloads
