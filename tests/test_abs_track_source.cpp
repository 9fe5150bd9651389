/**
 * test_abs_track_source.cpp
 *
 * Session response parsing and URL handling of AbsTrackSource.
 * No network access: only the offline helpers are exercised.
 */

#include "TestSupport.hpp"
#include "core/downloads/AbsTrackSource.hpp"

using namespace kitzi::test;

bool TestParseTracks() {
    std::cout << "Testing audioTracks parsing..." << std::endl;

    const std::string body = R"({
        "id": "play_1",
        "audioTracks": [
            {"index": 2, "duration": 61.5, "mimeType": "audio/mp4",
             "contentUrl": "/api/items/li_1/file/3"},
            {"index": 0, "duration": 600, "mimeType": "audio/mpeg",
             "contentUrl": "/api/items/li_1/file/1?ext=mp3"},
            {"index": 1, "contentUrl": "https://cdn.example.org/f/2"}
        ]
    })";

    auto tracks = AbsTrackSource::parseTracks(body, "https://abs.example.org", "tok");
    ASSERT_EQ(tracks.size(), size_t(3), "Three tracks");

    ASSERT_EQ(tracks[0].index, 0, "Sorted by index");
    ASSERT_EQ(tracks[0].url, std::string("https://abs.example.org/api/items/li_1/file/1?ext=mp3&token=tok"),
              "Relative URL resolved, token appended to query");
    ASSERT_NEAR(tracks[0].durationSeconds, 600.0, 1e-9, "Duration");

    ASSERT_EQ(tracks[1].mimeType, std::string("audio/mpeg"), "Default mime type");
    ASSERT_EQ(tracks[1].url, std::string("https://cdn.example.org/f/2?token=tok"), "Absolute URL kept");

    ASSERT_EQ(tracks[2].mimeType, std::string("audio/mp4"), "Mime type kept");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestParseEdgeCases() {
    std::cout << "Testing malformed and empty responses..." << std::endl;

    ASSERT_TRUE(AbsTrackSource::parseTracks("{}", "https://abs", "").empty(), "No audioTracks");
    ASSERT_TRUE(AbsTrackSource::parseTracks("{\"audioTracks\":[]}", "https://abs", "").empty(), "Empty list");

    bool threw = false;
    try {
        AbsTrackSource::parseTracks("<html>", "https://abs", "");
    } catch (const TrackSourceError&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "Non-JSON body throws TrackSourceError");

    threw = false;
    try {
        AbsTrackSource::parseTracks("{\"audioTracks\":[{\"index\":\"zero\"}]}", "https://abs", "");
    } catch (const TrackSourceError&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "Mistyped field throws TrackSourceError");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestUrlHelpers() {
    std::cout << "Testing URL resolution and token handling..." << std::endl;

    ASSERT_EQ(AbsTrackSource::resolveUrl("https://abs.example.org/", "/a/b"),
              std::string("https://abs.example.org/a/b"), "Slashes joined once");
    ASSERT_EQ(AbsTrackSource::resolveUrl("https://abs.example.org", "a/b"),
              std::string("https://abs.example.org/a/b"), "Missing slash added");
    ASSERT_EQ(AbsTrackSource::resolveUrl("https://abs.example.org", "http://other/x"),
              std::string("http://other/x"), "Absolute URL untouched");

    ASSERT_EQ(AbsTrackSource::withToken("https://h/x", ""), std::string("https://h/x"), "No token");
    ASSERT_EQ(AbsTrackSource::withToken("https://h/x?token=old", "new"),
              std::string("https://h/x?token=old"), "Existing token kept");
    ASSERT_EQ(AbsTrackSource::withToken("https://h/x?a=1&token=old", "new"),
              std::string("https://h/x?a=1&token=old"), "Existing token later in query kept");
    ASSERT_EQ(AbsTrackSource::withToken("https://h/x?mytoken=1", "t"),
              std::string("https://h/x?mytoken=1&token=t"), "Similar name is not a token");

    ASSERT_EQ(AbsTrackSource::sessionPath("li_1", std::nullopt), std::string("/api/items/li_1/play"), "Book");
    ASSERT_EQ(AbsTrackSource::sessionPath("li_1", std::string("ep_9")),
              std::string("/api/items/li_1/play/ep_9"), "Episode");
    ASSERT_EQ(AbsTrackSource::sessionPath("li_1", std::string("")),
              std::string("/api/items/li_1/play"), "Empty episode ignored");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestNoServerConfigured() {
    std::cout << "Testing a source without server refuses to fetch..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());

    AbsTrackSource source = AbsTrackSource::fromConfig();
    ASSERT_TRUE(source.serverUrl().empty(), "Default config has no server");

    bool threw = false;
    try {
        source.getTracks("li_1", std::nullopt);
    } catch (const TrackSourceError&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "getTracks throws TrackSourceError");

    AbsTrackSource trimmed("https://abs.example.org///", "tok");
    ASSERT_EQ(trimmed.serverUrl(), std::string("https://abs.example.org"), "Trailing slashes trimmed");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " Track Source Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestParseTracks, "Parse tracks");
    run_test(TestParseEdgeCases, "Parse edge cases");
    run_test(TestUrlHelpers, "URL helpers");
    run_test(TestNoServerConfigured, "No server configured");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
