/**
 * test_local_file_probe.cpp
 *
 * On-disk layout of DownloadStorage and the track detection of
 * LocalFileProbe.
 */

#include "TestSupport.hpp"
#include "core/downloads/DownloadStorage.hpp"
#include "core/downloads/LocalFileProbe.hpp"

#include <stdexcept>

using namespace kitzi::test;

namespace {

Track track(int index, const std::string& mime = "audio/mpeg") {
    Track t;
    t.index = index;
    t.mimeType = mime;
    return t;
}

} // namespace

bool TestLayout() {
    std::cout << "Testing directory layout and file names..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());
    DownloadStorage storage(dir.path() / "docs");

    ASSERT_EQ(storage.taskDirectory("li_1"), std::string("abs/lib_default/li_1"), "Relative task directory");
    ASSERT_TRUE(storage.itemDirectory("li_1") == dir.path() / "docs" / "abs" / "lib_default" / "li_1",
                "Absolute item directory");

    Config::instance().set("library.id", std::string("lib9"));
    ASSERT_EQ(storage.taskDirectory("li_1"), std::string("abs/lib_lib9/li_1"), "Library id from config");

    Config::instance().set("downloads.baseSubfolder", std::string("   "));
    ASSERT_EQ(storage.baseSubfolder(), std::string("abs"), "Blank subfolder falls back");

    ASSERT_EQ(DownloadStorage::trackFileName(0, "audio/mpeg"), std::string("track_000.mp3"), "mp3");
    ASSERT_EQ(DownloadStorage::trackFileName(12, "audio/MP4"), std::string("track_012.m4a"), "m4a");
    ASSERT_EQ(DownloadStorage::trackFileName(3, "audio/aac"), std::string("track_003.m4a"), "aac");
    ASSERT_EQ(DownloadStorage::trackFileName(4, "audio/flac"), std::string("track_004.flac"), "flac");
    ASSERT_EQ(DownloadStorage::trackFileName(1000, "audio/ogg"), std::string("track_1000.bin"), "Unknown mime");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestParseTrackIndex() {
    std::cout << "Testing track file name parsing..." << std::endl;

    ASSERT_EQ(*LocalFileProbe::parseTrackIndex("track_000.mp3"), 0, "track_000");
    ASSERT_EQ(*LocalFileProbe::parseTrackIndex("track_017.m4a"), 17, "track_017");
    ASSERT_EQ(*LocalFileProbe::parseTrackIndex("track_1234.flac"), 1234, "Four digits");

    ASSERT_FALSE(LocalFileProbe::parseTrackIndex("track_01.mp3").has_value(), "Too few digits");
    ASSERT_FALSE(LocalFileProbe::parseTrackIndex("track_001.mp3.part").has_value(), "Partial file");
    ASSERT_FALSE(LocalFileProbe::parseTrackIndex("track_001.part").has_value(), "Part extension");
    ASSERT_FALSE(LocalFileProbe::parseTrackIndex("track_001.tmp").has_value(), "Tmp extension");
    ASSERT_FALSE(LocalFileProbe::parseTrackIndex("track_001").has_value(), "No extension");
    ASSERT_FALSE(LocalFileProbe::parseTrackIndex("cover.jpg").has_value(), "Other file");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestProbe() {
    std::cout << "Testing local track detection..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());
    DownloadStorage storage(dir.path() / "docs");
    LocalFileProbe probe(storage);

    ASSERT_EQ(probe.countLocalTracks("book"), 0, "Missing directory counts zero");

    auto itemDir = storage.itemDirectory("book");
    writeFile(itemDir / "track_000.mp3");
    writeFile(itemDir / "track_002.mp3");
    writeFile(itemDir / "track_001.mp3.part");
    writeFile(itemDir / "cover.jpg");

    ASSERT_EQ(probe.countLocalTracks("book"), 2, "Partial and foreign files ignored");

    std::vector<Track> tracks = {track(2), track(0), track(1)};
    auto missing = probe.firstMissingTrack("book", tracks);
    ASSERT_TRUE(missing.has_value(), "Track 1 missing");
    ASSERT_EQ(missing->index, 1, "Lowest missing index");

    writeFile(itemDir / "track_001.mp3");
    ASSERT_FALSE(probe.firstMissingTrack("book", tracks).has_value(), "All present");

    // Same index with a different container does not count as present
    ASSERT_FALSE(probe.hasTrack("book", track(0, "audio/flac")), "Extension must match");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestCleanup() {
    std::cout << "Testing partial file and directory cleanup..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());
    DownloadStorage storage(dir.path() / "docs");

    auto itemDir = storage.itemDirectory("book");
    writeFile(itemDir / "track_000.mp3");
    writeFile(itemDir / "track_001.mp3.part");
    writeFile(itemDir / "track_002.mp3.tmp");

    ASSERT_EQ(storage.removeTempFiles("book"), size_t(2), "Two leftovers removed");
    ASSERT_TRUE(fs::exists(itemDir / "track_000.mp3"), "Finished track kept");

    ASSERT_TRUE(storage.removeFile(itemDir / "track_000.mp3"), "File removed");
    ASSERT_FALSE(storage.removeFile(itemDir / "track_000.mp3"), "Already gone");

    writeFile(itemDir / "track_000.mp3");
    ASSERT_TRUE(storage.removeItemDirectory("book"), "Directory removed");
    ASSERT_FALSE(fs::exists(itemDir), "Directory gone");
    ASSERT_TRUE(storage.removeItemDirectory("book"), "Absent directory is fine");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestListDownloadedItems() {
    std::cout << "Testing listing of items with local files..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());
    DownloadStorage storage(dir.path() / "docs");

    ASSERT_TRUE(storage.listItemIdsWithLocalDownloads().empty(), "Nothing yet");

    writeFile(storage.itemDirectory("zeta") / "track_000.mp3");
    writeFile(storage.itemDirectory("alpha") / "track_000.mp3");
    fs::create_directories(storage.itemDirectory("empty"));

    auto ids = storage.listItemIdsWithLocalDownloads();
    ASSERT_EQ(ids.size(), size_t(2), "Empty directory skipped");
    ASSERT_EQ(ids[0], std::string("alpha"), "Sorted");
    ASSERT_EQ(ids[1], std::string("zeta"), "Sorted");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestSubfolderMigration() {
    std::cout << "Testing base subfolder migration..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());
    DownloadStorage storage(dir.path() / "docs");

    writeFile(storage.itemDirectory("book") / "track_000.mp3", "abc");

    ASSERT_TRUE(storage.setBaseSubfolder("Audiobooks"), "Migration succeeds");
    ASSERT_EQ(storage.baseSubfolder(), std::string("Audiobooks"), "New subfolder active");
    ASSERT_EQ(storage.taskDirectory("book"), std::string("Audiobooks/lib_default/book"), "New task directory");

    ASSERT_TRUE(fs::exists(dir.path() / "docs" / "Audiobooks" / "lib_default" / "book" / "track_000.mp3"),
                "File moved");
    ASSERT_FALSE(fs::exists(dir.path() / "docs" / "abs"), "Old folder gone");

    auto& config = Config::instance();
    config.setDefaults();
    ASSERT_TRUE(config.load((dir.path() / "config.json").string()), "Config persisted");
    ASSERT_EQ(config.get<std::string>("downloads.baseSubfolder", ""), std::string("Audiobooks"), "Setting saved");

    ASSERT_TRUE(storage.setBaseSubfolder("Audiobooks"), "Same name is a no-op");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestItemIdValidation() {
    std::cout << "Testing item ids that do not name a single directory..." << std::endl;

    ASSERT_TRUE(DownloadStorage::isValidItemId("li_1"), "Plain id");
    ASSERT_TRUE(DownloadStorage::isValidItemId("book.v2"), "Dot inside id");
    ASSERT_TRUE(DownloadStorage::isValidItemId("..."), "Three dots is a name");

    ASSERT_FALSE(DownloadStorage::isValidItemId(""), "Empty");
    ASSERT_FALSE(DownloadStorage::isValidItemId("."), "Current directory");
    ASSERT_FALSE(DownloadStorage::isValidItemId(".."), "Parent directory");
    ASSERT_FALSE(DownloadStorage::isValidItemId("../.."), "Two levels up");
    ASSERT_FALSE(DownloadStorage::isValidItemId("a/b"), "Nested path");
    ASSERT_FALSE(DownloadStorage::isValidItemId("a\\b"), "Backslash");
    ASSERT_FALSE(DownloadStorage::isValidItemId("/tmp/victim"), "Absolute path");

    TempDir dir;
    resetConfig(dir.path());
    DownloadStorage storage(dir.path() / "docs");

    bool threw = false;
    try {
        storage.itemDirectory("..");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "No directory for a parent reference");

    threw = false;
    try {
        storage.taskDirectory("/tmp/victim");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "No task directory for an absolute id");

    LocalFileProbe files(storage);
    ASSERT_EQ(files.countLocalTracks(".."), 0, "Nothing counted above the library");
    ASSERT_FALSE(files.hasTrack("../..", track(0)), "No track above the library");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestCleanupStaysInsideLibrary() {
    std::cout << "Testing cleanup never leaves the library folder..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());
    DownloadStorage storage(dir.path() / "docs");

    writeFile(storage.itemDirectory("keep") / "track_000.mp3");
    fs::path victim = dir.path() / "victim";
    writeFile(victim / "important.txt");
    writeFile(victim / "notes.part");

    ASSERT_FALSE(storage.removeItemDirectory(".."), "Parent id refused");
    ASSERT_FALSE(storage.removeItemDirectory("../.."), "Grandparent id refused");
    ASSERT_FALSE(storage.removeItemDirectory(victim.string()), "Absolute id refused");
    ASSERT_FALSE(storage.removeItemDirectory("keep/.."), "Nested id refused");
    ASSERT_FALSE(storage.removeItemDirectory(""), "Empty id refused");
    ASSERT_EQ(storage.removeTempFiles(victim.string()), size_t(0), "No leftovers removed outside");

    ASSERT_TRUE(fs::exists(storage.baseDirectory() / "keep" / "track_000.mp3"), "Library intact");
    ASSERT_TRUE(fs::exists(victim / "important.txt"), "Outside directory intact");
    ASSERT_TRUE(fs::exists(victim / "notes.part"), "Outside leftover intact");

    // A valid id whose directory is a link to somewhere else
    std::error_code ec;
    fs::create_directory_symlink(victim, storage.baseDirectory() / "linked", ec);
    if (!ec) {
        ASSERT_FALSE(storage.removeItemDirectory("linked"), "Linked directory refused");
        ASSERT_TRUE(fs::exists(victim / "important.txt"), "Link target intact");
    }

    ASSERT_FALSE(storage.removeFile(victim / "important.txt"), "File outside refused");
    ASSERT_TRUE(fs::exists(victim / "important.txt"), "File outside intact");

    ASSERT_TRUE(storage.removeItemDirectory("keep"), "Valid id still removed");
    ASSERT_FALSE(fs::exists(storage.itemDirectory("keep")), "Directory gone");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    kitzi::core::Logger::instance().initialize(kitzi::core::LogLevel::Warn);

    std::cout << "======================================" << std::endl;
    std::cout << " Storage and Local File Probe Tests" << std::endl;
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

    run_test(TestLayout, "Layout");
    run_test(TestParseTrackIndex, "Track index parsing");
    run_test(TestProbe, "Probe");
    run_test(TestCleanup, "Cleanup");
    run_test(TestItemIdValidation, "Item id validation");
    run_test(TestCleanupStaysInsideLibrary, "Cleanup stays inside library");
    run_test(TestListDownloadedItems, "List downloaded items");
    run_test(TestSubfolderMigration, "Subfolder migration");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
