/**
 * test_blocked_item_registry.cpp
 *
 * Blocked item persistence through the Config file.
 */

#include "TestSupport.hpp"
#include "core/downloads/BlockedItemRegistry.hpp"

#include <nlohmann/json.hpp>

using namespace kitzi::test;

bool TestBlockAndUnblock() {
    std::cout << "Testing block / unblock bookkeeping..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());

    BlockedItemRegistry registry;
    registry.load();
    ASSERT_EQ(registry.size(), size_t(0), "Starts empty");

    ASSERT_TRUE(registry.block("a"), "Newly blocked");
    ASSERT_FALSE(registry.block("a"), "Already blocked");
    ASSERT_TRUE(registry.isBlocked("a"), "a is blocked");
    ASSERT_FALSE(registry.isBlocked("b"), "b is not");

    ASSERT_TRUE(registry.unblock("a"), "Unblocked");
    ASSERT_FALSE(registry.unblock("a"), "Second unblock is a no-op");
    ASSERT_FALSE(registry.isBlocked("a"), "a is free again");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestPersistedAcrossInstances() {
    std::cout << "Testing the blocked set survives a reload..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());

    {
        BlockedItemRegistry registry;
        registry.load();
        registry.blockAll({"c", "a", "b"});
        registry.unblock("b");
    }

    // Written to disk, not only to the in-memory config
    std::ifstream file(dir.path() / "config.json");
    auto onDisk = nlohmann::json::parse(file);
    ASSERT_EQ(onDisk["downloads"]["blockedItems"].size(), size_t(2), "Two entries on disk");

    auto& config = Config::instance();
    config.setDefaults();
    ASSERT_TRUE(config.load((dir.path() / "config.json").string()), "Reload config");

    BlockedItemRegistry reloaded;
    reloaded.load();
    ASSERT_EQ(reloaded.size(), size_t(2), "Two blocked after reload");
    ASSERT_TRUE(reloaded.isBlocked("a"), "a persisted");
    ASSERT_TRUE(reloaded.isBlocked("c"), "c persisted");
    ASSERT_FALSE(reloaded.isBlocked("b"), "b was unblocked");

    auto items = reloaded.items();
    ASSERT_EQ(items.front(), std::string("a"), "Items are sorted");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestLoadSkipsJunk() {
    std::cout << "Testing load ignores non-string and empty entries..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());

    auto& config = Config::instance();
    config.set("downloads.blockedItems", nlohmann::json::array({"x", 42, "", nullptr, "y"}));

    BlockedItemRegistry registry;
    registry.load();
    ASSERT_EQ(registry.size(), size_t(2), "Only x and y");
    ASSERT_TRUE(registry.isBlocked("x"), "x blocked");
    ASSERT_TRUE(registry.isBlocked("y"), "y blocked");

    std::cout << "  PASS" << std::endl;
    return true;
}

bool TestKeepsChangesFromAnotherWriter() {
    std::cout << "Testing blocks written by another process are kept..." << std::endl;

    TempDir dir;
    resetConfig(dir.path());
    auto configPath = dir.path() / "config.json";

    BlockedItemRegistry registry;
    registry.load();
    registry.block("mine");

    // Another kitzi-dl process rewrites the file with its own change
    {
        std::ifstream in(configPath);
        auto stored = nlohmann::json::parse(in);
        stored["downloads"]["blockedItems"] = nlohmann::json::array({"mine", "theirs"});
        std::ofstream out(configPath, std::ios::trunc);
        out << stored.dump(4);
    }

    registry.block("another");
    ASSERT_TRUE(registry.isBlocked("theirs"), "Other process block adopted");
    ASSERT_EQ(registry.size(), size_t(3), "Three blocked");

    registry.unblock("mine");
    std::ifstream file(configPath);
    auto onDisk = nlohmann::json::parse(file);
    auto stored = onDisk["downloads"]["blockedItems"].get<std::vector<std::string>>();
    ASSERT_EQ(stored.size(), size_t(2), "Two entries on disk");
    ASSERT_EQ(stored[0], std::string("another"), "Own block kept");
    ASSERT_EQ(stored[1], std::string("theirs"), "Other block kept");

    // A whole-config save at shutdown must not bring back a stale list
    {
        std::ifstream in(configPath);
        auto current = nlohmann::json::parse(in);
        current["downloads"]["blockedItems"] = nlohmann::json::array({"another", "theirs", "late"});
        std::ofstream out(configPath, std::ios::trunc);
        out << current.dump(4);
    }
    auto& config = Config::instance();
    ASSERT_TRUE(config.refresh(BlockedItemRegistry::CONFIG_KEY), "File re-read");
    ASSERT_TRUE(config.save(), "Saved");

    config.setDefaults();
    ASSERT_TRUE(config.load(configPath.string()), "Reload config");
    ASSERT_EQ(config.getStringList(BlockedItemRegistry::CONFIG_KEY).size(), size_t(3), "Late block survives save");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    kitzi::core::Logger::instance().initialize(kitzi::core::LogLevel::Warn);

    std::cout << "======================================" << std::endl;
    std::cout << " Blocked Item Registry Tests" << std::endl;
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

    run_test(TestBlockAndUnblock, "Block and unblock");
    run_test(TestPersistedAcrossInstances, "Persisted across instances");
    run_test(TestLoadSkipsJunk, "Load skips junk entries");
    run_test(TestKeepsChangesFromAnotherWriter, "Keeps changes from another writer");

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
