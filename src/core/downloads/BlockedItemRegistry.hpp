#pragma once

/**
 * BlockedItemRegistry.hpp
 *
 * Persisted set of item ids excluded from automatic scheduling.
 * Stored as the "downloads.blockedItems" string list in Config.
 *
 * Every change is applied to the list currently on disk, so blocks and
 * unblocks written by another process in the meantime are kept.
 */

#include <set>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

class BlockedItemRegistry {
public:
    static constexpr const char* CONFIG_KEY = "downloads.blockedItems";

    /**
     * Replace the in-memory set with the persisted list
     */
    void load();

    /**
     * Block an item and persist immediately
     * @return true if the item was not blocked before
     */
    bool block(const std::string& itemId);

    /**
     * Block several items with a single write
     */
    void blockAll(const std::vector<std::string>& itemIds);

    /**
     * Unblock an item and persist immediately
     * @return true if the item was blocked
     */
    bool unblock(const std::string& itemId);

    bool isBlocked(const std::string& itemId) const {
        return m_blocked.count(itemId) > 0;
    }

    std::vector<std::string> items() const {
        return {m_blocked.begin(), m_blocked.end()};
    }

    size_t size() const { return m_blocked.size(); }

private:
    /**
     * Merge this change into the stored list, adopt the result and save it
     */
    void persist(const std::vector<std::string>& added, const std::vector<std::string>& removed);

    std::set<std::string> m_blocked;
};

} // namespace kitzi::core::downloads
