#pragma once

/**
 * DownloadQueue.hpp
 *
 * Ordered queue of books waiting for the single transfer slot.
 * Holds at most one entry per item id.
 */

#include "DownloadTypes.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace kitzi::core::downloads {

class DownloadQueue {
public:
    /**
     * Append an entry
     * @return false if the item is already queued (queue unchanged)
     */
    bool push(QueueEntry entry);

    /**
     * Put an entry at the head, moving it there if already queued
     */
    void pushFront(QueueEntry entry);

    /**
     * Remove and return the head entry
     */
    std::optional<QueueEntry> pop();

    /**
     * @return true if an entry was removed
     */
    bool remove(const std::string& itemId);

    bool contains(const std::string& itemId) const;

    void clear() { m_entries.clear(); }

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    std::vector<QueueEntry> entries() const {
        return {m_entries.begin(), m_entries.end()};
    }

private:
    std::deque<QueueEntry> m_entries;
};

} // namespace kitzi::core::downloads
