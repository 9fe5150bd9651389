#include "DownloadQueue.hpp"

#include <algorithm>

namespace kitzi::core::downloads {

bool DownloadQueue::push(QueueEntry entry) {
    if (contains(entry.itemId)) {
        return false;
    }
    m_entries.push_back(std::move(entry));
    return true;
}

void DownloadQueue::pushFront(QueueEntry entry) {
    remove(entry.itemId);
    m_entries.push_front(std::move(entry));
}

std::optional<QueueEntry> DownloadQueue::pop() {
    if (m_entries.empty()) {
        return std::nullopt;
    }
    QueueEntry head = std::move(m_entries.front());
    m_entries.pop_front();
    return head;
}

bool DownloadQueue::remove(const std::string& itemId) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const QueueEntry& e) { return e.itemId == itemId; });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

bool DownloadQueue::contains(const std::string& itemId) const {
    return std::any_of(m_entries.begin(), m_entries.end(),
                       [&](const QueueEntry& e) { return e.itemId == itemId; });
}

} // namespace kitzi::core::downloads
