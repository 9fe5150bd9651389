#include "BlockedItemRegistry.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

namespace kitzi::core::downloads {

void BlockedItemRegistry::load() {
    auto ids = Config::instance().getStringList(CONFIG_KEY);
    m_blocked.clear();
    for (auto& id : ids) {
        if (!id.empty()) {
            m_blocked.insert(std::move(id));
        }
    }
    LOG_DEBUG("Loaded {} blocked item(s)", m_blocked.size());
}

bool BlockedItemRegistry::block(const std::string& itemId) {
    bool inserted = m_blocked.insert(itemId).second;
    if (inserted) {
        persist({itemId}, {});
    }
    return inserted;
}

void BlockedItemRegistry::blockAll(const std::vector<std::string>& itemIds) {
    std::vector<std::string> added;
    for (const auto& id : itemIds) {
        if (m_blocked.insert(id).second) {
            added.push_back(id);
        }
    }
    if (!added.empty()) {
        persist(added, {});
    }
}

bool BlockedItemRegistry::unblock(const std::string& itemId) {
    bool erased = m_blocked.erase(itemId) > 0;
    if (erased) {
        persist({}, {itemId});
    }
    return erased;
}

void BlockedItemRegistry::persist(const std::vector<std::string>& added,
                                  const std::vector<std::string>& removed) {
    auto& config = Config::instance();
    config.refresh(CONFIG_KEY);

    std::set<std::string> merged;
    for (auto& id : config.getStringList(CONFIG_KEY)) {
        if (!id.empty()) {
            merged.insert(std::move(id));
        }
    }
    merged.insert(added.begin(), added.end());
    for (const auto& id : removed) {
        merged.erase(id);
    }
    m_blocked = std::move(merged);

    config.set(CONFIG_KEY, items());
    // The in-memory set stays authoritative for this process either way
    if (!config.save()) {
        LOG_WARN("Could not persist blocked items ({} entries)", m_blocked.size());
    }
}

} // namespace kitzi::core::downloads
