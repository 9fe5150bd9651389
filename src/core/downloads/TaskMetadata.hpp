#pragma once

/**
 * TaskMetadata.hpp
 *
 * Adapter at the transfer engine boundary: encodes the owning item into
 * task descriptors and turns raw engine updates into typed ItemEvents.
 */

#include "DownloadTypes.hpp"

#include <optional>
#include <string>

namespace kitzi::core::downloads {

class TaskMetadata {
public:
    static constexpr const char* GROUP_PREFIX = "book-";
    static constexpr const char* ITEM_KEY = "libraryItemId";

    /**
     * @return {"libraryItemId": itemId} serialized
     */
    static std::string encode(const std::string& itemId);

    /**
     * Extract the item id from task metadata
     * @return nullopt for empty, malformed or foreign metadata, or an id
     *         that is not a valid directory name
     */
    static std::optional<std::string> decode(const std::string& metadata);

    static std::string groupFor(const std::string& itemId);

    static std::optional<std::string> itemIdFromGroup(const std::string& group);

    /**
     * Owning item of a task: metadata first, group as fallback
     */
    static std::optional<std::string> owningItem(const TransferTask& task);

    /**
     * Translate a raw update. Updates without a resolvable item are dropped.
     */
    static std::optional<ItemEvent> toItemEvent(const TaskUpdate& update);
};

} // namespace kitzi::core::downloads
