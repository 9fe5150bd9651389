#include "TaskMetadata.hpp"
#include "DownloadStorage.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace kitzi::core::downloads {

using json = nlohmann::json;

std::string TaskMetadata::encode(const std::string& itemId) {
    return json{{ITEM_KEY, itemId}}.dump();
}

std::optional<std::string> TaskMetadata::decode(const std::string& metadata) {
    if (metadata.empty()) {
        return std::nullopt;
    }

    json parsed = json::parse(metadata, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }

    auto it = parsed.find(ITEM_KEY);
    if (it == parsed.end() || !it->is_string()) {
        return std::nullopt;
    }

    std::string itemId = it->get<std::string>();
    if (!DownloadStorage::isValidItemId(itemId)) {
        return std::nullopt;
    }
    return itemId;
}

std::string TaskMetadata::groupFor(const std::string& itemId) {
    return GROUP_PREFIX + itemId;
}

std::optional<std::string> TaskMetadata::itemIdFromGroup(const std::string& group) {
    const std::string prefix = GROUP_PREFIX;
    if (group.size() <= prefix.size() || group.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    std::string itemId = group.substr(prefix.size());
    if (!DownloadStorage::isValidItemId(itemId)) {
        return std::nullopt;
    }
    return itemId;
}

std::optional<std::string> TaskMetadata::owningItem(const TransferTask& task) {
    if (auto fromMeta = decode(task.metadata)) {
        return fromMeta;
    }
    return itemIdFromGroup(task.group);
}

std::optional<ItemEvent> TaskMetadata::toItemEvent(const TaskUpdate& update) {
    auto itemId = owningItem(update.task);
    if (!itemId) {
        return std::nullopt;
    }

    if (update.kind == TaskUpdate::Kind::Progress) {
        double fraction = std::clamp(update.progress, 0.0, 1.0);
        return ItemEvent{ProgressEvent{*itemId, update.task.taskId, fraction}};
    }
    return ItemEvent{StatusEvent{*itemId, update.task.taskId, update.status}};
}

} // namespace kitzi::core::downloads
