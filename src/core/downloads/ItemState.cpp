#include "ItemState.hpp"

namespace kitzi::core::downloads {

const char* toString(ItemState state) {
    switch (state) {
        case ItemState::None:     return "none";
        case ItemState::Queued:   return "queued";
        case ItemState::Running:  return "running";
        case ItemState::Complete: return "complete";
        case ItemState::Failed:   return "failed";
        case ItemState::Blocked:  return "blocked";
    }
    return "unknown";
}

const char* toString(ItemTrigger trigger) {
    switch (trigger) {
        case ItemTrigger::Enqueue:          return "enqueue";
        case ItemTrigger::Submit:           return "submit";
        case ItemTrigger::TrackFinished:    return "track-finished";
        case ItemTrigger::AllTracksPresent: return "all-tracks-present";
        case ItemTrigger::TransferFailed:   return "transfer-failed";
        case ItemTrigger::Cancel:           return "cancel";
        case ItemTrigger::Forget:           return "forget";
    }
    return "unknown";
}

std::optional<ItemState> transition(ItemState state, ItemTrigger trigger) {
    switch (trigger) {
        case ItemTrigger::Enqueue:
            // Already running items keep their slot
            if (state == ItemState::Running) return std::nullopt;
            return ItemState::Queued;

        case ItemTrigger::Submit:
            if (state == ItemState::Queued) return ItemState::Running;
            return std::nullopt;

        case ItemTrigger::TrackFinished:
            if (state == ItemState::Running) return ItemState::Queued;
            return std::nullopt;

        case ItemTrigger::AllTracksPresent:
            if (state == ItemState::Queued || state == ItemState::Running) return ItemState::Complete;
            return std::nullopt;

        case ItemTrigger::TransferFailed:
            if (state == ItemState::Queued || state == ItemState::Running) return ItemState::Failed;
            return std::nullopt;

        case ItemTrigger::Cancel:
            return ItemState::Blocked;

        case ItemTrigger::Forget:
            if (state == ItemState::Complete || state == ItemState::Failed) return ItemState::None;
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace kitzi::core::downloads
