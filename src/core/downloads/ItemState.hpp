#pragma once

/**
 * ItemState.hpp
 *
 * Explicit per-item lifecycle of the download scheduler and the timing
 * guards that gate its transitions.
 *
 *   None --Enqueue--> Queued --Submit--> Running --TrackFinished--> Queued
 *   Queued|Running --AllTracksPresent--> Complete
 *   Queued|Running --TransferFailed--> Failed
 *   any --Cancel--> Blocked --Enqueue--> Queued
 *   Complete|Failed --Forget--> None
 */

#include "../Dispatcher.hpp"

#include <optional>

namespace kitzi::core::downloads {

enum class ItemState {
    None,
    Queued,
    Running,
    Complete,
    Failed,
    Blocked
};

enum class ItemTrigger {
    Enqueue,
    Submit,
    TrackFinished,
    AllTracksPresent,
    TransferFailed,
    Cancel,
    Forget
};

const char* toString(ItemState state);
const char* toString(ItemTrigger trigger);

/**
 * Next state for a trigger
 * @return nullopt if the trigger is not valid in this state
 */
std::optional<ItemState> transition(ItemState state, ItemTrigger trigger);

/**
 * A state with a submitted, not yet terminal task
 */
inline bool isInFlight(ItemState state) {
    return state == ItemState::Running;
}

/**
 * The user opted in and the item has not reached a resting state
 */
inline bool isActivated(ItemState state) {
    return state == ItemState::Queued || state == ItemState::Running;
}

/**
 * Live event data older than the window no longer counts as activity
 */
inline bool isStale(TimePoint lastEventAt, TimePoint now, Millis window) {
    return now - lastEventAt > window;
}

/**
 * Global pause after a cancellation during which the queue is not drained
 */
class HaltWindow {
public:
    void start(TimePoint now, Millis length) {
        TimePoint until = now + length;
        if (!m_until || until > *m_until) {
            m_until = until;
        }
    }

    void clear() { m_until.reset(); }

    bool active(TimePoint now) const {
        return m_until && now < *m_until;
    }

    Millis remaining(TimePoint now) const {
        if (!active(now)) return Millis(0);
        return std::chrono::ceil<Millis>(*m_until - now);
    }

private:
    std::optional<TimePoint> m_until;
};

/**
 * Time left before another scheduling attempt is allowed
 */
inline Millis throttleRemaining(std::optional<TimePoint> lastAttempt, TimePoint now, Millis minGap) {
    if (!lastAttempt) return Millis(0);
    auto elapsed = now - *lastAttempt;
    if (elapsed >= minGap) return Millis(0);
    return std::chrono::ceil<Millis>(minGap - elapsed);
}

} // namespace kitzi::core::downloads
