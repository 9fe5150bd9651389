#pragma once

/**
 * ProgressAggregator.hpp
 *
 * Merges durable task records, the live event cache, the local file
 * count and registry state into one ItemProgress snapshot.
 */

#include "DownloadTypes.hpp"

#include <string>

namespace kitzi::core::downloads {

/**
 * Everything the aggregator needs, gathered by the coordinator
 */
struct ProgressInputs {
    std::string itemId;

    // Track source (0 if unknown) and local file probe
    int totalTasks{0};
    int completed{0};

    // Live event cache; 0 when absent or stale
    double runningFraction{0.0};
    bool liveActive{false};

    // Durable records of the item's tasks
    bool anyFailedRecord{false};
    bool anyRunningRecord{false};

    // Scheduler state
    bool blocked{false};
    bool failed{false};
    bool justQueued{false};
    bool inQueue{false};
    bool activated{false};
};

class ProgressAggregator {
public:
    // Smallest progress shown for an item that is genuinely running
    static constexpr double MIN_VISIBLE_PROGRESS = 0.01;

    /**
     * Status resolution, first match wins:
     * complete (completed >= totalTasks > 0), none (blocked),
     * failed, running, queued, none.
     */
    static ItemProgress compute(const ProgressInputs& in);
};

} // namespace kitzi::core::downloads
