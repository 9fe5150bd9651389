#pragma once

/**
 * DownloadCoordinator.hpp
 *
 * Serializes multi-track book downloads through a single global
 * transfer slot, chains each finished track to the next missing one,
 * and aggregates per-item progress.
 */

#include "BlockedItemRegistry.hpp"
#include "DownloadQueue.hpp"
#include "DownloadStorage.hpp"
#include "DownloadTypes.hpp"
#include "ItemState.hpp"
#include "LocalFileProbe.hpp"
#include "NotificationSink.hpp"
#include "TrackSource.hpp"
#include "TransferEngine.hpp"
#include "../Dispatcher.hpp"
#include "../EventBus.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace kitzi::core::downloads {

/**
 * Scheduler timings, read from the "downloads.*" config keys
 */
struct SchedulerTimings {
    // Wait after an engine event before re-reading durable records
    Millis debounce{150};
    // Live activity without a new event for this long is ignored
    Millis staleAfter{2000};
    // Minimum gap between scheduling attempts for one item
    Millis rescheduleThrottle{750};
    // Queue stays idle this long after a cancel
    Millis haltWindow{1500};
    // An item reports "running" this long after enqueue
    Millis queuedGrace{3000};
    // Delay before a drain re-reads the engine's records
    Millis settleDelay{100};

    static SchedulerTimings fromConfig();
};

using ProgressCallback = std::function<void(const ItemProgress&)>;

/**
 * DownloadCoordinator - the download scheduler actor
 *
 * Owns the global queue, the blocked item registry and every in-memory
 * cache. Not thread-safe: every method must be called on the dispatcher
 * passed to the constructor, which is also where engine updates and
 * progress callbacks are delivered.
 *
 * At most one transfer task is active across the application. Three
 * guards overlap to keep it that way: a per-item "scheduling" set, a check
 * of the engine's durable records before every submission, and the
 * optimistic in-flight state set at submission time.
 */
class DownloadCoordinator {
public:
    DownloadCoordinator(Dispatcher& dispatcher,
                        TransferEngine& engine,
                        TrackSource& trackSource,
                        NotificationSink& notifications,
                        const DownloadStorage& storage,
                        SchedulerTimings timings = SchedulerTimings::fromConfig());

    ~DownloadCoordinator();

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    /**
     * Load the blocked item registry and install the engine listener.
     * Safe to call more than once.
     */
    void start();

    /**
     * Queue a book (or podcast episode). Unblocks a blocked item and
     * resumes from its first missing track. Idempotent.
     * @param itemId Book id
     * @param episodeId Optional episode id
     * @param title Display title for notifications
     */
    void enqueue(const std::string& itemId,
                 const std::optional<std::string>& episodeId = std::nullopt,
                 const std::string& title = "");

    /**
     * Stop an item: block it, drop its queue entry and caches, cancel its
     * tasks and remove partial files. Progress reads 0 once this returns.
     */
    void cancel(const std::string& itemId);

    /**
     * cancel() plus removal of the item's whole local directory
     */
    void deleteLocal(const std::string& itemId);

    /**
     * Clear the queue, block every tracked item and cancel every task
     */
    void cancelAll();

    /**
     * Adopt active durable records (restart recovery), re-queue failed
     * and waiting items, then drain
     */
    void resumeAll();

    /**
     * Subscribe to an item's progress. The current snapshot is delivered
     * asynchronously right after subscribing.
     */
    SubscriptionPtr watchProgress(const std::string& itemId, ProgressCallback callback);

    void unwatchProgress(const SubscriptionPtr& subscription);

    /**
     * Point-in-time progress of an item
     */
    ItemProgress computeProgress(const std::string& itemId);

    /**
     * Items that are queued, in flight or activated, queue order first
     */
    std::vector<std::string> listTrackedItemIds() const;

    /**
     * Items with at least one file on disk
     */
    std::vector<std::string> listDownloadedItemIds() const;

    QueueStatus queueStatus() const;

    bool isBlocked(const std::string& itemId) const { return m_registry.isBlocked(itemId); }

    const SchedulerTimings& timings() const { return m_timings; }

private:
    enum class ScheduleResult {
        Submitted,
        Adopted,
        Complete,
        Failed,
        Blocked,
        Busy
    };

    struct TrackedItem {
        std::string itemId;
        std::optional<std::string> episodeId;
        std::string title;
        ItemState state{ItemState::None};

        // Every task id seen for this item, live or submitted
        std::set<std::string> knownTaskIds;
        std::string activeTaskId;
        std::optional<Track> activeTrack;

        double runningFraction{0.0};
        bool liveActive{false};
        std::optional<TimePoint> lastEventAt;
        std::optional<TaskStatus> lastTerminalStatus;

        std::optional<TimePoint> lastScheduleAttempt;
        std::optional<TimePoint> queuedAt;

        uint64_t reconcileToken{0};
        bool startNotified{false};
        bool completionNotified{false};
    };

    // Queue
    void drain();
    void drainStep();
    void scheduleDrainAfterHalt();

    // Scheduler
    ScheduleResult scheduleNext(const std::string& itemId,
                                const std::optional<std::string>& episodeId);
    std::string nextTaskId(const std::string& itemId, int trackIndex);

    // Chain listener
    void onItemEvent(const ItemEvent& event);
    void scheduleReconcile(const std::string& itemId, Millis delay);
    void reconcile(const std::string& itemId);

    // Terminal transitions
    void completeItem(const std::string& itemId);
    void failItem(const std::string& itemId, const std::string& reason);

    // Cancellation helpers
    void clearLiveState(TrackedItem& item);
    void cancelEngineTasks(const std::string& itemId, const std::set<std::string>& liveTaskIds,
                           const std::optional<Track>& activeTrack,
                           const std::string& activeTaskId);
    void cancelTaskQuietly(const std::string& taskId);
    void dropFinishedRecords(const std::string& itemId);

    // Engine and track source access
    std::vector<TaskRecord> recordsFor(const std::string& itemId) const;
    std::vector<TaskRecord> allRecordsQuietly() const;
    bool engineHasActiveWork() const;
    bool anyInFlight() const;
    std::vector<Track> fetchTracks(const std::string& itemId,
                                   const std::optional<std::string>& episodeId);
    int knownTrackCount(const std::string& itemId);

    // State helpers
    TrackedItem& itemFor(const std::string& itemId);
    TrackedItem* findItem(const std::string& itemId);
    const TrackedItem* findItem(const std::string& itemId) const;
    bool applyTrigger(TrackedItem& item, ItemTrigger trigger);
    QueueEntry entryFor(const TrackedItem& item) const;

    void publish(const std::string& itemId);

    /**
     * Post to the dispatcher; the task is skipped once this coordinator
     * is destroyed and exceptions are logged
     */
    void postGuarded(Millis delay, std::function<void()> task);

private:
    Dispatcher& m_dispatcher;
    TransferEngine& m_engine;
    TrackSource& m_trackSource;
    NotificationSink& m_notifications;
    const DownloadStorage& m_storage;
    LocalFileProbe m_probe;
    SchedulerTimings m_timings;

    DownloadQueue m_queue;
    BlockedItemRegistry m_registry;
    std::unordered_map<std::string, TrackedItem> m_items;
    std::unordered_map<std::string, std::vector<Track>> m_trackCache;
    std::set<std::string> m_scheduling;

    HaltWindow m_halt;
    bool m_draining{false};
    bool m_drainAfterHaltPending{false};

    EventBus<ItemProgress> m_progressBus;
    SubscriptionPtr m_engineSubscription;

    uint64_t m_taskSequence{0};
    std::shared_ptr<int> m_alive;
};

} // namespace kitzi::core::downloads
