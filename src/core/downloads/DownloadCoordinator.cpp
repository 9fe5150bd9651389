#include "DownloadCoordinator.hpp"
#include "ProgressAggregator.hpp"
#include "TaskMetadata.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace kitzi::core::downloads {

namespace {

Millis configMillis(const char* key, Millis fallback) {
    long long value = Config::instance().get<long long>(key, fallback.count());
    if (value < 0) {
        LOG_WARN("Ignoring negative {} = {}", key, value);
        return fallback;
    }
    return Millis(value);
}

/**
 * Marks an item as "being scheduled" for the lifetime of the guard
 */
class SchedulingGuard {
public:
    SchedulingGuard(std::set<std::string>& set, const std::string& itemId)
        : m_set(set), m_itemId(itemId) {
        m_set.insert(m_itemId);
    }

    ~SchedulingGuard() { m_set.erase(m_itemId); }

    SchedulingGuard(const SchedulingGuard&) = delete;
    SchedulingGuard& operator=(const SchedulingGuard&) = delete;

private:
    std::set<std::string>& m_set;
    std::string m_itemId;
};

} // anonymous namespace

SchedulerTimings SchedulerTimings::fromConfig() {
    SchedulerTimings defaults;
    SchedulerTimings timings;
    timings.debounce = configMillis("downloads.debounceMs", defaults.debounce);
    timings.staleAfter = configMillis("downloads.staleAfterMs", defaults.staleAfter);
    timings.rescheduleThrottle = configMillis("downloads.rescheduleThrottleMs", defaults.rescheduleThrottle);
    timings.haltWindow = configMillis("downloads.haltWindowMs", defaults.haltWindow);
    timings.queuedGrace = configMillis("downloads.queuedGraceMs", defaults.queuedGrace);
    timings.settleDelay = configMillis("downloads.settleDelayMs", defaults.settleDelay);
    return timings;
}

DownloadCoordinator::DownloadCoordinator(Dispatcher& dispatcher,
                                         TransferEngine& engine,
                                         TrackSource& trackSource,
                                         NotificationSink& notifications,
                                         const DownloadStorage& storage,
                                         SchedulerTimings timings)
    : m_dispatcher(dispatcher)
    , m_engine(engine)
    , m_trackSource(trackSource)
    , m_notifications(notifications)
    , m_storage(storage)
    , m_probe(storage)
    , m_timings(timings)
    , m_alive(std::make_shared<int>(0)) {
}

DownloadCoordinator::~DownloadCoordinator() {
    if (m_engineSubscription) {
        m_engine.unsubscribe(m_engineSubscription);
        m_engineSubscription.reset();
    }
    m_progressBus.clear();
    m_alive.reset();
}

void DownloadCoordinator::start() {
    if (m_engineSubscription) {
        return;
    }

    m_registry.load();

    std::weak_ptr<int> alive = m_alive;
    Dispatcher* dispatcher = &m_dispatcher;

    // Updates may arrive on any engine thread; hop onto the dispatcher
    m_engineSubscription = m_engine.subscribe([this, alive, dispatcher](const TaskUpdate& update) {
        auto event = TaskMetadata::toItemEvent(update);
        if (!event) {
            LOG_TRACE("Dropping update for task {} without owning item", update.task.taskId);
            return;
        }

        dispatcher->post([this, alive, event = *event]() {
            if (alive.expired()) return;
            try {
                onItemEvent(event);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to handle update for {}: {}", itemIdOf(event), e.what());
            }
        });
    });

    LOG_INFO("Download coordinator started ({} blocked items)", m_registry.size());
}

// ============================================================================
// Public operations
// ============================================================================

void DownloadCoordinator::enqueue(const std::string& itemId,
                                  const std::optional<std::string>& episodeId,
                                  const std::string& title) {
    if (!DownloadStorage::isValidItemId(itemId)) {
        LOG_WARN("Ignoring enqueue of invalid item id '{}'", itemId);
        return;
    }

    if (m_registry.unblock(itemId)) {
        LOG_INFO("Unblocked {}", itemId);
    }

    TrackedItem& item = itemFor(itemId);
    if (episodeId) {
        item.episodeId = episodeId;
    }
    if (!title.empty()) {
        item.title = title;
    }

    if (isInFlight(item.state)) {
        LOG_DEBUG("{} is already downloading", itemId);
        publish(itemId);
        return;
    }

    if (!isActivated(item.state)) {
        clearLiveState(item);
        item.completionNotified = false;
    }

    dropFinishedRecords(itemId);

    applyTrigger(item, ItemTrigger::Enqueue);
    item.queuedAt = m_dispatcher.now();

    if (m_queue.push(entryFor(item))) {
        LOG_INFO("Queued {} ({} in queue)", itemId, m_queue.size());
    } else {
        LOG_DEBUG("{} is already queued", itemId);
    }

    publish(itemId);
    drain();
}

void DownloadCoordinator::cancel(const std::string& itemId) {
    if (!DownloadStorage::isValidItemId(itemId)) {
        LOG_WARN("Ignoring cancel of invalid item id '{}'", itemId);
        return;
    }

    LOG_INFO("Canceling {}", itemId);

    m_registry.block(itemId);

    TrackedItem& item = itemFor(itemId);
    std::set<std::string> liveTaskIds = item.knownTaskIds;
    if (!item.activeTaskId.empty()) {
        liveTaskIds.insert(item.activeTaskId);
    }
    std::optional<Track> activeTrack = item.activeTrack;
    std::string activeTaskId = item.activeTaskId;

    applyTrigger(item, ItemTrigger::Cancel);
    clearLiveState(item);
    item.completionNotified = false;

    m_halt.start(m_dispatcher.now(), m_timings.haltWindow);
    m_queue.remove(itemId);

    cancelEngineTasks(itemId, liveTaskIds, activeTrack, activeTaskId);

    size_t removed = m_storage.removeTempFiles(itemId);
    if (removed > 0) {
        LOG_DEBUG("Removed {} partial files of {}", removed, itemId);
    }

    m_notifications.onDownloadCanceled();
    publish(itemId);

    // Let the rest of the queue continue once the halt window ends
    scheduleDrainAfterHalt();
}

void DownloadCoordinator::deleteLocal(const std::string& itemId) {
    if (!DownloadStorage::isValidItemId(itemId)) {
        LOG_WARN("Ignoring delete of invalid item id '{}'", itemId);
        return;
    }

    cancel(itemId);

    if (m_storage.removeItemDirectory(itemId)) {
        LOG_INFO("Deleted local files of {}", itemId);
    }

    for (const auto& record : recordsFor(itemId)) {
        cancelTaskQuietly(record.taskId());
    }

    m_trackCache.erase(itemId);
    publish(itemId);
}

void DownloadCoordinator::cancelAll() {
    LOG_INFO("Canceling all downloads");

    std::set<std::string> itemIds;
    for (const auto& entry : m_queue.entries()) {
        itemIds.insert(entry.itemId);
    }
    for (const auto& [itemId, item] : m_items) {
        if (isActivated(item.state)) {
            itemIds.insert(itemId);
        }
    }

    auto records = allRecordsQuietly();
    for (const auto& record : records) {
        if (auto owner = TaskMetadata::owningItem(record.task)) {
            if (isActive(record.status)) {
                itemIds.insert(*owner);
            }
        }
    }

    m_queue.clear();
    m_registry.blockAll({itemIds.begin(), itemIds.end()});

    for (auto& [itemId, item] : m_items) {
        if (itemIds.count(itemId) > 0) {
            applyTrigger(item, ItemTrigger::Cancel);
            clearLiveState(item);
        }
    }

    m_halt.start(m_dispatcher.now(), m_timings.haltWindow);

    std::vector<std::string> taskIds;
    taskIds.reserve(records.size());
    for (const auto& record : records) {
        taskIds.push_back(record.taskId());
    }

    if (!taskIds.empty()) {
        try {
            m_engine.cancelByIds(taskIds);
        } catch (const std::exception& e) {
            LOG_WARN("Cancel request failed: {}", e.what());
        }
        for (const auto& taskId : taskIds) {
            try {
                m_engine.deleteRecord(taskId);
            } catch (const std::exception& e) {
                LOG_WARN("Failed to delete record {}: {}", taskId, e.what());
            }
        }
    }

    for (const auto& itemId : itemIds) {
        m_storage.removeTempFiles(itemId);
    }

    m_notifications.onDownloadCanceled();

    for (const auto& itemId : itemIds) {
        publish(itemId);
    }

    LOG_INFO("Canceled {} items and {} tasks", itemIds.size(), taskIds.size());
}

void DownloadCoordinator::resumeAll() {
    LOG_INFO("Resuming downloads");

    m_halt.clear();
    TimePoint now = m_dispatcher.now();

    // Restart recovery: adopt tasks the engine is still working on
    for (const auto& record : allRecordsQuietly()) {
        if (!isActive(record.status)) continue;

        auto owner = TaskMetadata::owningItem(record.task);
        if (!owner || m_registry.isBlocked(*owner)) continue;

        TrackedItem& item = itemFor(*owner);
        if (!isInFlight(item.state)) {
            applyTrigger(item, ItemTrigger::Enqueue);
            applyTrigger(item, ItemTrigger::Submit);
            if (item.title.empty()) {
                item.title = record.task.displayName;
            }
        }
        item.startNotified = true;
        item.activeTaskId = record.taskId();
        item.knownTaskIds.insert(record.taskId());
        item.lastScheduleAttempt = now;
        m_queue.remove(*owner);

        LOG_INFO("Adopted task {} of {}", record.taskId(), *owner);
        scheduleReconcile(*owner, m_timings.debounce);
    }

    for (auto& [itemId, item] : m_items) {
        if (m_registry.isBlocked(itemId)) continue;
        if (item.state != ItemState::Failed && item.state != ItemState::Queued) continue;

        if (item.state == ItemState::Failed) {
            clearLiveState(item);
            dropFinishedRecords(itemId);
        }
        applyTrigger(item, ItemTrigger::Enqueue);
        item.queuedAt = now;
        m_queue.push(entryFor(item));
    }

    for (const auto& entry : m_queue.entries()) {
        publish(entry.itemId);
    }

    drain();
}

SubscriptionPtr DownloadCoordinator::watchProgress(const std::string& itemId, ProgressCallback callback) {
    auto subscription = m_progressBus.subscribe(itemId, callback);

    postGuarded(Millis(0), [this, itemId, subscription, callback]() {
        if (!subscription->isActive()) return;
        callback(computeProgress(itemId));
    });

    return subscription;
}

void DownloadCoordinator::unwatchProgress(const SubscriptionPtr& subscription) {
    m_progressBus.unsubscribe(subscription);
}

ItemProgress DownloadCoordinator::computeProgress(const std::string& itemId) {
    ProgressInputs in;
    in.itemId = itemId;
    in.totalTasks = knownTrackCount(itemId);

    // Only the remote tracks' exact file names count; stray indices or
    // containers in the directory do not
    auto cached = m_trackCache.find(itemId);
    if (cached != m_trackCache.end()) {
        in.completed = static_cast<int>(std::count_if(
            cached->second.begin(), cached->second.end(),
            [&](const Track& track) { return m_probe.hasTrack(itemId, track); }));
    } else {
        in.completed = m_probe.countLocalTracks(itemId);
    }
    in.blocked = m_registry.isBlocked(itemId);
    in.inQueue = m_queue.contains(itemId);

    for (const auto& record : recordsFor(itemId)) {
        if (record.status == TaskStatus::Failed) in.anyFailedRecord = true;
        if (record.status == TaskStatus::Running) in.anyRunningRecord = true;
    }

    if (const TrackedItem* item = findItem(itemId)) {
        TimePoint now = m_dispatcher.now();
        bool fresh = item->lastEventAt && !isStale(*item->lastEventAt, now, m_timings.staleAfter);

        if (item->liveActive || fresh) {
            in.runningFraction = item->runningFraction;
        }
        in.liveActive = item->liveActive && fresh;
        in.failed = item->state == ItemState::Failed;
        in.activated = isActivated(item->state);
        in.justQueued = in.activated && item->queuedAt &&
                        now - *item->queuedAt < m_timings.queuedGrace;
    }

    return ProgressAggregator::compute(in);
}

std::vector<std::string> DownloadCoordinator::listTrackedItemIds() const {
    std::vector<std::string> result;
    for (const auto& entry : m_queue.entries()) {
        result.push_back(entry.itemId);
    }

    std::vector<std::string> others;
    for (const auto& [itemId, item] : m_items) {
        if (isActivated(item.state) && !m_queue.contains(itemId)) {
            others.push_back(itemId);
        }
    }
    std::sort(others.begin(), others.end());

    result.insert(result.end(), others.begin(), others.end());
    return result;
}

std::vector<std::string> DownloadCoordinator::listDownloadedItemIds() const {
    return m_storage.listItemIdsWithLocalDownloads();
}

QueueStatus DownloadCoordinator::queueStatus() const {
    QueueStatus status;
    status.length = m_queue.size();
    status.items = m_queue.entries();
    status.isProcessing = m_draining || anyInFlight();
    status.blocked = m_registry.items();
    return status;
}

// ============================================================================
// Queue
// ============================================================================

void DownloadCoordinator::drain() {
    if (m_halt.active(m_dispatcher.now())) {
        scheduleDrainAfterHalt();
        return;
    }
    if (m_draining || m_queue.empty()) {
        return;
    }
    if (anyInFlight() || engineHasActiveWork()) {
        LOG_TRACE("Transfer slot busy, {} waiting", m_queue.size());
        return;
    }

    m_draining = true;
    postGuarded(m_timings.settleDelay, [this]() { drainStep(); });
}

void DownloadCoordinator::drainStep() {
    m_draining = false;

    if (m_halt.active(m_dispatcher.now())) {
        scheduleDrainAfterHalt();
        return;
    }
    if (anyInFlight() || engineHasActiveWork()) {
        return;
    }

    auto entry = m_queue.pop();
    if (!entry) {
        return;
    }

    switch (scheduleNext(entry->itemId, entry->episodeId)) {
        case ScheduleResult::Submitted:
        case ScheduleResult::Adopted:
            publish(entry->itemId);
            break;

        case ScheduleResult::Complete:
            completeItem(entry->itemId);
            drain();
            break;

        case ScheduleResult::Failed:
            failItem(entry->itemId, "could not start transfer");
            drain();
            break;

        case ScheduleResult::Blocked:
            drain();
            break;

        case ScheduleResult::Busy:
            m_queue.pushFront(*entry);
            break;
    }
}

void DownloadCoordinator::scheduleDrainAfterHalt() {
    if (m_drainAfterHaltPending) {
        return;
    }
    m_drainAfterHaltPending = true;

    Millis wait = m_halt.remaining(m_dispatcher.now());
    postGuarded(wait, [this]() {
        m_drainAfterHaltPending = false;
        drain();
    });
}

// ============================================================================
// Scheduler
// ============================================================================

DownloadCoordinator::ScheduleResult DownloadCoordinator::scheduleNext(
    const std::string& itemId, const std::optional<std::string>& episodeId) {

    if (m_registry.isBlocked(itemId)) {
        LOG_DEBUG("Not scheduling blocked item {}", itemId);
        return ScheduleResult::Blocked;
    }
    if (m_scheduling.count(itemId) > 0) {
        LOG_DEBUG("Scheduling of {} already in progress", itemId);
        return ScheduleResult::Busy;
    }
    if (anyInFlight()) {
        return ScheduleResult::Busy;
    }

    TrackedItem& item = itemFor(itemId);
    if (episodeId) {
        item.episodeId = episodeId;
    }

    for (const auto& record : allRecordsQuietly()) {
        if (!isActive(record.status)) continue;

        auto owner = TaskMetadata::owningItem(record.task);
        if (owner && *owner == itemId) {
            if (item.state != ItemState::Queued) {
                applyTrigger(item, ItemTrigger::Enqueue);
            }
            applyTrigger(item, ItemTrigger::Submit);
            item.activeTaskId = record.taskId();
            item.knownTaskIds.insert(record.taskId());
            item.lastScheduleAttempt = m_dispatcher.now();
            m_queue.remove(itemId);
            LOG_DEBUG("{} already has active task {}", itemId, record.taskId());
            return ScheduleResult::Adopted;
        }

        LOG_DEBUG("Task {} of {} holds the transfer slot", record.taskId(),
                  owner ? *owner : std::string("<unknown>"));
        return ScheduleResult::Busy;
    }

    SchedulingGuard guard(m_scheduling, itemId);

    std::vector<Track> tracks;
    try {
        tracks = fetchTracks(itemId, item.episodeId);
    } catch (const TrackSourceError& e) {
        LOG_ERROR("Cannot list tracks of {}: {}", itemId, e.what());
        return ScheduleResult::Failed;
    }

    if (tracks.empty()) {
        LOG_WARN("{} has no remote tracks", itemId);
        return ScheduleResult::Failed;
    }

    auto missing = m_probe.firstMissingTrack(itemId, tracks);
    if (!missing) {
        m_queue.remove(itemId);
        return ScheduleResult::Complete;
    }

    TransferTask task;
    task.taskId = nextTaskId(itemId, missing->index);
    task.url = missing->url;
    task.filename = DownloadStorage::trackFileName(missing->index, missing->mimeType);
    task.directory = m_storage.taskDirectory(itemId);
    task.requiresWiFi = Config::instance().get<bool>("downloads.wifiOnly", true);
    task.metadata = TaskMetadata::encode(itemId);
    task.group = TaskMetadata::groupFor(itemId);
    task.displayName = item.title.empty() ? itemId : item.title;

    try {
        m_engine.enqueue(task);
    } catch (const std::exception& e) {
        LOG_ERROR("Engine rejected track {} of {}: {}", missing->index, itemId, e.what());
        return ScheduleResult::Failed;
    }

    if (item.state != ItemState::Queued) {
        applyTrigger(item, ItemTrigger::Enqueue);
    }
    applyTrigger(item, ItemTrigger::Submit);

    item.activeTaskId = task.taskId;
    item.activeTrack = *missing;
    item.knownTaskIds.insert(task.taskId);
    item.runningFraction = 0.0;
    item.liveActive = false;
    item.lastTerminalStatus.reset();
    item.lastScheduleAttempt = m_dispatcher.now();
    m_queue.remove(itemId);

    LOG_INFO("Submitted track {}/{} of {} as {}", missing->index + 1, tracks.size(), itemId, task.taskId);

    if (!item.startNotified) {
        item.startNotified = true;
        m_notifications.onDownloadStarted(task.displayName);
    }

    // Watchdog for tasks that never report back
    scheduleReconcile(itemId, m_timings.staleAfter);
    return ScheduleResult::Submitted;
}

std::string DownloadCoordinator::nextTaskId(const std::string& itemId, int trackIndex) {
    auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream id;
    id << itemId << "-t" << std::setw(3) << std::setfill('0') << trackIndex
       << "-" << epochMs << "-" << ++m_taskSequence;
    return id.str();
}

// ============================================================================
// Chain listener
// ============================================================================

void DownloadCoordinator::onItemEvent(const ItemEvent& event) {
    const std::string& itemId = itemIdOf(event);
    const std::string& taskId = taskIdOf(event);

    if (m_registry.isBlocked(itemId)) {
        LOG_DEBUG("Late update for blocked item {}, canceling {}", itemId, taskId);
        cancelTaskQuietly(taskId);
        publish(itemId);
        return;
    }

    TrackedItem* item = findItem(itemId);
    if (!item || !isActivated(item->state)) {
        // A foreign task freeing the slot may unblock the queue
        if (auto status = std::get_if<StatusEvent>(&event)) {
            if (isTerminal(status->status)) {
                drain();
            }
        }
        return;
    }

    if (item->activeTaskId.empty()) {
        item->activeTaskId = taskId;
    }
    item->knownTaskIds.insert(taskId);

    // Stragglers of an earlier track only refresh the record view
    bool isActiveTask = taskId == item->activeTaskId;

    if (auto progress = std::get_if<ProgressEvent>(&event)) {
        if (isActiveTask) {
            item->runningFraction = progress->fraction;
            item->liveActive = true;
            item->lastEventAt = m_dispatcher.now();
        }
    } else if (auto status = std::get_if<StatusEvent>(&event)) {
        if (isActiveTask) {
            item->lastEventAt = m_dispatcher.now();
            if (isActive(status->status)) {
                item->liveActive = true;
            } else {
                item->liveActive = false;
                item->runningFraction = 0.0;
                item->lastTerminalStatus = status->status;
            }
        }
        LOG_DEBUG("Task {} of {} is {}", taskId, itemId, toString(status->status));
    }

    publish(itemId);
    scheduleReconcile(itemId, m_timings.debounce);
}

void DownloadCoordinator::scheduleReconcile(const std::string& itemId, Millis delay) {
    TrackedItem* item = findItem(itemId);
    if (!item) return;

    uint64_t token = ++item->reconcileToken;
    postGuarded(delay, [this, itemId, token]() {
        TrackedItem* current = findItem(itemId);
        if (!current || current->reconcileToken != token) {
            return;
        }
        reconcile(itemId);
    });
}

void DownloadCoordinator::reconcile(const std::string& itemId) {
    TrackedItem* item = findItem(itemId);
    if (!item || m_registry.isBlocked(itemId) || !isActivated(item->state)) {
        return;
    }

    TimePoint now = m_dispatcher.now();

    bool durableActive = false;
    bool durableFailed = false;
    for (const auto& record : recordsFor(itemId)) {
        if (isActive(record.status)) {
            durableActive = true;
        }
        if (record.taskId() == item->activeTaskId &&
            (record.status == TaskStatus::Failed || record.status == TaskStatus::Canceled)) {
            durableFailed = true;
        }
    }

    if (item->liveActive && !durableActive &&
        (!item->lastEventAt || isStale(*item->lastEventAt, now, m_timings.staleAfter))) {
        LOG_DEBUG("Live state of {} went stale", itemId);
        item->liveActive = false;
        item->runningFraction = 0.0;
    }

    if (durableActive || item->liveActive) {
        scheduleReconcile(itemId, m_timings.staleAfter);
        return;
    }

    bool failed = durableFailed ||
                  item->lastTerminalStatus == TaskStatus::Failed ||
                  item->lastTerminalStatus == TaskStatus::Canceled;
    if (failed) {
        failItem(itemId, "transfer failed");
        drain();
        return;
    }

    if (isInFlight(item->state)) {
        applyTrigger(*item, ItemTrigger::TrackFinished);
    }
    item->activeTaskId.clear();
    item->activeTrack.reset();
    item->runningFraction = 0.0;
    item->lastTerminalStatus.reset();

    std::vector<Track> tracks;
    try {
        tracks = fetchTracks(itemId, item->episodeId);
    } catch (const TrackSourceError& e) {
        LOG_ERROR("Cannot list tracks of {}: {}", itemId, e.what());
        failItem(itemId, "track list unavailable");
        drain();
        return;
    }

    if (!m_probe.firstMissingTrack(itemId, tracks)) {
        completeItem(itemId);
        drain();
        return;
    }

    if (m_halt.active(now)) {
        scheduleReconcile(itemId, m_halt.remaining(now));
        publish(itemId);
        return;
    }

    if (anyInFlight()) {
        LOG_DEBUG("{} waits for the transfer slot", itemId);
        m_queue.pushFront(entryFor(*item));
        publish(itemId);
        return;
    }

    Millis wait = throttleRemaining(item->lastScheduleAttempt, now, m_timings.rescheduleThrottle);
    if (wait.count() > 0) {
        scheduleReconcile(itemId, wait);
        return;
    }

    switch (scheduleNext(itemId, item->episodeId)) {
        case ScheduleResult::Submitted:
        case ScheduleResult::Adopted:
            publish(itemId);
            break;

        case ScheduleResult::Complete:
            completeItem(itemId);
            drain();
            break;

        case ScheduleResult::Failed:
            failItem(itemId, "could not start next track");
            drain();
            break;

        case ScheduleResult::Blocked:
            break;

        case ScheduleResult::Busy:
            m_queue.pushFront(entryFor(itemFor(itemId)));
            publish(itemId);
            break;
    }
}

// ============================================================================
// Terminal transitions
// ============================================================================

void DownloadCoordinator::completeItem(const std::string& itemId) {
    TrackedItem* item = findItem(itemId);
    m_queue.remove(itemId);
    if (!item) {
        publish(itemId);
        return;
    }

    if (!transition(item->state, ItemTrigger::AllTracksPresent)) {
        // Reached from a resting state, e.g. files finished while idle
        applyTrigger(*item, ItemTrigger::Enqueue);
    }
    applyTrigger(*item, ItemTrigger::AllTracksPresent);

    std::string title = item->title.empty() ? itemId : item->title;
    // Only activations that transferred something announce completion
    bool notify = item->startNotified && !item->completionNotified;
    item->completionNotified = true;

    LOG_INFO("Download of {} complete", itemId);
    if (notify) {
        m_notifications.onDownloadComplete(title);
    }

    publish(itemId);

    applyTrigger(*item, ItemTrigger::Forget);
    m_items.erase(itemId);
}

void DownloadCoordinator::failItem(const std::string& itemId, const std::string& reason) {
    m_queue.remove(itemId);

    TrackedItem& item = itemFor(itemId);
    if (!applyTrigger(item, ItemTrigger::TransferFailed)) {
        item.state = ItemState::Failed;
    }
    item.liveActive = false;
    item.runningFraction = 0.0;
    item.activeTaskId.clear();
    item.activeTrack.reset();
    item.queuedAt.reset();
    item.startNotified = false;

    LOG_WARN("Download of {} failed: {}", itemId, reason);
    publish(itemId);
}

// ============================================================================
// Cancellation helpers
// ============================================================================

void DownloadCoordinator::clearLiveState(TrackedItem& item) {
    item.knownTaskIds.clear();
    item.activeTaskId.clear();
    item.activeTrack.reset();
    item.runningFraction = 0.0;
    item.liveActive = false;
    item.lastEventAt.reset();
    item.lastTerminalStatus.reset();
    item.lastScheduleAttempt.reset();
    item.queuedAt.reset();
    item.startNotified = false;
    // Invalidates any pending reconcile
    ++item.reconcileToken;
}

void DownloadCoordinator::cancelEngineTasks(const std::string& itemId,
                                            const std::set<std::string>& liveTaskIds,
                                            const std::optional<Track>& activeTrack,
                                            const std::string& activeTaskId) {
    std::set<std::string> taskIds = liveTaskIds;
    bool activeTrackFinished = false;

    std::string group = TaskMetadata::groupFor(itemId);
    for (const auto& record : allRecordsQuietly()) {
        bool owned = liveTaskIds.count(record.taskId()) > 0 ||
                     record.task.group == group ||
                     TaskMetadata::decode(record.task.metadata) == itemId;
        if (!owned) continue;

        taskIds.insert(record.taskId());
        if (record.taskId() == activeTaskId && record.status == TaskStatus::Complete) {
            activeTrackFinished = true;
        }
    }

    if (!taskIds.empty()) {
        try {
            m_engine.cancelByIds({taskIds.begin(), taskIds.end()});
        } catch (const std::exception& e) {
            LOG_WARN("Cancel request for {} failed: {}", itemId, e.what());
        }
        for (const auto& taskId : taskIds) {
            try {
                m_engine.deleteRecord(taskId);
            } catch (const std::exception& e) {
                LOG_WARN("Failed to delete record {}: {}", taskId, e.what());
            }
        }
    }

    if (activeTrack && !activeTrackFinished) {
        auto path = m_storage.trackPath(itemId, activeTrack->index, activeTrack->mimeType);
        if (m_storage.removeFile(path)) {
            LOG_DEBUG("Removed partial track {}", path.string());
        }
    }
}

void DownloadCoordinator::cancelTaskQuietly(const std::string& taskId) {
    try {
        m_engine.cancelByIds({taskId});
        m_engine.deleteRecord(taskId);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to cancel task {}: {}", taskId, e.what());
    }
}

void DownloadCoordinator::dropFinishedRecords(const std::string& itemId) {
    for (const auto& record : recordsFor(itemId)) {
        if (record.status != TaskStatus::Failed && record.status != TaskStatus::Canceled) continue;
        try {
            m_engine.deleteRecord(record.taskId());
        } catch (const std::exception& e) {
            LOG_WARN("Failed to delete record {}: {}", record.taskId(), e.what());
        }
    }
}

// ============================================================================
// Engine and track source access
// ============================================================================

std::vector<TaskRecord> DownloadCoordinator::allRecordsQuietly() const {
    try {
        return m_engine.allRecords();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot read task records: {}", e.what());
        return {};
    }
}

std::vector<TaskRecord> DownloadCoordinator::recordsFor(const std::string& itemId) const {
    std::vector<TaskRecord> result;
    for (auto& record : allRecordsQuietly()) {
        auto owner = TaskMetadata::owningItem(record.task);
        if (owner && *owner == itemId) {
            result.push_back(std::move(record));
        }
    }
    return result;
}

bool DownloadCoordinator::engineHasActiveWork() const {
    auto records = allRecordsQuietly();
    return std::any_of(records.begin(), records.end(), [](const TaskRecord& record) {
        return isActive(record.status);
    });
}

bool DownloadCoordinator::anyInFlight() const {
    return std::any_of(m_items.begin(), m_items.end(), [](const auto& entry) {
        return isInFlight(entry.second.state);
    });
}

std::vector<Track> DownloadCoordinator::fetchTracks(const std::string& itemId,
                                                    const std::optional<std::string>& episodeId) {
    std::vector<Track> tracks = m_trackSource.getTracks(itemId, episodeId);
    std::sort(tracks.begin(), tracks.end(), [](const Track& a, const Track& b) {
        return a.index < b.index;
    });
    m_trackCache[itemId] = tracks;
    return tracks;
}

int DownloadCoordinator::knownTrackCount(const std::string& itemId) {
    auto it = m_trackCache.find(itemId);
    if (it != m_trackCache.end()) {
        return static_cast<int>(it->second.size());
    }

    std::optional<std::string> episodeId;
    if (const TrackedItem* item = findItem(itemId)) {
        episodeId = item->episodeId;
    }

    try {
        return static_cast<int>(fetchTracks(itemId, episodeId).size());
    } catch (const TrackSourceError& e) {
        LOG_DEBUG("Track count of {} unknown: {}", itemId, e.what());
        return 0;
    }
}

// ============================================================================
// State helpers
// ============================================================================

DownloadCoordinator::TrackedItem& DownloadCoordinator::itemFor(const std::string& itemId) {
    auto [it, inserted] = m_items.try_emplace(itemId);
    if (inserted) {
        it->second.itemId = itemId;
    }
    return it->second;
}

DownloadCoordinator::TrackedItem* DownloadCoordinator::findItem(const std::string& itemId) {
    auto it = m_items.find(itemId);
    return it != m_items.end() ? &it->second : nullptr;
}

const DownloadCoordinator::TrackedItem* DownloadCoordinator::findItem(const std::string& itemId) const {
    auto it = m_items.find(itemId);
    return it != m_items.end() ? &it->second : nullptr;
}

bool DownloadCoordinator::applyTrigger(TrackedItem& item, ItemTrigger trigger) {
    auto next = transition(item.state, trigger);
    if (!next) {
        LOG_TRACE("{}: '{}' ignored in state {}", item.itemId, toString(trigger), toString(item.state));
        return false;
    }
    if (*next != item.state) {
        LOG_DEBUG("{}: {} -> {} ({})", item.itemId, toString(item.state), toString(*next), toString(trigger));
        item.state = *next;
    }
    return true;
}

QueueEntry DownloadCoordinator::entryFor(const TrackedItem& item) const {
    return {item.itemId, item.episodeId, item.title};
}

void DownloadCoordinator::publish(const std::string& itemId) {
    if (!m_progressBus.hasSubscribers(itemId)) {
        return;
    }
    m_progressBus.emit(itemId, computeProgress(itemId));
}

void DownloadCoordinator::postGuarded(Millis delay, std::function<void()> task) {
    std::weak_ptr<int> alive = m_alive;
    auto guarded = [alive, task = std::move(task)]() {
        if (alive.expired()) return;
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Download task failed: {}", e.what());
        }
    };

    if (delay.count() <= 0) {
        m_dispatcher.post(std::move(guarded));
    } else {
        m_dispatcher.postDelayed(delay, std::move(guarded));
    }
}

} // namespace kitzi::core::downloads
