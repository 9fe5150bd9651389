#pragma once

/**
 * Application.hpp
 *
 * Owns the download subsystem and its lifecycle: event loop, transfer
 * engine, track source and the coordinator actor. Public methods may be
 * called from any thread; they hop onto the coordinator's loop.
 */

#include "EventBus.hpp"
#include "downloads/DownloadTypes.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kitzi::core::downloads {
class AbsTrackSource;
class DownloadCoordinator;
class DownloadStorage;
class HttpTransferEngine;
class LogNotificationSink;
}

namespace kitzi::core {

class EventLoop;

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Handles initialization, shutdown, and coordination of the download
 * subsystems.
 */
class Application {
public:
    Application();
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all subsystems and resume pending downloads
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Shutdown gracefully. Active transfers are aborted and resumed by the
     * next run.
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }

    bool isRunning() const { return m_state == AppState::Ready; }

    /**
     * Register state change callback
     * @param callback Function to call on state change
     */
    void onStateChange(std::function<void(AppState)> callback);

    // Download operations, forwarded to the coordinator's loop

    void enqueue(const std::string& itemId,
                 const std::optional<std::string>& episodeId = std::nullopt,
                 const std::string& title = "");
    void cancel(const std::string& itemId);
    void deleteLocal(const std::string& itemId);
    void cancelAll();
    void resumeAll();

    downloads::ItemProgress computeProgress(const std::string& itemId);
    std::vector<std::string> listTrackedItemIds();
    std::vector<std::string> listDownloadedItemIds();
    downloads::QueueStatus queueStatus();

    /**
     * Subscribe to an item's progress; the callback runs on the loop thread
     */
    SubscriptionPtr watchProgress(const std::string& itemId,
                                  std::function<void(const downloads::ItemProgress&)> callback);
    void unwatchProgress(const SubscriptionPtr& subscription);

    /**
     * Report a network change to the transfer engine
     */
    void setUnmeteredNetwork(bool unmetered);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Kitzi"; }

private:
    void setState(AppState state);

    /**
     * Run a call on the loop and wait for it
     */
    template<typename F>
    auto onLoop(F&& f);

    bool initializeStorage();
    bool initializeEngine();
    bool initializeTrackSource();
    bool initializeCoordinator();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::unique_ptr<EventLoop> m_loop;
    std::unique_ptr<downloads::DownloadStorage> m_storage;
    std::unique_ptr<downloads::HttpTransferEngine> m_engine;
    std::unique_ptr<downloads::AbsTrackSource> m_trackSource;
    std::unique_ptr<downloads::LogNotificationSink> m_notifications;
    std::unique_ptr<downloads::DownloadCoordinator> m_coordinator;

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;
};

} // namespace kitzi::core
