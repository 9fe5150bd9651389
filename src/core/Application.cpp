/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Config.hpp"
#include "EventLoop.hpp"
#include "Logger.hpp"
#include "downloads/AbsTrackSource.hpp"
#include "downloads/DownloadCoordinator.hpp"
#include "downloads/DownloadStorage.hpp"
#include "downloads/HttpTransferEngine.hpp"
#include "downloads/NotificationSink.hpp"
#include "../utils/PathUtils.hpp"

#include <chrono>
#include <stdexcept>

namespace kitzi::core {

using namespace downloads;

Application::Application() {
    LOG_DEBUG("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    LOG_DEBUG("Application instance destroyed");
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        LOG_WARN("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    LOG_INFO("Initializing application...");

    auto startTime = std::chrono::high_resolution_clock::now();

    m_loop = std::make_unique<EventLoop>();

    if (!initializeStorage()) {
        LOG_ERROR("Failed to initialize download storage");
        setState(AppState::Error);
        return false;
    }

    if (!initializeEngine()) {
        LOG_ERROR("Failed to initialize transfer engine");
        setState(AppState::Error);
        return false;
    }

    if (!initializeTrackSource()) {
        LOG_ERROR("Failed to initialize track source");
        setState(AppState::Error);
        return false;
    }

    if (!initializeCoordinator()) {
        LOG_ERROR("Failed to initialize download coordinator");
        setState(AppState::Error);
        return false;
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    LOG_INFO("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    LOG_INFO("Shutting down application...");

    // The loop goes first so no coordinator task runs during teardown
    if (m_loop) {
        m_loop->stop();
    }

    m_coordinator.reset();
    if (m_engine) {
        m_engine->shutdown();
    }
    m_engine.reset();
    m_trackSource.reset();
    m_notifications.reset();
    m_storage.reset();
    m_loop.reset();

    // Another kitzi-dl process may have blocked or unblocked items since
    // this one last wrote the list
    auto& config = Config::instance();
    config.refresh(downloads::BlockedItemRegistry::CONFIG_KEY);
    if (!config.save()) {
        LOG_WARN("Failed to save configuration");
    }

    LOG_INFO("Application shutdown complete");
    setState(AppState::Uninitialized);
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            LOG_ERROR("State callback error: {}", e.what());
        }
    }
}

template<typename F>
auto Application::onLoop(F&& f) {
    if (!m_coordinator || !m_loop) {
        throw std::runtime_error("Application is not initialized");
    }
    return m_loop->submit(std::forward<F>(f)).get();
}

// ============================================================================
// Download operations
// ============================================================================

void Application::enqueue(const std::string& itemId,
                          const std::optional<std::string>& episodeId,
                          const std::string& title) {
    onLoop([&]() { m_coordinator->enqueue(itemId, episodeId, title); });
}

void Application::cancel(const std::string& itemId) {
    onLoop([&]() { m_coordinator->cancel(itemId); });
}

void Application::deleteLocal(const std::string& itemId) {
    onLoop([&]() { m_coordinator->deleteLocal(itemId); });
}

void Application::cancelAll() {
    onLoop([&]() { m_coordinator->cancelAll(); });
}

void Application::resumeAll() {
    onLoop([&]() { m_coordinator->resumeAll(); });
}

ItemProgress Application::computeProgress(const std::string& itemId) {
    return onLoop([&]() { return m_coordinator->computeProgress(itemId); });
}

std::vector<std::string> Application::listTrackedItemIds() {
    return onLoop([&]() { return m_coordinator->listTrackedItemIds(); });
}

std::vector<std::string> Application::listDownloadedItemIds() {
    return onLoop([&]() { return m_coordinator->listDownloadedItemIds(); });
}

QueueStatus Application::queueStatus() {
    return onLoop([&]() { return m_coordinator->queueStatus(); });
}

SubscriptionPtr Application::watchProgress(const std::string& itemId,
                                           std::function<void(const ItemProgress&)> callback) {
    return onLoop([&]() { return m_coordinator->watchProgress(itemId, callback); });
}

void Application::unwatchProgress(const SubscriptionPtr& subscription) {
    onLoop([&]() { m_coordinator->unwatchProgress(subscription); });
}

void Application::setUnmeteredNetwork(bool unmetered) {
    if (m_engine) {
        m_engine->setUnmeteredNetwork(unmetered);
    }
}

// ============================================================================
// Subsystems
// ============================================================================

bool Application::initializeStorage() {
    try {
        m_storage = std::make_unique<DownloadStorage>(utils::PathUtils::getDocumentsPath());
        LOG_INFO("Downloads stored under {}", m_storage->baseDirectory().string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Storage initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeEngine() {
    try {
        auto& config = Config::instance();

        m_engine = std::make_unique<HttpTransferEngine>(
            m_storage->documentsRoot(),
            utils::PathUtils::getTaskDatabasePath(),
            static_cast<size_t>(config.get<int>("transfer.workers", 1))
        );
        m_engine->setTimeout(config.get<int>("transfer.timeoutMs", 0));
        m_engine->setUnmeteredNetwork(config.get<bool>("transfer.unmeteredNetwork", true));
        m_engine->initialize();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Transfer engine initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeTrackSource() {
    try {
        m_trackSource = std::make_unique<AbsTrackSource>(AbsTrackSource::fromConfig());
        if (m_trackSource->serverUrl().empty()) {
            LOG_WARN("No server configured; new downloads will fail");
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Track source initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeCoordinator() {
    try {
        m_notifications = std::make_unique<LogNotificationSink>();
        m_coordinator = std::make_unique<DownloadCoordinator>(
            *m_loop, *m_engine, *m_trackSource, *m_notifications, *m_storage);

        m_loop->submit([this]() {
            m_coordinator->start();
            m_coordinator->resumeAll();
        }).get();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Coordinator initialization error: {}", e.what());
        return false;
    }
}

} // namespace kitzi::core
