/**
 * kitzi-dl - audiobook download client
 *
 * Command line front end of the Kitzi download core: queues books,
 * cancels them and reports progress.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "utils/FileUtils.hpp"
#include "utils/PathUtils.hpp"

namespace fs = std::filesystem;

using kitzi::core::Application;
using kitzi::core::Logger;
using kitzi::core::downloads::ItemProgress;
using kitzi::core::downloads::ItemStatus;

// Set by the signal handler, polled by long-running commands
std::atomic<bool> g_interrupted{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int signal) {
    (void)signal;
    g_interrupted = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

/**
 * Initialize application directories
 */
bool initializeDirectories() {
    std::vector<fs::path> directories = {
        kitzi::utils::PathUtils::getKitziPath(),
        kitzi::utils::PathUtils::getLogsPath(),
        kitzi::utils::PathUtils::getDocumentsPath()
    };

    for (const auto& dir : directories) {
        if (!kitzi::utils::FileUtils::createDirectories(dir)) {
            LOG_ERROR("Failed to create directory: {}", dir.string());
            return false;
        }
    }
    return true;
}

/**
 * Load configuration, creating a default file on first run
 */
bool loadConfiguration(const fs::path& configPath) {
    auto& config = kitzi::core::Config::instance();

    if (fs::exists(configPath)) {
        if (!config.load(configPath.string())) {
            LOG_ERROR("Configuration at {} is unreadable", configPath.string());
            return false;
        }
        LOG_INFO("Configuration loaded from {}", configPath.string());
    } else {
        config.setDefaults();
        config.setStoragePath(configPath.string());
        if (!config.save()) {
            LOG_WARN("Could not write default configuration to {}", configPath.string());
        } else {
            LOG_INFO("Default configuration created at {}", configPath.string());
        }
    }
    return true;
}

void printUsage(const char* program) {
    std::cout << "kitzi-dl - audiobook downloads\n"
              << "\nUsage: " << program << " [options] <command> [args]\n"
              << "\nCommands:\n"
              << "  enqueue <itemId> [episodeId]  Download a book and wait for it\n"
              << "  cancel <itemId>               Stop a download and block the book\n"
              << "  delete <itemId>               Cancel and delete local files\n"
              << "  cancel-all                    Cancel every download\n"
              << "  status [itemId]               Show the queue or one book\n"
              << "  list                          List books with local files\n"
              << "\nOptions:\n"
              << "  -d, --debug          Enable debug logging\n"
              << "  -c, --config PATH    Use another config file\n"
              << "  -t, --title TITLE    Title shown in notifications\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\nEach command runs its own transfer engine. A cancel or delete issued\n"
              << "from another shell blocks the book and removes its files, but does not\n"
              << "stop a transfer a running 'enqueue' process already started; stop that\n"
              << "process with Ctrl+C.\n"
              << std::endl;
}

void printProgress(const ItemProgress& progress) {
    std::cout << progress.itemId << "  "
              << std::setw(8) << std::left << kitzi::core::downloads::toString(progress.status) << std::right
              << std::setw(6) << std::fixed << std::setprecision(1) << progress.progress * 100.0 << "%  "
              << progress.completed << "/" << progress.totalTasks << " tracks"
              << std::endl;
}

/**
 * Queue a book and follow it until it finishes
 * @return Process exit code
 */
int runEnqueue(Application& app, const std::string& itemId,
               const std::optional<std::string>& episodeId, const std::string& title) {
    std::atomic<bool> seenActive{false};

    auto subscription = app.watchProgress(itemId, [&seenActive](const ItemProgress& progress) {
        if (progress.status == ItemStatus::Queued || progress.status == ItemStatus::Running) {
            seenActive = true;
        }
        printProgress(progress);
    });

    app.enqueue(itemId, episodeId, title);

    int exitCode = 1;
    while (!g_interrupted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));

        ItemProgress progress = app.computeProgress(itemId);
        if (progress.status == ItemStatus::Complete) {
            exitCode = 0;
            break;
        }
        if (progress.status == ItemStatus::Failed) {
            break;
        }
        if (progress.status == ItemStatus::None && seenActive) {
            // Canceled from elsewhere
            break;
        }
    }

    app.unwatchProgress(subscription);

    if (g_interrupted) {
        std::cout << "Interrupted; the download resumes on the next run" << std::endl;
    } else {
        printProgress(app.computeProgress(itemId));
    }
    return exitCode;
}

int runStatus(Application& app, const std::optional<std::string>& itemId) {
    if (itemId) {
        printProgress(app.computeProgress(*itemId));
        return 0;
    }

    auto status = app.queueStatus();
    std::cout << "Queue: " << status.length << " waiting"
              << (status.isProcessing ? ", downloading" : ", idle") << std::endl;
    for (const auto& entry : status.items) {
        std::cout << "  " << entry.itemId;
        if (entry.episodeId) std::cout << " (" << *entry.episodeId << ")";
        if (!entry.title.empty()) std::cout << "  " << entry.title;
        std::cout << std::endl;
    }
    for (const auto& tracked : app.listTrackedItemIds()) {
        printProgress(app.computeProgress(tracked));
    }
    if (!status.blocked.empty()) {
        std::cout << "Blocked:";
        for (const auto& blocked : status.blocked) {
            std::cout << " " << blocked;
        }
        std::cout << std::endl;
    }
    return 0;
}

int runList(Application& app) {
    for (const auto& itemId : app.listDownloadedItemIds()) {
        printProgress(app.computeProgress(itemId));
    }
    return 0;
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    // Parse command line arguments
    bool debugMode = false;
    fs::path configPath = kitzi::utils::PathUtils::getConfigPath();
    std::string title;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "--title" || arg == "-t") && i + 1 < argc) {
            title = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "kitzi-dl v" << Application::getVersion() << std::endl;
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string command = positional[0];
    auto argAt = [&positional](size_t index) -> std::optional<std::string> {
        if (index < positional.size()) return positional[index];
        return std::nullopt;
    };

    // Initialize logger
    Logger::instance().initialize(
        debugMode ? kitzi::core::LogLevel::Debug : kitzi::core::LogLevel::Info,
        kitzi::utils::PathUtils::getLogsPath().string()
    );

    auto& logger = Logger::instance();
    LOG_INFO("kitzi-dl v{} starting...", Application::getVersion());

    setupSignalHandlers();

    if (!initializeDirectories()) {
        LOG_CRITICAL("Failed to initialize application directories");
        return 1;
    }

    if (!loadConfiguration(configPath)) {
        LOG_CRITICAL("Failed to load configuration");
        return 1;
    }

    if (!debugMode) {
        logger.setLevel(Logger::levelFromString(
            kitzi::core::Config::instance().get<std::string>("logging.level", "info")));
    }

    try {
        Application app;

        if (!app.initialize()) {
            LOG_CRITICAL("Failed to initialize application");
            return 1;
        }

        int exitCode = 0;
        if (command == "enqueue" && argAt(1)) {
            exitCode = runEnqueue(app, *argAt(1), argAt(2), title);
        } else if (command == "cancel" && argAt(1)) {
            app.cancel(*argAt(1));
        } else if (command == "delete" && argAt(1)) {
            app.deleteLocal(*argAt(1));
        } else if (command == "cancel-all") {
            app.cancelAll();
        } else if (command == "status") {
            exitCode = runStatus(app, argAt(1));
        } else if (command == "list") {
            exitCode = runList(app);
        } else {
            printUsage(argv[0]);
            exitCode = 2;
        }

        app.shutdown();
        LOG_INFO("kitzi-dl shutdown complete");
        return exitCode;

    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }
}
