#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace kitzi::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* xdg = std::getenv("XDG_DATA_HOME");
        if (xdg && *xdg) {
            return fs::path(xdg);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getKitziPath() {
        return getAppDataPath() / "Kitzi";
    }

    static fs::path getConfigPath() {
        return getKitziPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getKitziPath() / "logs";
    }

    // Root every download directory is resolved against
    static fs::path getDocumentsPath() {
        return getKitziPath() / "documents";
    }

    static fs::path getTaskDatabasePath() {
        return getKitziPath() / "tasks.json";
    }
};

} // namespace kitzi::utils
