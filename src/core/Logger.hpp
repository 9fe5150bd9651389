#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the download core and the CLI.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kitzi::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 *
 * Sinks:
 * - Console output with colors
 * - Rotating file output (optional)
 *
 * Until initialize() is called every call is a no-op, so library code
 * can log unconditionally.
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = console only)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);

            if (!logDir.empty()) {
                std::filesystem::path logPath = std::filesystem::path(logDir) / "kitzi.log";
                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            m_logger = std::make_shared<spdlog::logger>("kitzi", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));

        } catch (const spdlog::spdlog_ex& ex) {
            m_logger = spdlog::stdout_color_mt("kitzi_fallback");
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = spdlog::stdout_color_mt("kitzi_fallback");
            m_logger->error("Cannot create log directory: {}", ex.what());
        }
    }

    void setLevel(LogLevel level) {
        if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Write one message. A no-op before initialize().
     * @param level Message level
     * @param fmt fmt-style format string
     */
    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!m_logger) {
            return;
        }
        m_logger->log(toSpdlogLevel(level), fmt, std::forward<Args>(args)...);
    }

    /**
     * Parse a level name ("trace", "debug", "info", "warn", "error",
     * "critical", "off"). Unknown names map to Info.
     */
    static LogLevel levelFromString(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace kitzi::core

// Convenience macros
#define KITZI_LOG(level, ...) kitzi::core::Logger::instance().log(kitzi::core::LogLevel::level, __VA_ARGS__)

#define LOG_TRACE(...)    KITZI_LOG(Trace, __VA_ARGS__)
#define LOG_DEBUG(...)    KITZI_LOG(Debug, __VA_ARGS__)
#define LOG_INFO(...)     KITZI_LOG(Info, __VA_ARGS__)
#define LOG_WARN(...)     KITZI_LOG(Warn, __VA_ARGS__)
#define LOG_ERROR(...)    KITZI_LOG(Error, __VA_ARGS__)
#define LOG_CRITICAL(...) KITZI_LOG(Critical, __VA_ARGS__)
