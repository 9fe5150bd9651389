#pragma once

/**
 * NotificationSink.hpp
 *
 * Fire-and-forget user notifications about book downloads.
 */

#include <string>

namespace kitzi::core::downloads {

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void onDownloadStarted(const std::string& title) = 0;
    virtual void onDownloadComplete(const std::string& title) = 0;
    virtual void onDownloadCanceled() = 0;
};

/**
 * Writes notifications to the application log. Used by the CLI.
 */
class LogNotificationSink : public NotificationSink {
public:
    void onDownloadStarted(const std::string& title) override;
    void onDownloadComplete(const std::string& title) override;
    void onDownloadCanceled() override;
};

} // namespace kitzi::core::downloads
