#include "NotificationSink.hpp"
#include "../Logger.hpp"

namespace kitzi::core::downloads {

void LogNotificationSink::onDownloadStarted(const std::string& title) {
    LOG_INFO("Downloading: {}", title.empty() ? "audiobook" : title);
}

void LogNotificationSink::onDownloadComplete(const std::string& title) {
    LOG_INFO("Download complete: {}", title.empty() ? "audiobook" : title);
}

void LogNotificationSink::onDownloadCanceled() {
    LOG_INFO("Download canceled");
}

} // namespace kitzi::core::downloads
