#include <fetchd/downloader/download_record.h>
#include <fetchd/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

namespace fetchd::downloader {

namespace {

// Reports through the log; completion signals also go to an optional callback.
class LoggingCompletionSink final : public ICompletionSink {
public:
    explicit LoggingCompletionSink(CompletionCallback onCompleted)
        : onCompleted_(std::move(onCompleted)) {}

    void downloadCompleted(const CompletionEvent& event) override {
        if (status::isSuccess(event.status)) {
            spdlog::info("[CompletionSink] Download {} completed", event.id);
        } else {
            spdlog::warn("[CompletionSink] Download {} failed: {} ({})", event.id,
                         status::toString(event.status),
                         categoryMessage(userFacingCategory(event.status)));
        }

        if (!wantsCompletionSignal(event)) {
            spdlog::debug("[CompletionSink] No completion receiver for download {}", event.id);
            return;
        }
        if (event.mode == RequestMode::Legacy) {
            spdlog::debug("[CompletionSink] Signal {} -> {}/{} ({})", event.id, event.owner,
                          event.notificationClass, event.contentLocator);
        } else {
            spdlog::debug("[CompletionSink] Signal {} -> {}", event.id, event.owner);
        }
        if (onCompleted_) {
            onCompleted_(event);
        }
    }

    void cancelNotification(DownloadId id) override {
        spdlog::debug("[CompletionSink] Cancel notification for {}", id);
    }

    void cancelAllNotifications() override {
        spdlog::debug("[CompletionSink] Cancel all notifications");
    }

    void pausedForSize(DownloadId id, bool isWifiRequired) override {
        spdlog::info("[CompletionSink] Download {} {} Wi-Fi", id,
                     isWifiRequired ? "requires" : "is recommended to wait for");
    }

    void updateNotifications(const std::vector<NotificationItem>& items) override {
        for (const auto& item : items) {
            if (item.kind == NotificationItem::Kind::Active) {
                spdlog::debug("[CompletionSink] {}: {} active, {}/{} bytes{}", item.owner,
                              item.ids.size(), item.currentBytes, item.totalBytes,
                              item.paused ? " (waiting)" : "");
            } else {
                spdlog::debug("[CompletionSink] {}: download {} finished with {}", item.owner,
                              item.ids.empty() ? 0 : item.ids.front(), item.status);
            }
        }
    }

private:
    CompletionCallback onCompleted_;
};

} // namespace

std::unique_ptr<ICompletionSink> makeLoggingCompletionSink(CompletionCallback onCompleted) {
    return std::make_unique<LoggingCompletionSink>(std::move(onCompleted));
}

} // namespace fetchd::downloader
