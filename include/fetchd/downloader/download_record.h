#pragma once

#include <fetchd/downloader/downloader.hpp>

#include <optional>

namespace fetchd::downloader {

/**
 * @brief Policy check shared by the record and the transfer executor.
 *
 * Roaming and network-type restrictions only bind Public-mode requests. The recommended
 * (soft) size ceiling and its bypass flag only apply to Public-mode requests as well; Legacy
 * requests are held to the hard ceiling alone.
 */
NetworkUsability checkCanUseNetwork(const DownloadInfo& info, const ISystemFacade& system);

/**
 * @brief Completion event for a terminal record, addressed according to its request mode.
 *
 * Legacy events carry the notification class, content locator and extras.
 */
CompletionEvent makeCompletionEvent(const DownloadInfo& info, int finalStatus);

// False when nobody asked to be told: no owner, or a Legacy request without a class.
bool wantsCompletionSignal(const CompletionEvent& event);

// Locator handed to Legacy completion receivers
std::string contentLocatorFor(DownloadId id);

// External and FileUri destinations are left in place on error and on teardown.
inline bool isExternallyVisible(Destination destination) {
    return destination != Destination::Cache;
}

/**
 * @brief In-memory view of one download: the persisted fields plus transient runtime state.
 *
 * Instances are owned by the scheduler registry and must only be touched under the
 * registry lock. `hasActiveThread` is never persisted.
 */
class DownloadRecord {
public:
    DownloadRecord(DownloadInfo info, int fuzz, int retryFirstDelaySec = 30);

    [[nodiscard]] DownloadId id() const { return info_.id; }
    [[nodiscard]] const DownloadInfo& info() const { return info_; }
    DownloadInfo& info() { return info_; }

    // Replace persisted fields from a fresh store row; transient state is kept.
    void mergeFrom(const DownloadInfo& row);

    [[nodiscard]] int fuzz() const { return fuzz_; }
    [[nodiscard]] bool hasActiveThread() const { return hasActiveThread_; }
    void setActiveThread(bool active) { hasActiveThread_ = active; }

    /**
     * @brief Earliest time the next attempt may start.
     *
     * now when the record never failed; lastModified + retryAfter when the server asked for
     * a delay; otherwise lastModified + base * (1000 + fuzz) * 2^(failures - 1).
     */
    [[nodiscard]] Millis restartTime(Millis now) const;

    [[nodiscard]] bool isReadyToStart(Millis now, const ISystemFacade& system) const;

    [[nodiscard]] NetworkUsability checkCanUseNetwork(const ISystemFacade& system) const {
        return downloader::checkCanUseNetwork(info_, system);
    }

    // -1 when terminal, 0 when actionable now, else milliseconds until restartTime.
    [[nodiscard]] Millis nextAction(Millis now) const;

    [[nodiscard]] bool hasCompletionNotification() const;

private:
    DownloadInfo info_;
    int fuzz_;
    int retryFirstDelaySec_;
    bool hasActiveThread_{false};
};

} // namespace fetchd::downloader
