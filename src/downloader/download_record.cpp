#include <fetchd/downloader/download_record.h>

#include <algorithm>

namespace fetchd::downloader {

namespace {

bool isWifiEquivalent(NetworkType type) {
    return type == NetworkType::Wifi || type == NetworkType::Ethernet;
}

int flagForNetworkType(NetworkType type) {
    switch (type) {
        case NetworkType::Mobile:
            return network_flags::Mobile;
        case NetworkType::Wifi:
        case NetworkType::Ethernet:
            return network_flags::Wifi;
        case NetworkType::None:
            break;
    }
    return 0;
}

NetworkUsability checkSizeAllowedForNetwork(const DownloadInfo& info, NetworkType type,
                                            const ISystemFacade& system) {
    if (info.totalBytes <= 0) {
        return NetworkUsability::Ok;
    }
    if (isWifiEquivalent(type)) {
        return NetworkUsability::Ok;
    }
    if (auto maxBytes = system.maxBytesOverMobile(); maxBytes && info.totalBytes > *maxBytes) {
        return NetworkUsability::UnusableDueToSize;
    }
    if (info.mode == RequestMode::Public && !info.bypassRecommendedSizeLimit) {
        if (auto recommended = system.recommendedMaxBytesOverMobile();
            recommended && info.totalBytes > *recommended) {
            return NetworkUsability::RecommendedUnusableDueToSize;
        }
    }
    return NetworkUsability::Ok;
}

} // namespace

NetworkUsability checkCanUseNetwork(const DownloadInfo& info, const ISystemFacade& system) {
    const auto type = system.activeNetworkType();
    if (type == NetworkType::None) {
        return NetworkUsability::NoConnection;
    }
    if (info.mode == RequestMode::Public) {
        if (system.isNetworkRoaming() && !info.allowRoaming) {
            return NetworkUsability::CannotUseRoaming;
        }
        if ((info.allowedNetworkTypes & flagForNetworkType(type)) == 0) {
            return NetworkUsability::TypeDisallowedByRequestor;
        }
    }
    return checkSizeAllowedForNetwork(info, type, system);
}

std::string contentLocatorFor(DownloadId id) {
    return "content://downloads/download/" + std::to_string(id);
}

CompletionEvent makeCompletionEvent(const DownloadInfo& info, int finalStatus) {
    CompletionEvent ev;
    ev.id = info.id;
    ev.status = finalStatus;
    ev.visibility = info.visibility;
    ev.owner = info.owner;
    ev.mode = info.mode;
    if (info.mode == RequestMode::Legacy && !info.notificationClass.empty()) {
        ev.notificationClass = info.notificationClass;
        ev.contentLocator = contentLocatorFor(info.id);
        ev.extras = info.extras;
    }
    return ev;
}

bool wantsCompletionSignal(const CompletionEvent& event) {
    if (event.owner.empty()) {
        return false;
    }
    return event.mode == RequestMode::Public || !event.notificationClass.empty();
}

DownloadRecord::DownloadRecord(DownloadInfo info, int fuzz, int retryFirstDelaySec)
    : info_(std::move(info)), fuzz_(std::clamp(fuzz, 0, 1000)),
      retryFirstDelaySec_(retryFirstDelaySec) {}

void DownloadRecord::mergeFrom(const DownloadInfo& row) {
    const auto id = info_.id;
    info_ = row;
    info_.id = id;
}

Millis DownloadRecord::restartTime(Millis now) const {
    if (info_.numFailed == 0) {
        return now;
    }
    if (info_.retryAfter > 0) {
        return info_.lastModified + info_.retryAfter;
    }
    // Cap the shift so a runaway counter cannot overflow.
    const int shift = std::min(info_.numFailed - 1, 30);
    return info_.lastModified + static_cast<Millis>(retryFirstDelaySec_) * (1000 + fuzz_) *
                                    (static_cast<Millis>(1) << shift);
}

bool DownloadRecord::isReadyToStart(Millis now, const ISystemFacade& system) const {
    if (hasActiveThread_) {
        return false;
    }
    if (info_.control == Control::Paused) {
        return false;
    }
    switch (info_.status) {
        case status::Unknown:
        case status::Pending:
        case status::Running:
        // Paused by the owner, but control has since been set back to Run.
        case status::PausedByApp:
            return true;

        case status::WaitingForNetwork:
        case status::QueuedForWifi:
            return checkCanUseNetwork(system) == NetworkUsability::Ok;

        case status::WaitingToRetry:
            return restartTime(now) <= now;

        default:
            return false;
    }
}

Millis DownloadRecord::nextAction(Millis now) const {
    if (status::isCompleted(info_.status)) {
        return -1;
    }
    if (info_.status != status::WaitingToRetry) {
        return 0;
    }
    const auto when = restartTime(now);
    if (when <= now) {
        return 0;
    }
    return when - now;
}

bool DownloadRecord::hasCompletionNotification() const {
    return status::isCompleted(info_.status) &&
           info_.visibility == Visibility::VisibleNotifyCompleted;
}

} // namespace fetchd::downloader
