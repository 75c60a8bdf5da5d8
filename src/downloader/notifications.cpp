#include <fetchd/downloader/notifications.h>

#include <map>

namespace fetchd::downloader {

namespace {

bool isActiveAndVisible(const DownloadInfo& info) {
    return status::isInformational(info.status) && info.visibility != Visibility::Hidden;
}

bool isCompletedAndVisible(const DownloadInfo& info) {
    return status::isCompleted(info.status) &&
           info.visibility == Visibility::VisibleNotifyCompleted;
}

} // namespace

std::vector<NotificationItem> collateNotifications(const std::vector<DownloadInfo>& records) {
    std::map<std::string, NotificationItem> active;
    std::map<std::string, bool> unknownLength;
    std::vector<NotificationItem> completed;

    for (const auto& info : records) {
        if (info.deleted) {
            continue;
        }
        if (isActiveAndVisible(info)) {
            auto [it, inserted] = active.try_emplace(info.owner);
            auto& item = it->second;
            if (inserted) {
                item.kind = NotificationItem::Kind::Active;
                item.owner = info.owner;
                item.status = info.status;
                item.paused = true;
            }
            item.ids.push_back(info.id);
            item.titles.push_back(info.title);
            item.currentBytes += info.currentBytes;
            if (info.totalBytes <= 0) {
                unknownLength[info.owner] = true;
            } else {
                item.totalBytes += info.totalBytes;
            }
            if (info.status == status::Running) {
                item.status = status::Running;
                item.paused = false;
            }
        } else if (isCompletedAndVisible(info)) {
            NotificationItem item;
            item.kind = NotificationItem::Kind::Completed;
            item.owner = info.owner;
            item.ids.push_back(info.id);
            item.titles.push_back(info.title);
            item.currentBytes = info.currentBytes;
            item.totalBytes = info.totalBytes;
            item.status = info.status;
            completed.push_back(std::move(item));
        }
    }

    std::vector<NotificationItem> out;
    out.reserve(active.size() + completed.size());
    for (auto& [owner, item] : active) {
        if (unknownLength.count(owner)) {
            item.totalBytes = 0;
        }
        out.push_back(std::move(item));
    }
    for (auto& item : completed) {
        out.push_back(std::move(item));
    }
    return out;
}

} // namespace fetchd::downloader
