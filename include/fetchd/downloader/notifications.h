#pragma once

#include <fetchd/downloader/downloader.hpp>

#include <vector>

namespace fetchd::downloader {

/**
 * @brief Build the notification list for the current set of records.
 *
 * Non-terminal records that are not hidden are grouped into one Active item per owner, with
 * byte counts summed (the total is 0 when any member's length is unknown). Each completed
 * record with VisibleNotifyCompleted gets its own Completed item. Deleted rows are skipped.
 */
std::vector<NotificationItem> collateNotifications(const std::vector<DownloadInfo>& records);

} // namespace fetchd::downloader
