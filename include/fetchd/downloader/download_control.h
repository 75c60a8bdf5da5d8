#pragma once

#include <fetchd/downloader/downloader.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fetchd::downloader {

// What a caller asks for; everything else on the record starts at its default.
struct DownloadRequest {
    std::string uri;
    std::string hint;
    std::string mimeType;
    Destination destination{Destination::Cache};
    std::vector<Header> headers;
    std::string cookies;
    std::string userAgent;
    std::string referer;
    RequestMode mode{RequestMode::Public};
    bool noIntegrity{false};

    std::string owner;
    std::string notificationClass;
    std::string extras;
    std::string title;
    std::string description;
    Visibility visibility{Visibility::Visible};

    int allowedNetworkTypes{network_flags::All};
    bool allowRoaming{true};
    bool bypassRecommendedSizeLimit{false};
};

/**
 * @brief Caller-facing operations, expressed as store mutations.
 *
 * The scheduler observes every change through the store listener; nothing here talks to it
 * directly.
 */
class DownloadControl {
public:
    explicit DownloadControl(IDownloadStore& store) : store_(store) {}

    // InvalidArgument for a non-http(s) URI or a FileUri destination without a hint.
    Result<DownloadId> enqueue(const DownloadRequest& request);

    Result<void> pause(DownloadId id);
    Result<void> resume(DownloadId id);
    Result<void> cancel(DownloadId id);

    // User confirmation that a download may exceed the recommended mobile size.
    Result<void> bypassRecommendedSizeLimit(DownloadId id);

    // Only completed downloads can be restarted (InvalidState otherwise).
    Result<void> restart(DownloadId id);

    Result<std::vector<DownloadInfo>> list(const std::optional<std::string>& owner = {});

private:
    Result<DownloadInfo> fetch(DownloadId id);

    IDownloadStore& store_;
};

} // namespace fetchd::downloader
