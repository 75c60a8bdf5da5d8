#include <fetchd/downloader/download_control.h>
#include <fetchd/downloader/url_utils.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace fetchd::downloader {

Result<DownloadId> DownloadControl::enqueue(const DownloadRequest& request) {
    if (!isHttpUrl(request.uri)) {
        return Error{ErrorCode::InvalidArgument, "only http and https URIs can be downloaded: " +
                                                     request.uri};
    }
    if (request.destination == Destination::FileUri && request.hint.empty()) {
        return Error{ErrorCode::InvalidArgument, "a file destination needs a path hint"};
    }

    DownloadInfo info;
    info.uri = request.uri;
    info.hint = request.hint;
    info.mimeType = request.mimeType;
    info.destination = request.destination;
    info.requestHeaders = request.headers;
    info.cookies = request.cookies;
    info.userAgent = request.userAgent;
    info.referer = request.referer;
    info.mode = request.mode;
    info.noIntegrity = request.noIntegrity;
    info.owner = request.owner;
    info.notificationClass = request.notificationClass;
    info.extras = request.extras;
    info.title = request.title;
    info.description = request.description;
    info.visibility = request.visibility;
    info.allowedNetworkTypes = request.allowedNetworkTypes;
    info.allowRoaming = request.allowRoaming;
    info.bypassRecommendedSizeLimit = request.bypassRecommendedSizeLimit;
    info.status = status::Pending;
    info.lastModified = currentTimeMillis();

    auto id = store_.insert(info);
    if (id) {
        spdlog::info("[DownloadControl] Enqueued download {} for {}", id.value(), request.uri);
    }
    return id;
}

Result<void> DownloadControl::pause(DownloadId id) {
    RecordUpdate update;
    update.control = Control::Paused;
    return store_.update(id, update);
}

Result<void> DownloadControl::resume(DownloadId id) {
    auto info = fetch(id);
    if (!info)
        return info.error();

    RecordUpdate update;
    update.control = Control::Run;
    if (info.value().status == status::PausedByApp) {
        update.status = status::Pending;
    }
    return store_.update(id, update);
}

Result<void> DownloadControl::cancel(DownloadId id) {
    RecordUpdate update;
    update.deleted = true;
    return store_.update(id, update);
}

Result<void> DownloadControl::bypassRecommendedSizeLimit(DownloadId id) {
    RecordUpdate update;
    update.bypassRecommendedSizeLimit = true;
    auto r = store_.update(id, update);
    if (r) {
        spdlog::info("[DownloadControl] Download {} may exceed the recommended mobile size", id);
    }
    return r;
}

Result<void> DownloadControl::restart(DownloadId id) {
    auto info = fetch(id);
    if (!info)
        return info.error();

    const auto& current = info.value();
    if (!status::isCompleted(current.status)) {
        return Error{ErrorCode::InvalidState, "download " + std::to_string(id) +
                                                  " is still " + status::toString(current.status)};
    }

    if (!current.filename.empty()) {
        std::error_code ec;
        std::filesystem::remove(current.filename, ec);
        if (ec) {
            spdlog::warn("[DownloadControl] Could not delete {}: {}", current.filename,
                         ec.message());
        }
    }

    RecordUpdate update;
    update.currentBytes = 0;
    update.totalBytes = -1;
    update.filename = std::string{};
    update.etag = std::string{};
    update.status = status::Pending;
    update.control = Control::Run;
    update.numFailed = 0;
    update.retryAfter = 0;
    update.lastModified = currentTimeMillis();
    return store_.update(id, update);
}

Result<std::vector<DownloadInfo>> DownloadControl::list(const std::optional<std::string>& owner) {
    if (owner) {
        return store_.queryByOwner(*owner);
    }
    return store_.queryAll();
}

Result<DownloadInfo> DownloadControl::fetch(DownloadId id) {
    auto row = store_.query(id);
    if (!row)
        return row.error();
    if (!row.value()) {
        return Error{ErrorCode::NotFound, "no download with id " + std::to_string(id)};
    }
    return *std::move(row).value();
}

} // namespace fetchd::downloader
