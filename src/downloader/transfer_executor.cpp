/*
 * transfer_executor.cpp
 *
 * One download, one thread, start to final status:
 *   resume setup -> connectivity check -> GET -> status handling (503, 3xx, mismatch)
 *   -> header processing (fresh only) -> streamed write with checkpoints -> end of stream
 *   -> finalize/cleanup -> persist final status -> completion sink
 *
 * Every stage returns an Outcome; only Success continues the pipeline. Redirects return
 * Retry and restart the attempt without touching the failure counter.
 */

#include <fetchd/downloader/download_record.h>
#include <fetchd/downloader/transfer_executor.h>
#include <fetchd/downloader/url_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace fetchd::downloader {

namespace {

bool proceeds(const Outcome& o) {
    return std::holds_alternative<outcome::Success>(o);
}

outcome::Stop stop(int status, std::string message) {
    return outcome::Stop{status, std::move(message)};
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

template <typename T> std::optional<T> parseNumber(std::string_view s) {
    s = trimView(s);
    T value{};
    auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

bool isRedirect(int code) {
    return code == 301 || code == 302 || code == 303 || code == 307;
}

int statusForSaveError(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileAlreadyExists:
            return status::FileAlreadyExists;
        case ErrorCode::StorageFull:
            return status::InsufficientSpace;
        case ErrorCode::DeviceNotFound:
            return status::DeviceNotFound;
        case ErrorCode::NotAcceptable:
            return status::NotAcceptable;
        default:
            return status::FileError;
    }
}

} // namespace

TransferExecutor::TransferExecutor(DownloadInfo snapshot, const DownloaderConfig& config,
                                   ExecutorDependencies deps, ControlProbe probe)
    : info_(std::move(snapshot)), config_(config), deps_(deps), probe_(std::move(probe)),
      roots_{config.cacheDir, config.externalDir}, rng_(std::random_device{}()) {}

int TransferExecutor::run() {
    spdlog::info("[Executor:{}] Starting transfer of {}", info_.id, info_.uri);

    State st;
    st.filename = info_.filename;
    st.mimeType = info_.mimeType;
    st.etag = info_.etag;
    st.requestUri = info_.uri;

    int finalStatus = status::UnknownError;
    std::string message;
    try {
        for (;;) {
            Outcome o = executeAttempt(st);
            if (std::holds_alternative<outcome::Retry>(o)) {
                spdlog::debug("[Executor:{}] Following redirect to {}", info_.id, st.requestUri);
                continue;
            }
            if (auto* s = std::get_if<outcome::Stop>(&o)) {
                finalStatus = s->status;
                message = std::move(s->message);
                break;
            }
            finalizeDestination(st);
            finalStatus = status::Success;
            break;
        }
    } catch (const std::exception& e) {
        message = e.what();
        finalStatus = status::UnknownError;
    }

    if (status::isError(finalStatus)) {
        spdlog::warn("[Executor:{}] Finished with {} ({}): {}", info_.id, finalStatus,
                     status::toString(finalStatus), message);
    } else {
        spdlog::info("[Executor:{}] Finished with {} ({}){}{}", info_.id, finalStatus,
                     status::toString(finalStatus), message.empty() ? "" : ": ", message);
    }

    try {
        cleanupDestination(st, finalStatus);
        if (finalStatus == status::Running) {
            // Interrupted by shutdown; the record stays running and resumes on next start.
            return finalStatus;
        }
        notifyCompleted(st, finalStatus);
    } catch (const std::exception& e) {
        spdlog::error("[Executor:{}] Failed to report final status {}: {}", info_.id,
                      finalStatus, e.what());
    }
    return finalStatus;
}

Outcome TransferExecutor::executeAttempt(State& st) {
    file_.close();
    st.continuingDownload = false;
    st.bytesSoFar = 0;
    st.bytesNotified = 0;
    st.headerContentLength = -1;
    st.headerContentDisposition.clear();
    st.headerContentLocation.clear();
    st.headerTransferEncoding.clear();

    if (auto o = checkPausedOrCanceled(); !proceeds(o)) {
        return o;
    }
    if (auto o = setupDestinationFile(st); !proceeds(o)) {
        return o;
    }
    if (st.continuingDownload && st.headerContentLength >= 0 &&
        st.bytesSoFar == st.headerContentLength) {
        // Already complete on disk; a range request would only draw a 416.
        return handleEndOfStream(st);
    }

    HttpRequest request{st.requestUri, buildRequestHeaders(st)};

    if (auto o = checkConnectivity(); !proceeds(o)) {
        return o;
    }

    std::optional<Outcome> stopped;
    bool headSeen = false;

    HeadHandler onHead = [&](const HttpResponseHead& head) {
        headSeen = true;
        Outcome o = handleResponseStatus(st, head);
        if (proceeds(o) && !st.continuingDownload) {
            o = processResponseHeaders(st, head);
        }
        if (!proceeds(o)) {
            stopped = std::move(o);
            return false;
        }
        return true;
    };

    BodySink onBody = [&](ByteSpan data) {
        Outcome o = writeChunk(st, data);
        if (proceeds(o)) {
            reportProgress(st);
            o = checkPausedOrCanceled();
        }
        if (!proceeds(o)) {
            stopped = std::move(o);
            return false;
        }
        return true;
    };

    auto rc = deps_.http.execute(request, onHead, onBody);

    if (stopped) {
        if (st.bytesSoFar > st.bytesNotified) {
            checkpointBytes(st, false);
        }
        return *stopped;
    }

    if (!rc) {
        const auto& err = rc.error();
        if (err.code == ErrorCode::InvalidArgument) {
            return stop(status::HttpDataError, "while trying to execute request: " + err.message);
        }
        if (!headSeen) {
            return stop(finalStatusForHttpError(st),
                        "while trying to execute request: " + err.message);
        }
        checkpointBytes(st, false);
        if (cannotResume(st)) {
            return stop(status::CannotResume,
                        "while reading response: " + err.message +
                            ", can't resume interrupted download with no ETag");
        }
        return stop(finalStatusForHttpError(st), "while reading response: " + err.message);
    }

    return handleEndOfStream(st);
}

Outcome TransferExecutor::setupDestinationFile(State& st) {
    if (st.filename.empty()) {
        return outcome::Success{};
    }

    const fs::path path{st.filename};
    if (!isFilenameValid(path, info_, roots_)) {
        return stop(status::FileError, "found invalid destination filename " + st.filename);
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return outcome::Success{};
    }

    const auto length = fs::file_size(path, ec);
    if (ec) {
        return stop(status::FileError, "unable to stat partial file: " + ec.message());
    }

    if (length == 0) {
        fs::remove(path, ec);
        st.filename.clear();
        return outcome::Success{};
    }

    if (info_.etag.empty() && !info_.noIntegrity) {
        fs::remove(path, ec);
        return stop(status::CannotResume, "trying to resume a download that can't be resumed");
    }

    if (info_.totalBytes >= 0 && static_cast<std::int64_t>(length) > info_.totalBytes) {
        return stop(status::CannotResume, "partial file is larger than the declared length");
    }

    if (auto r = file_.open(path, DestinationFile::Mode::Append,
                            isExternallyVisible(info_.destination));
        !r) {
        return stop(status::FileError, "while opening destination for resuming: " +
                                           r.error().message);
    }

    st.bytesSoFar = static_cast<std::int64_t>(length);
    st.bytesNotified = st.bytesSoFar;
    if (info_.totalBytes >= 0) {
        st.headerContentLength = info_.totalBytes;
    }
    st.etag = info_.etag;
    st.continuingDownload = true;
    spdlog::debug("[Executor:{}] Resuming at byte {}", info_.id, st.bytesSoFar);
    return outcome::Success{};
}

std::vector<Header> TransferExecutor::buildRequestHeaders(const State& st) const {
    std::vector<Header> headers = info_.requestHeaders;
    auto has = [&headers](std::string_view name) {
        return std::any_of(headers.begin(), headers.end(),
                           [&](const Header& h) { return iequals(h.name, name); });
    };

    if (!info_.cookies.empty() && !has("Cookie")) {
        headers.push_back({"Cookie", info_.cookies});
    }
    if (!info_.referer.empty() && !has("Referer")) {
        headers.push_back({"Referer", info_.referer});
    }
    if (!has("User-Agent")) {
        headers.push_back(
            {"User-Agent", info_.userAgent.empty() ? config_.userAgent : info_.userAgent});
    }

    if (st.continuingDownload) {
        if (!st.etag.empty()) {
            headers.push_back({"If-Match", st.etag});
        }
        headers.push_back({"Range", "bytes=" + std::to_string(st.bytesSoFar) + "-"});
    }
    return headers;
}

Outcome TransferExecutor::checkConnectivity() {
    const auto usability = checkCanUseNetwork(info_, deps_.system);
    if (usability == NetworkUsability::Ok) {
        return outcome::Success{};
    }

    int result = status::WaitingForNetwork;
    if (usability == NetworkUsability::UnusableDueToSize) {
        result = status::QueuedForWifi;
        deps_.sink.pausedForSize(info_.id, true);
    } else if (usability == NetworkUsability::RecommendedUnusableDueToSize) {
        result = status::QueuedForWifi;
        deps_.sink.pausedForSize(info_.id, false);
    }
    return stop(result, toString(usability));
}

Outcome TransferExecutor::handleResponseStatus(State& st, const HttpResponseHead& head) {
    const int code = head.statusCode;
    spdlog::debug("[Executor:{}] HTTP {} from {}", info_.id, code, st.requestUri);

    if (code == 503 && info_.numFailed < config_.maxRetries) {
        return handleServiceUnavailable(st, head);
    }

    if (isRedirect(code)) {
        if (st.redirectCount >= config_.maxRedirects) {
            return stop(status::TooManyRedirects, "too many redirects");
        }
        if (head.header("Location")) {
            return handleRedirect(st, head, code);
        }
    }

    const int expected = st.continuingDownload ? 206 : 200;
    if (code != expected) {
        return handleOtherStatus(st, code);
    }
    return outcome::Success{};
}

Outcome TransferExecutor::handleServiceUnavailable(State& st, const HttpResponseHead& head) {
    st.countRetry = true;
    if (auto header = head.header("Retry-After")) {
        if (auto seconds = parseNumber<long long>(*header)) {
            long long delay = *seconds;
            if (delay < 0) {
                delay = 0;
            } else {
                delay = std::clamp<long long>(delay, config_.minRetryAfterSec,
                                              config_.maxRetryAfterSec);
                std::uniform_int_distribution<int> jitter(0, config_.minRetryAfterSec);
                delay += jitter(rng_);
                delay *= 1000;
            }
            st.retryAfter = delay;
        }
    }
    return stop(status::WaitingToRetry, "got 503 Service Unavailable, will retry later");
}

Outcome TransferExecutor::handleRedirect(State& st, const HttpResponseHead& head, int code) {
    const auto location = head.header("Location").value_or("");
    auto resolved = resolveUrl(st.requestUri, location);
    if (!resolved) {
        return stop(status::HttpDataError, "couldn't resolve redirect URI " + location);
    }

    ++st.redirectCount;
    st.requestUri = *resolved;
    if (code == 301 || code == 303) {
        st.newUri = *resolved;
    }
    return outcome::Retry{};
}

Outcome TransferExecutor::handleOtherStatus(const State& st, int code) const {
    int result;
    if (status::isError(code)) {
        result = code;
    } else if (code >= 300 && code < 400) {
        result = status::UnhandledRedirect;
    } else if (st.continuingDownload && code == 200) {
        result = status::CannotResume;
    } else {
        result = status::UnhandledHttpCode;
    }
    return stop(result, "http error " + std::to_string(code));
}

Outcome TransferExecutor::processResponseHeaders(State& st, const HttpResponseHead& head) {
    st.headerContentDisposition = head.header("Content-Disposition").value_or("");
    st.headerContentLocation = head.header("Content-Location").value_or("");
    if (st.mimeType.empty()) {
        if (auto contentType = head.header("Content-Type")) {
            st.mimeType = sanitizeMimeType(*contentType);
        }
    }
    if (auto etag = head.header("ETag")) {
        st.etag = *etag;
    }
    st.headerTransferEncoding = head.header("Transfer-Encoding").value_or("");
    if (st.headerTransferEncoding.empty()) {
        if (auto length = head.header("Content-Length")) {
            if (auto parsed = parseNumber<std::int64_t>(*length); parsed && *parsed >= 0) {
                st.headerContentLength = *parsed;
            }
        }
    } else {
        spdlog::debug("[Executor:{}] Ignoring Content-Length since Transfer-Encoding is set",
                      info_.id);
    }

    const bool noSizeInfo = st.headerContentLength < 0 &&
                            !iequals(trimView(st.headerTransferEncoding), "chunked");
    if (!info_.noIntegrity && noSizeInfo) {
        return stop(status::HttpDataError, "can't know size of download, giving up");
    }

    SaveFileRequest request;
    request.url = info_.uri;
    request.hint = info_.hint;
    request.contentDisposition = st.headerContentDisposition;
    request.contentLocation = st.headerContentLocation;
    request.mimeType = st.mimeType;
    request.destination = info_.destination;
    request.mode = info_.mode;
    request.contentLength = st.headerContentLength;

    auto path = generateSaveFile(request, roots_);
    if (!path) {
        return stop(statusForSaveError(path.error().code), path.error().message);
    }
    st.filename = path.value().string();

    if (auto r = file_.open(path.value(), DestinationFile::Mode::Truncate,
                            isExternallyVisible(info_.destination));
        !r) {
        // Drop the empty file that reserved the name.
        std::error_code ec;
        fs::remove(path.value(), ec);
        st.filename.clear();
        return stop(status::FileError, "while opening destination file: " + r.error().message);
    }

    info_.totalBytes = st.headerContentLength;

    RecordUpdate update;
    update.filename = st.filename;
    update.etag = st.etag;
    update.mimeType = st.mimeType;
    update.totalBytes = info_.totalBytes;
    if (auto r = deps_.store.update(info_.id, update); !r) {
        spdlog::warn("[Executor:{}] Failed to persist response headers: {}", info_.id,
                     r.error().message);
    }

    // The size may only now rule out the current network.
    return checkConnectivity();
}

Outcome TransferExecutor::writeChunk(State& st, ByteSpan data) {
    const auto n = static_cast<std::int64_t>(data.size());
    if (st.headerContentLength >= 0 && st.bytesSoFar + n > st.headerContentLength) {
        return stop(status::HttpDataError, "received more data than the declared length");
    }

    if (auto r = file_.write(data); !r) {
        std::error_code ec;
        if (info_.destination == Destination::External &&
            !fs::is_directory(roots_.externalDir, ec)) {
            return stop(status::DeviceNotFound, "external media not mounted while writing");
        }
        auto avail = availableBytes(fs::path(st.filename).parent_path());
        if (r.error().code == ErrorCode::StorageFull ||
            (avail && *avail < static_cast<std::uint64_t>(n))) {
            return stop(status::InsufficientSpace, "insufficient space while writing destination");
        }
        return stop(status::FileError, "while writing destination file: " + r.error().message);
    }

    st.bytesSoFar += n;
    st.gotData = true;
    return outcome::Success{};
}

void TransferExecutor::reportProgress(State& st) {
    const auto now = deps_.system.currentTimeMillis();
    if (st.bytesSoFar - st.bytesNotified > config_.minProgressStep &&
        now - st.timeLastNotification > config_.minProgressTimeMs) {
        checkpointBytes(st, false);
        st.timeLastNotification = now;
    }
}

void TransferExecutor::checkpointBytes(State& st, bool includeTotal) {
    RecordUpdate update;
    update.currentBytes = st.bytesSoFar;
    if (includeTotal) {
        update.totalBytes = st.bytesSoFar;
    }
    if (auto r = deps_.store.update(info_.id, update); !r) {
        spdlog::debug("[Executor:{}] Progress checkpoint failed: {}", info_.id,
                      r.error().message);
        return;
    }
    st.bytesNotified = st.bytesSoFar;
}

Outcome TransferExecutor::handleEndOfStream(State& st) {
    const bool lengthKnown = st.headerContentLength >= 0;
    checkpointBytes(st, !lengthKnown);
    if (!lengthKnown) {
        info_.totalBytes = st.bytesSoFar;
    }

    if (lengthKnown && st.bytesSoFar != st.headerContentLength) {
        if (cannotResume(st)) {
            return stop(status::CannotResume, "mismatched content length; unable to resume");
        }
        return stop(finalStatusForHttpError(st), "closed socket before end of file");
    }
    return outcome::Success{};
}

Outcome TransferExecutor::checkPausedOrCanceled() const {
    if (!probe_) {
        return outcome::Success{};
    }
    switch (probe_()) {
        case ControlSignal::Proceed:
            return outcome::Success{};
        case ControlSignal::Paused:
            return stop(status::PausedByApp, "download paused by owner");
        case ControlSignal::Canceled:
            return stop(status::Canceled, "download canceled");
        case ControlSignal::Shutdown:
            return stop(status::Running, "interrupted by shutdown");
    }
    return outcome::Success{};
}

int TransferExecutor::finalStatusForHttpError(State& st) const {
    if (checkCanUseNetwork(info_, deps_.system) != NetworkUsability::Ok) {
        return status::WaitingForNetwork;
    }
    if (info_.numFailed < config_.maxRetries) {
        st.countRetry = true;
        return status::WaitingToRetry;
    }
    spdlog::warn("[Executor:{}] Reached max retries ({})", info_.id, config_.maxRetries);
    return status::HttpDataError;
}

bool TransferExecutor::cannotResume(const State& st) const {
    return st.bytesSoFar > 0 && !info_.noIntegrity && st.etag.empty();
}

void TransferExecutor::finalizeDestination(const State& st) {
    file_.close();
    if (st.filename.empty()) {
        return;
    }
    const fs::path path{st.filename};
    if (auto r = makeWorldReadable(path); !r) {
        spdlog::warn("[Executor:{}] {}", info_.id, r.error().message);
    }
    if (auto r = fsyncFile(path); !r) {
        spdlog::warn("[Executor:{}] {}", info_.id, r.error().message);
    }
}

void TransferExecutor::cleanupDestination(State& st, int finalStatus) {
    file_.close();
    if (!status::isError(finalStatus) || st.filename.empty()) {
        return;
    }
    if (isExternallyVisible(info_.destination)) {
        return;
    }
    std::error_code ec;
    if (fs::remove(st.filename, ec)) {
        spdlog::debug("[Executor:{}] Deleted partial file {}", info_.id, st.filename);
    } else if (ec) {
        spdlog::warn("[Executor:{}] Could not delete {}: {}", info_.id, st.filename,
                     ec.message());
    }
    st.filename.clear();
}

void TransferExecutor::notifyCompleted(const State& st, int finalStatus) {
    RecordUpdate update;
    update.status = finalStatus;
    update.filename = st.filename;
    if (st.newUri) {
        update.uri = *st.newUri;
    }
    update.mimeType = st.mimeType;
    update.lastModified = deps_.system.currentTimeMillis();
    update.retryAfter = st.retryAfter;
    if (!st.countRetry) {
        update.numFailed = 0;
    } else if (st.gotData) {
        update.numFailed = 1;
    } else {
        update.numFailed = info_.numFailed + 1;
    }

    if (auto r = deps_.store.update(info_.id, update); !r) {
        if (r.error().code == ErrorCode::NotFound) {
            spdlog::debug("[Executor:{}] Record removed before final status was written",
                          info_.id);
        } else {
            spdlog::error("[Executor:{}] Failed to persist final status: {}", info_.id,
                          r.error().message);
        }
    }

    if (status::isCompleted(finalStatus)) {
        deps_.sink.downloadCompleted(makeCompletionEvent(info_, finalStatus));
    }
}

} // namespace fetchd::downloader
