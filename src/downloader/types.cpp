#include <fetchd/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>

namespace fetchd::downloader {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

const char* toString(NetworkUsability usability) {
    switch (usability) {
        case NetworkUsability::Ok:
            return "ok";
        case NetworkUsability::NoConnection:
            return "no network connection available";
        case NetworkUsability::UnusableDueToSize:
            return "download size exceeds limit for mobile network";
        case NetworkUsability::RecommendedUnusableDueToSize:
            return "download size exceeds recommended limit for mobile network";
        case NetworkUsability::CannotUseRoaming:
            return "download cannot use the current network connection because it is roaming";
        case NetworkUsability::TypeDisallowedByRequestor:
            return "download was requested to not use the current network type";
    }
    return "unknown";
}

const char* toString(NetworkType type) {
    switch (type) {
        case NetworkType::None:
            return "none";
        case NetworkType::Mobile:
            return "mobile";
        case NetworkType::Wifi:
            return "wifi";
        case NetworkType::Ethernet:
            return "ethernet";
    }
    return "none";
}

void RecordUpdate::applyTo(DownloadInfo& info) const {
    if (status)
        info.status = *status;
    if (control)
        info.control = *control;
    if (numFailed)
        info.numFailed = *numFailed;
    if (retryAfter)
        info.retryAfter = *retryAfter;
    if (lastModified)
        info.lastModified = *lastModified;
    if (uri)
        info.uri = *uri;
    if (filename)
        info.filename = *filename;
    if (mimeType)
        info.mimeType = *mimeType;
    if (etag)
        info.etag = *etag;
    if (totalBytes)
        info.totalBytes = *totalBytes;
    if (currentBytes)
        info.currentBytes = *currentBytes;
    if (bypassRecommendedSizeLimit)
        info.bypassRecommendedSizeLimit = *bypassRecommendedSizeLimit;
    if (deleted)
        info.deleted = *deleted;
}

std::optional<std::string> HttpResponseHead::header(std::string_view name) const {
    for (const auto& h : headers) {
        if (iequals(h.name, name)) {
            return h.value;
        }
    }
    return std::nullopt;
}

} // namespace fetchd::downloader
