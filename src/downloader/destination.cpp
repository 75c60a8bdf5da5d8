#include <fetchd/downloader/destination.h>
#include <fetchd/downloader/disk_writer.h>
#include <fetchd/downloader/url_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <random>
#include <regex>
#include <system_error>
#include <unordered_map>

namespace fetchd::downloader {

namespace {

constexpr const char* kDefaultFilename = "downloadfile";
constexpr const char* kDefaultExtension = ".bin";
constexpr const char* kSequenceSeparator = "-";

const std::unordered_map<std::string, std::string> MIME_EXTENSION_MAP = {
    {"text/html", ".html"},
    {"text/plain", ".txt"},
    {"text/css", ".css"},
    {"text/csv", ".csv"},
    {"text/markdown", ".md"},
    {"application/json", ".json"},
    {"application/xml", ".xml"},
    {"application/javascript", ".js"},
    {"application/pdf", ".pdf"},
    {"application/zip", ".zip"},
    {"application/gzip", ".gz"},
    {"application/x-tar", ".tar"},
    {"application/x-7z-compressed", ".7z"},
    {"application/vnd.android.package-archive", ".apk"},
    {"application/msword", ".doc"},
    {"image/jpeg", ".jpg"},
    {"image/png", ".png"},
    {"image/gif", ".gif"},
    {"image/webp", ".webp"},
    {"image/svg+xml", ".svg"},
    {"audio/mpeg", ".mp3"},
    {"audio/ogg", ".ogg"},
    {"video/mp4", ".mp4"},
    {"video/webm", ".webm"},
};

// Extensions that map to a type but are not the canonical extension above
const std::unordered_map<std::string, std::string> EXTENSION_ALIAS_MAP = {
    {".htm", "text/html"},
    {".jpeg", "image/jpeg"},
    {".tgz", "application/gzip"},
};

std::string toLower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string replaceInvalidChars(std::string_view name) {
    static const std::regex invalid("[^a-zA-Z0-9\\.\\-_]+");
    return std::regex_replace(std::string{name}, invalid, "_");
}

// Keep only the last path component of a caller or server supplied name.
std::string baseName(std::string_view path) {
    auto slash = path.find_last_of('/');
    if (slash != std::string_view::npos) {
        path = path.substr(slash + 1);
    }
    return std::string{path};
}

std::string extensionFromMimeOrDefault(std::string_view mime, bool useDefaults) {
    if (auto ext = extensionForMimeType(mime)) {
        return *ext;
    }
    if (mime.rfind("text/", 0) == 0) {
        if (mime == "text/html") {
            return ".html";
        }
        return useDefaults ? ".txt" : "";
    }
    return useDefaults ? kDefaultExtension : "";
}

// Splits `filename` into base and extension, correcting the extension when the server
// declared a different known type.
std::pair<std::string, std::string> splitWithExtension(const std::string& filename,
                                                       std::string_view mime) {
    const auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return {filename, extensionFromMimeOrDefault(mime, true)};
    }

    std::string base = filename.substr(0, dot);
    std::string ext = filename.substr(dot);
    if (!mime.empty()) {
        auto typeFromExt = mimeTypeForExtension(ext);
        if (!typeFromExt || *typeFromExt != mime) {
            auto better = extensionFromMimeOrDefault(mime, false);
            if (!better.empty()) {
                return {base, better};
            }
        }
    }
    return {base, ext};
}

Result<fs::path> chooseUniqueFilename(const fs::path& dir, const std::string& base,
                                      const std::string& extension) {
    // Each candidate is created with O_EXCL so concurrent transfers never share a name.
    fs::path candidate = dir / (base + extension);
    auto created = createExclusive(candidate);
    if (!created) {
        return created.error();
    }
    if (created.value()) {
        return candidate;
    }

    thread_local std::mt19937 rng{std::random_device{}()};
    const std::string prefix = base + kSequenceSeparator;
    long long sequence = 1;
    for (long long magnitude = 1; magnitude < 1000000000LL; magnitude *= 10) {
        for (int iteration = 0; iteration < 9; ++iteration) {
            candidate = dir / (prefix + std::to_string(sequence) + extension);
            created = createExclusive(candidate);
            if (!created) {
                return created.error();
            }
            if (created.value()) {
                return candidate;
            }
            std::uniform_int_distribution<long long> step(1, magnitude);
            sequence += step(rng);
        }
    }
    return Error{ErrorCode::IoError, "failed to generate an unused filename in " + dir.string()};
}

bool isUnder(const fs::path& file, const fs::path& root) {
    if (root.empty()) {
        return false;
    }
    auto normFile = file.lexically_normal();
    auto normRoot = root.lexically_normal();
    auto rel = normFile.lexically_relative(normRoot);
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

std::optional<std::string> parseContentDisposition(std::string_view header) {
    static const std::regex pattern("attachment;\\s*filename\\s*=\\s*\"([^\"]*)\"",
                                    std::regex::icase);
    std::smatch m;
    std::string h{header};
    if (std::regex_search(h, m, pattern)) {
        return m[1].str();
    }
    return std::nullopt;
}

std::string sanitizeMimeType(std::string_view mime) {
    std::string out = toLower(mime);
    if (auto semi = out.find(';'); semi != std::string::npos) {
        out.erase(semi);
    }
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), notSpace));
    out.erase(std::find_if(out.rbegin(), out.rend(), notSpace).base(), out.end());
    return out;
}

std::optional<std::string> extensionForMimeType(std::string_view mime) {
    auto it = MIME_EXTENSION_MAP.find(toLower(mime));
    if (it == MIME_EXTENSION_MAP.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> mimeTypeForExtension(std::string_view extension) {
    std::string ext = toLower(extension);
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    if (auto alias = EXTENSION_ALIAS_MAP.find(ext); alias != EXTENSION_ALIAS_MAP.end()) {
        return alias->second;
    }
    for (const auto& [mime, e] : MIME_EXTENSION_MAP) {
        if (e == ext) {
            return mime;
        }
    }
    return std::nullopt;
}

std::string chooseFilename(std::string_view url, std::string_view hint,
                           std::string_view contentDisposition,
                           std::string_view contentLocation) {
    std::string filename;

    if (!hint.empty() && hint.back() != '/') {
        filename = baseName(hint);
    }

    if (filename.empty() && !contentDisposition.empty()) {
        if (auto parsed = parseContentDisposition(contentDisposition)) {
            filename = baseName(*parsed);
        }
    }

    if (filename.empty() && !contentLocation.empty()) {
        auto decoded = percentDecode(contentLocation);
        if (decoded.back() != '/' && decoded.find('?') == std::string::npos) {
            filename = baseName(decoded);
        }
    }

    if (filename.empty()) {
        filename = lastPathSegment(percentDecode(url));
    }

    if (filename.empty() || filename == "." || filename == "..") {
        filename = kDefaultFilename;
    }

    return replaceInvalidChars(filename);
}

Result<fs::path> generateSaveFile(const SaveFileRequest& request, const StorageRoots& roots) {
    if (request.mode == RequestMode::Legacy && request.destination == Destination::External &&
        request.mimeType.empty()) {
        return Error{ErrorCode::NotAcceptable, "external download with no mime type not allowed"};
    }

    std::error_code ec;

    if (request.destination == Destination::FileUri) {
        if (request.hint.empty()) {
            return Error{ErrorCode::InvalidArgument, "file destination requires a path hint"};
        }
        fs::path target{request.hint};
        if (fs::exists(target, ec)) {
            return Error{ErrorCode::FileAlreadyExists,
                         "requested destination file already exists: " + target.string()};
        }
        if (request.contentLength > 0) {
            auto avail = availableBytes(target.parent_path());
            if (avail && *avail < static_cast<std::uint64_t>(request.contentLength)) {
                return Error{ErrorCode::StorageFull, "insufficient space on destination volume"};
            }
        }
        auto created = createExclusive(target);
        if (!created) {
            return created.error();
        }
        if (!created.value()) {
            return Error{ErrorCode::FileAlreadyExists,
                         "requested destination file already exists: " + target.string()};
        }
        return target;
    }

    fs::path dir;
    if (request.destination == Destination::External) {
        if (roots.externalDir.empty() || !fs::is_directory(roots.externalDir, ec)) {
            return Error{ErrorCode::DeviceNotFound, "external storage directory not available: " +
                                                        roots.externalDir.string()};
        }
        dir = roots.externalDir;
    } else {
        fs::create_directories(roots.cacheDir, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "unable to create cache directory " +
                                                 roots.cacheDir.string() + ": " + ec.message()};
        }
        dir = roots.cacheDir;
    }

    if (request.contentLength > 0) {
        auto avail = availableBytes(dir);
        if (avail && *avail < static_cast<std::uint64_t>(request.contentLength)) {
            return Error{ErrorCode::StorageFull, "insufficient space in " + dir.string()};
        }
    }

    auto filename = chooseFilename(request.url, request.hint, request.contentDisposition,
                                   request.contentLocation);
    auto [base, extension] = splitWithExtension(filename, request.mimeType);
    auto chosen = chooseUniqueFilename(dir, base, extension);
    if (chosen) {
        spdlog::debug("Destination for {} -> {}", request.url, chosen.value().string());
    }
    return chosen;
}

bool isFilenameValid(const fs::path& file, const DownloadInfo& info, const StorageRoots& roots) {
    if (info.destination == Destination::FileUri) {
        return !info.hint.empty() && file.lexically_normal() == fs::path(info.hint).lexically_normal();
    }
    return isUnder(file, roots.cacheDir) || isUnder(file, roots.externalDir);
}

} // namespace fetchd::downloader
