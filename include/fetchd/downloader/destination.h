#pragma once

#include <fetchd/downloader/downloader.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fetchd::downloader {

namespace fs = std::filesystem;

struct StorageRoots {
    fs::path cacheDir;
    fs::path externalDir;
};

// Inputs known once the response head of a fresh transfer has been read.
struct SaveFileRequest {
    std::string url;
    std::string hint;
    std::string contentDisposition;
    std::string contentLocation;
    std::string mimeType;
    Destination destination{Destination::Cache};
    RequestMode mode{RequestMode::Legacy};
    std::int64_t contentLength{-1};
};

/**
 * @brief Pick and validate the on-disk path for a fresh download.
 *
 * Errors: FileAlreadyExists (FileUri hint taken), StorageFull (not enough free space for the
 * declared length), DeviceNotFound (external root missing), NotAcceptable (Legacy External
 * request without a MIME type), IoError (no unused name could be found).
 */
Result<fs::path> generateSaveFile(const SaveFileRequest& request, const StorageRoots& roots);

// Base filename (no directory) with disallowed characters replaced.
std::string chooseFilename(std::string_view url, std::string_view hint,
                           std::string_view contentDisposition,
                           std::string_view contentLocation);

// `attachment; filename="..."` value, if present.
std::optional<std::string> parseContentDisposition(std::string_view header);

// Trim, lowercase and drop parameters: "Text/HTML; charset=utf-8" -> "text/html".
std::string sanitizeMimeType(std::string_view mime);

std::optional<std::string> extensionForMimeType(std::string_view mime);
std::optional<std::string> mimeTypeForExtension(std::string_view extension);

// A partial file may only be resumed if it sits where this engine would have put it.
bool isFilenameValid(const fs::path& file, const DownloadInfo& info, const StorageRoots& roots);

} // namespace fetchd::downloader
