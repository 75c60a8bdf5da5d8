#pragma once

#include <fetchd/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>

namespace fetchd::downloader {

namespace fs = std::filesystem;

/**
 * @brief Append handle for a download destination.
 *
 * With reopenPerWrite the descriptor is closed after every write so each chunk reaches the
 * filesystem before the next read; the next write reopens in append mode.
 */
class DestinationFile {
public:
    enum class Mode { Truncate, Append };

    DestinationFile() = default;
    ~DestinationFile();

    DestinationFile(const DestinationFile&) = delete;
    DestinationFile& operator=(const DestinationFile&) = delete;

    Result<void> open(const fs::path& path, Mode mode, bool reopenPerWrite = false);
    Result<void> write(ByteSpan data);
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    Result<void> openDescriptor(int extraFlags);

    int fd_{-1};
    fs::path path_;
    bool reopenPerWrite_{false};
};

// Creates an empty file only if nothing exists at `p`. False means the name is taken.
Result<bool> createExclusive(const fs::path& p);

Result<void> fsyncFile(const fs::path& p);

// Sets 0644 so other users can read a finished download.
Result<void> makeWorldReadable(const fs::path& p);

// Free bytes on the filesystem holding `p` (or its nearest existing parent).
std::optional<std::uint64_t> availableBytes(const fs::path& p);

} // namespace fetchd::downloader
