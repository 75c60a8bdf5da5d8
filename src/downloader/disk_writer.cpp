/*
 * disk_writer.cpp
 *
 * Destination file handling for transfers:
 * - O_APPEND descriptor, optionally closed after each write for external destinations
 * - fsync of the finished file
 * - 0644 permissions on success
 * - free-space probe used to classify write failures
 * - O_EXCL creation that reserves a chosen filename
 */

#include <fetchd/downloader/disk_writer.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fetchd::downloader {

namespace {

Error errnoError(ErrorCode code, const std::string& what, const fs::path& p, int err) {
    return Error{code, what + " " + p.string() + ": " + std::strerror(err)};
}

ErrorCode codeForErrno(int err) {
    switch (err) {
        case ENOSPC:
        case EDQUOT:
            return ErrorCode::StorageFull;
        case ENOENT:
        case ENODEV:
        case ENXIO:
            return ErrorCode::DeviceNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        default:
            return ErrorCode::IoError;
    }
}

} // namespace

DestinationFile::~DestinationFile() {
    close();
}

Result<void> DestinationFile::open(const fs::path& path, Mode mode, bool reopenPerWrite) {
    close();
    path_ = path;
    reopenPerWrite_ = reopenPerWrite;
    return openDescriptor(mode == Mode::Truncate ? O_TRUNC : 0);
}

Result<void> DestinationFile::openDescriptor(int extraFlags) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC | extraFlags, 0600);
    if (fd_ < 0) {
        const int err = errno;
        return errnoError(codeForErrno(err), "open() failed for", path_, err);
    }
    return {};
}

Result<void> DestinationFile::write(ByteSpan data) {
    if (fd_ < 0) {
        if (path_.empty()) {
            return Error{ErrorCode::InvalidState, "destination file was never opened"};
        }
        if (auto r = openDescriptor(0); !r) {
            return r;
        }
    }

    const auto* ptr = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            return errnoError(codeForErrno(err), "write() failed for", path_, err);
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (reopenPerWrite_) {
        if (::fsync(fd_) != 0) {
            const int err = errno;
            close();
            return errnoError(codeForErrno(err), "fsync() failed for", path_, err);
        }
        close();
    }
    return {};
}

void DestinationFile::close() noexcept {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            spdlog::debug("close() failed for {}: {}", path_.string(), std::strerror(errno));
        }
        fd_ = -1;
    }
}

Result<bool> createExclusive(const fs::path& p) {
    const int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        const int err = errno;
        if (err == EEXIST) {
            return false;
        }
        return errnoError(codeForErrno(err), "could not create", p, err);
    }
    ::close(fd);
    return true;
}

Result<void> fsyncFile(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return errnoError(ErrorCode::IoError, "open() failed for fsync:", p, err);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return errnoError(ErrorCode::IoError, "fsync() failed for", p, err);
    }
    ::close(fd);
    return {};
}

Result<void> makeWorldReadable(const fs::path& p) {
    std::error_code ec;
    fs::permissions(p,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "chmod failed for " + p.string() + ": " + ec.message()};
    }
    return {};
}

std::optional<std::uint64_t> availableBytes(const fs::path& p) {
    std::error_code ec;
    fs::path probe = p;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        auto parent = probe.parent_path();
        if (parent == probe) {
            break;
        }
        probe = std::move(parent);
    }
    if (probe.empty()) {
        return std::nullopt;
    }
    auto info = fs::space(probe, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}

} // namespace fetchd::downloader
