#include <fetchd/downloader/status.h>

#include <fmt/format.h>

namespace fetchd::downloader {

namespace status {

std::string toString(int s) {
    switch (s) {
        case Unknown:
            return "unknown";
        case Pending:
            return "pending";
        case Running:
            return "running";
        case PausedByApp:
            return "paused";
        case WaitingToRetry:
            return "waiting-to-retry";
        case WaitingForNetwork:
            return "waiting-for-network";
        case QueuedForWifi:
            return "queued-for-wifi";
        case Success:
            return "success";
        case NotAcceptable:
            return "not-acceptable";
        case FileAlreadyExists:
            return "file-already-exists";
        case CannotResume:
            return "cannot-resume";
        case Canceled:
            return "canceled";
        case UnknownError:
            return "unknown-error";
        case FileError:
            return "file-error";
        case UnhandledRedirect:
            return "unhandled-redirect";
        case UnhandledHttpCode:
            return "unhandled-http-code";
        case HttpDataError:
            return "http-data-error";
        case HttpException:
            return "http-exception";
        case TooManyRedirects:
            return "too-many-redirects";
        case InsufficientSpace:
            return "insufficient-space";
        case DeviceNotFound:
            return "device-not-found";
        default:
            break;
    }
    if (isError(s)) {
        return fmt::format("http-{}", s);
    }
    return fmt::format("status-{}", s);
}

} // namespace status

ErrorCategory userFacingCategory(int s) {
    if (!status::isError(s)) {
        return ErrorCategory::None;
    }
    switch (s) {
        case status::FileAlreadyExists:
            return ErrorCategory::AlreadyExists;
        case status::InsufficientSpace:
            return ErrorCategory::InsufficientSpace;
        case status::DeviceNotFound:
            return ErrorCategory::DeviceMissing;
        case status::CannotResume:
            return ErrorCategory::CannotResume;
        default:
            return ErrorCategory::Generic;
    }
}

const char* categoryMessage(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None:
            return "";
        case ErrorCategory::AlreadyExists:
            return "The file already exists";
        case ErrorCategory::InsufficientSpace:
            return "Not enough storage space";
        case ErrorCategory::DeviceMissing:
            return "The storage device is not available";
        case ErrorCategory::CannotResume:
            return "The download cannot be resumed";
        case ErrorCategory::Generic:
            return "The download failed";
    }
    return "The download failed";
}

} // namespace fetchd::downloader
