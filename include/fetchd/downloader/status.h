#pragma once

#include <string>

namespace fetchd::downloader {

/**
 * Download status codes.
 *
 * Values below 200 are in-flight states. 200-299 are successes; 400-599 are terminal errors,
 * including HTTP statuses returned verbatim by the server. Codes 488-499 are engine errors
 * that have no HTTP meaning.
 */
namespace status {

inline constexpr int Unknown = 0;

inline constexpr int Pending = 190;
inline constexpr int Running = 192;
inline constexpr int PausedByApp = 193;
inline constexpr int WaitingToRetry = 194;
inline constexpr int WaitingForNetwork = 195;
inline constexpr int QueuedForWifi = 196;

inline constexpr int Success = 200;

inline constexpr int BadRequest = 400;
inline constexpr int NotAcceptable = 406;
inline constexpr int LengthRequired = 411;
inline constexpr int PreconditionFailed = 412;

inline constexpr int FileAlreadyExists = 488;
inline constexpr int CannotResume = 489;
inline constexpr int Canceled = 490;
inline constexpr int UnknownError = 491;
inline constexpr int FileError = 492;
inline constexpr int UnhandledRedirect = 493;
inline constexpr int UnhandledHttpCode = 494;
inline constexpr int HttpDataError = 495;
inline constexpr int HttpException = 496;
inline constexpr int TooManyRedirects = 497;
inline constexpr int InsufficientSpace = 498;
inline constexpr int DeviceNotFound = 499;

inline constexpr bool isInformational(int s) {
    return s >= 100 && s < 200;
}
inline constexpr bool isSuccess(int s) {
    return s >= 200 && s < 300;
}
inline constexpr bool isError(int s) {
    return s >= 400 && s < 600;
}
inline constexpr bool isClientError(int s) {
    return s >= 400 && s < 500;
}
inline constexpr bool isServerError(int s) {
    return s >= 500 && s < 600;
}
// Terminal: no further transfer without an explicit restart
inline constexpr bool isCompleted(int s) {
    return isSuccess(s) || isError(s);
}

std::string toString(int s);

} // namespace status

// Presentation buckets for terminal errors
enum class ErrorCategory { None, AlreadyExists, InsufficientSpace, DeviceMissing, CannotResume, Generic };

ErrorCategory userFacingCategory(int status);
const char* categoryMessage(ErrorCategory category);

} // namespace fetchd::downloader
