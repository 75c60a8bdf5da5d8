#pragma once

/*
 * fetchd Downloader - public types and collaborator interfaces
 *
 * Scope
 * - Persisted download fields (DownloadInfo) and partial updates (RecordUpdate)
 * - Policy enums: request mode, destination kind, visibility, control flag, network type
 * - Engine configuration (DownloaderConfig)
 * - Collaborators, all injectable:
 *     ISystemFacade   - clock, connectivity, roaming and mobile size ceilings
 *     IHttpAdapter    - single GET exchange, head then streamed body
 *     IDownloadStore  - durable records with change notification
 *     ICompletionSink - terminal outcomes and user-visible notifications
 *
 * Threading
 * - Adapters and stores must be safe to call from several transfer threads at once.
 * - The store invokes its change listener outside of its own locks.
 */

#include <fetchd/core/types.h>
#include <fetchd/downloader/status.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fetchd::downloader {

namespace fs = std::filesystem;

struct Header {
    std::string name;
    std::string value;
};

// Legacy callers get lenient network policy and class-targeted completion signals; Public
// callers get strict roaming/type/size policy and identity-addressed signals.
enum class RequestMode { Legacy = 0, Public = 1 };

enum class Visibility { Visible = 0, VisibleNotifyCompleted = 1, Hidden = 2 };

// External and FileUri destinations are visible to the user; Cache is engine-internal.
enum class Destination { External = 0, Cache = 1, FileUri = 4 };

enum class Control { Run = 0, Paused = 1 };

enum class NetworkType { None, Mobile, Wifi, Ethernet };

namespace network_flags {
inline constexpr int Mobile = 1 << 0;
inline constexpr int Wifi = 1 << 1;
inline constexpr int All = ~0;
} // namespace network_flags

enum class NetworkUsability {
    Ok,
    NoConnection,
    UnusableDueToSize,
    RecommendedUnusableDueToSize,
    CannotUseRoaming,
    TypeDisallowedByRequestor
};

const char* toString(NetworkUsability usability);
const char* toString(NetworkType type);

/**
 * Durable fields of one download, as stored in and read from the store.
 */
struct DownloadInfo {
    DownloadId id{0};

    // Request
    std::string uri;
    std::string hint;
    std::string mimeType;
    Destination destination{Destination::Cache};
    std::vector<Header> requestHeaders;
    std::string cookies;
    std::string userAgent;
    std::string referer;
    RequestMode mode{RequestMode::Legacy};
    bool noIntegrity{false};

    // Owner and presentation
    std::string owner;
    std::string notificationClass;
    std::string extras;
    std::string title;
    std::string description;
    Visibility visibility{Visibility::Visible};

    // Progress
    std::string filename;
    std::int64_t totalBytes{-1};
    std::int64_t currentBytes{0};
    std::string etag;

    // Policy
    int allowedNetworkTypes{network_flags::All};
    bool allowRoaming{true};
    bool bypassRecommendedSizeLimit{false};

    // Lifecycle
    int status{status::Pending};
    Control control{Control::Run};
    int numFailed{0};
    Millis retryAfter{0};
    Millis lastModified{0};
    bool deleted{false};
};

/**
 * Partial update; unset members are left untouched by the store.
 */
struct RecordUpdate {
    std::optional<int> status;
    std::optional<Control> control;
    std::optional<int> numFailed;
    std::optional<Millis> retryAfter;
    std::optional<Millis> lastModified;
    std::optional<std::string> uri;
    std::optional<std::string> filename;
    std::optional<std::string> mimeType;
    std::optional<std::string> etag;
    std::optional<std::int64_t> totalBytes;
    std::optional<std::int64_t> currentBytes;
    std::optional<bool> bypassRecommendedSizeLimit;
    std::optional<bool> deleted;

    void applyTo(DownloadInfo& info) const;
};

struct TransportConfig {
    std::chrono::milliseconds connectTimeout{20000};
    std::chrono::milliseconds ioTimeout{20000};
    bool insecure{false};
    std::string caPath;
    std::optional<std::string> proxy;
    std::size_t bufferSize{4096};
};

struct NetworkLimits {
    std::optional<std::int64_t> maxBytesOverMobile;
    std::optional<std::int64_t> recommendedMaxBytesOverMobile;
};

struct DownloaderConfig {
    fs::path cacheDir;
    fs::path externalDir;
    fs::path databasePath;

    std::size_t maxConcurrentTransfers{4};
    std::size_t maxRecords{1000};
    std::string userAgent{"fetchd/1.0"};

    std::int64_t minProgressStep{4096};
    Millis minProgressTimeMs{1500};

    int maxRetries{5};
    int maxRedirects{5};
    int retryFirstDelaySec{30};
    int minRetryAfterSec{30};
    int maxRetryAfterSec{24 * 60 * 60};

    // Re-check interval while records wait for connectivity; 0 disables polling.
    Millis networkRecheckMs{30000};

    TransportConfig transport;
    NetworkLimits limits;
};

// ---------------------------------------------------------------------------
// Network/Policy oracle
// ---------------------------------------------------------------------------

class ISystemFacade {
public:
    virtual ~ISystemFacade() = default;

    virtual Millis currentTimeMillis() const = 0;
    virtual NetworkType activeNetworkType() const = 0;
    virtual bool isNetworkRoaming() const = 0;
    virtual std::optional<std::int64_t> maxBytesOverMobile() const = 0;
    virtual std::optional<std::int64_t> recommendedMaxBytesOverMobile() const = 0;
};

// ---------------------------------------------------------------------------
// HTTP transport
// ---------------------------------------------------------------------------

struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
};

struct HttpResponseHead {
    int statusCode{0};
    std::vector<Header> headers;

    // Case-insensitive; first match wins
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

// Return false from either callback to stop the exchange.
using HeadHandler = std::function<bool(const HttpResponseHead&)>;
using BodySink = std::function<bool(ByteSpan)>;

class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Perform one GET without following redirects. onHead runs once the final response head
     * is known; onBody receives the body in buffer-sized pieces.
     *
     * Errors: NetworkError, Timeout, TlsVerificationFailed, InvalidArgument (malformed URL),
     * OperationCancelled when a callback stopped the exchange.
     */
    virtual Result<void> execute(const HttpRequest& request, const HeadHandler& onHead,
                                 const BodySink& onBody) = 0;
};

// ---------------------------------------------------------------------------
// Persistent store
// ---------------------------------------------------------------------------

using ChangeListener = std::function<void()>;

class IDownloadStore {
public:
    virtual ~IDownloadStore() = default;

    // Assigns and returns a new id; the id in `info` is ignored.
    virtual Result<DownloadId> insert(const DownloadInfo& info) = 0;
    virtual Result<std::optional<DownloadInfo>> query(DownloadId id) = 0;
    virtual Result<std::vector<DownloadInfo>> queryAll() = 0;
    virtual Result<std::vector<DownloadInfo>> queryByOwner(const std::string& owner) = 0;
    // NotFound when the id does not exist
    virtual Result<void> update(DownloadId id, const RecordUpdate& update) = 0;
    virtual Result<void> remove(DownloadId id) = 0;
    // Deletes the oldest completed records beyond maxRecords; returns the number removed.
    virtual Result<std::size_t> trimCompleted(std::size_t maxRecords) = 0;

    virtual void setChangeListener(ChangeListener listener) = 0;
};

// ---------------------------------------------------------------------------
// Completion / notification sink
// ---------------------------------------------------------------------------

struct CompletionEvent {
    DownloadId id{0};
    int status{status::Unknown};
    Visibility visibility{Visibility::Visible};
    std::string owner;
    RequestMode mode{RequestMode::Legacy};
    // Legacy addressing only
    std::string notificationClass;
    std::string contentLocator;
    std::string extras;
};

struct NotificationItem {
    enum class Kind { Active, Completed };

    Kind kind{Kind::Active};
    std::string owner;
    std::vector<DownloadId> ids;
    std::vector<std::string> titles;
    std::int64_t currentBytes{0};
    std::int64_t totalBytes{0};
    int status{status::Unknown};
    bool paused{false};
};

class ICompletionSink {
public:
    virtual ~ICompletionSink() = default;

    virtual void downloadCompleted(const CompletionEvent& event) = 0;
    virtual void cancelNotification(DownloadId id) = 0;
    virtual void cancelAllNotifications() = 0;
    virtual void pausedForSize(DownloadId id, bool isWifiRequired) = 0;
    virtual void updateNotifications(const std::vector<NotificationItem>& items) = 0;
};

using CompletionCallback = std::function<void(const CompletionEvent&)>;

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(TransportConfig config);
std::unique_ptr<ISystemFacade> makeLinuxSystemFacade(NetworkLimits limits,
                                                     fs::path netClassRoot = "/sys/class/net");
std::unique_ptr<ICompletionSink> makeLoggingCompletionSink(CompletionCallback onCompleted = {});

} // namespace fetchd::downloader
