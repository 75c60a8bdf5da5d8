#pragma once

#include <fetchd/downloader/destination.h>
#include <fetchd/downloader/disk_writer.h>
#include <fetchd/downloader/downloader.hpp>

#include <functional>
#include <optional>
#include <random>
#include <string>
#include <variant>

namespace fetchd::downloader {

// Result of one stage of the transfer pipeline.
namespace outcome {
struct Success {};
// Start a new attempt immediately (redirect)
struct Retry {};
// Leave the attempt loop with this status
struct Stop {
    int status;
    std::string message;
};
} // namespace outcome

using Outcome = std::variant<outcome::Success, outcome::Retry, outcome::Stop>;

// External control observed by a running transfer
enum class ControlSignal { Proceed, Paused, Canceled, Shutdown };
using ControlProbe = std::function<ControlSignal()>;

struct ExecutorDependencies {
    IDownloadStore& store;
    IHttpAdapter& http;
    ISystemFacade& system;
    ICompletionSink& sink;
};

/**
 * @brief Runs one download to a final status.
 *
 * Works on a snapshot of the record taken when the transfer was started; only the control
 * probe observes later changes. Progress and the final status are written to the store and
 * a completed status is pushed to the completion sink exactly once. Nothing thrown inside
 * escapes run().
 */
class TransferExecutor {
public:
    TransferExecutor(DownloadInfo snapshot, const DownloaderConfig& config,
                     ExecutorDependencies deps, ControlProbe probe);

    // Returns the status persisted for the record.
    int run();

private:
    // Per-run mutable state; reset partially on every redirect
    struct State {
        std::string filename;
        std::string mimeType;
        std::string etag;
        std::string requestUri;
        std::optional<std::string> newUri;
        std::int64_t bytesSoFar{0};
        std::int64_t bytesNotified{0};
        Millis timeLastNotification{0};
        std::int64_t headerContentLength{-1};
        std::string headerContentDisposition;
        std::string headerContentLocation;
        std::string headerTransferEncoding;
        bool continuingDownload{false};
        int redirectCount{0};
        bool countRetry{false};
        bool gotData{false};
        Millis retryAfter{0};
    };

    Outcome executeAttempt(State& st);
    Outcome setupDestinationFile(State& st);
    std::vector<Header> buildRequestHeaders(const State& st) const;
    Outcome checkConnectivity();
    Outcome handleResponseStatus(State& st, const HttpResponseHead& head);
    Outcome handleServiceUnavailable(State& st, const HttpResponseHead& head);
    Outcome handleRedirect(State& st, const HttpResponseHead& head, int code);
    Outcome handleOtherStatus(const State& st, int code) const;
    Outcome processResponseHeaders(State& st, const HttpResponseHead& head);
    Outcome writeChunk(State& st, ByteSpan data);
    Outcome handleEndOfStream(State& st);
    Outcome checkPausedOrCanceled() const;
    void reportProgress(State& st);
    void checkpointBytes(State& st, bool includeTotal);
    int finalStatusForHttpError(State& st) const;
    bool cannotResume(const State& st) const;
    void finalizeDestination(const State& st);
    void cleanupDestination(State& st, int finalStatus);
    void notifyCompleted(const State& st, int finalStatus);

    DownloadInfo info_;
    const DownloaderConfig& config_;
    ExecutorDependencies deps_;
    ControlProbe probe_;
    StorageRoots roots_;
    DestinationFile file_;
    std::mt19937 rng_;
};

} // namespace fetchd::downloader
