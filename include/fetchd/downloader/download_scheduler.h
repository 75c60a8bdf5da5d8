#pragma once

#include <fetchd/core/work_coordinator.h>
#include <fetchd/downloader/download_record.h>
#include <fetchd/downloader/downloader.hpp>
#include <fetchd/downloader/transfer_executor.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

#include <boost/asio/steady_timer.hpp>

namespace fetchd::downloader {

/**
 * @brief Keeps the in-memory registry in step with the store and starts eligible transfers.
 *
 * Every store change requests a resynchronization pass. Passes run one at a time on a
 * dedicated worker; requests arriving while a pass is in flight collapse into a single
 * follow-up pass. Transfers run on a separate pool bounded by max_concurrent_transfers.
 *
 * Locking
 * - mutex_ guards the registry and every DownloadRecord in it. A pass holds it for its whole
 *   duration; executors take it only to read their control state and to clear the active flag.
 * - updateMutex_ guards pass bookkeeping and idle tracking. requestUpdate() takes only this
 *   lock, so store listeners may fire while mutex_ is held.
 */
class DownloadScheduler {
public:
    DownloadScheduler(const DownloaderConfig& config, IDownloadStore& store, IHttpAdapter& http,
                      ISystemFacade& system, ICompletionSink& sink);
    ~DownloadScheduler();

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    /**
     * @brief Install the store listener, run startup housekeeping and the first pass.
     *
     * Housekeeping: cancel all notifications, trim completed records to max_records and
     * delete cache files no record references.
     */
    Result<void> start();

    // Cancels the wake timer, interrupts running transfers at their next chunk and joins.
    void stop();

    void requestUpdate();

    // Connectivity may have made waiting records eligible.
    void onConnectivityChanged();

    /**
     * @brief Block until no pass is pending, no transfer is active and no retry wake is armed.
     *
     * Records waiting for connectivity do not keep the scheduler busy.
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] std::vector<DownloadInfo> snapshot() const;
    [[nodiscard]] std::size_t activeTransfers() const noexcept {
        return activeCount_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] bool isRunning() const;

private:
    struct Teardown {
        DownloadId id;
        std::string filename;
        Destination destination;
        bool active;
    };

    void postUpdateLocked();
    void runPasses();
    void updateOnce();
    void startIfReady(const std::shared_ptr<DownloadRecord>& record, Millis now);
    void purgeDeleted(const DownloadInfo& row);
    void runTransfer(std::shared_ptr<DownloadRecord> record, DownloadInfo snapshot);
    ControlSignal controlSignalFor(const DownloadRecord& record) const;
    void tearDown(const Teardown& t);
    void scheduleWake(Millis retryDelay, bool waitingForNetwork);
    void removeSpuriousFiles();
    bool isIdleLocked() const;

    const DownloaderConfig& config_;
    IDownloadStore& store_;
    IHttpAdapter& http_;
    ISystemFacade& system_;
    ICompletionSink& sink_;

    mutable std::mutex mutex_;
    std::map<DownloadId, std::shared_ptr<DownloadRecord>> records_;
    std::mt19937 rng_;

    mutable std::mutex updateMutex_;
    std::condition_variable idleCv_;
    bool started_{false};
    bool pendingUpdate_{false};
    bool updateInFlight_{false};
    bool retryWakePending_{false};

    std::atomic<std::size_t> activeCount_{0};
    std::atomic<bool> shuttingDown_{false};

    std::unique_ptr<WorkCoordinator> schedulerPool_;
    std::unique_ptr<WorkCoordinator> transferPool_;
    std::unique_ptr<boost::asio::steady_timer> wakeTimer_;
};

} // namespace fetchd::downloader
