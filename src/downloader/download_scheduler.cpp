#include <fetchd/downloader/download_scheduler.h>
#include <fetchd/downloader/notifications.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <set>
#include <system_error>

namespace fetchd::downloader {

namespace {

bool isWaitingForNetwork(const DownloadInfo& info) {
    return info.control == Control::Run && (info.status == status::WaitingForNetwork ||
                                            info.status == status::QueuedForWifi);
}

void deleteFileQuietly(DownloadId id, const std::string& filename) {
    if (filename.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::remove(filename, ec)) {
        spdlog::debug("[DownloadScheduler] Deleted {} for download {}", filename, id);
    } else if (ec) {
        spdlog::warn("[DownloadScheduler] Could not delete {}: {}", filename, ec.message());
    }
}

} // namespace

DownloadScheduler::DownloadScheduler(const DownloaderConfig& config, IDownloadStore& store,
                                     IHttpAdapter& http, ISystemFacade& system,
                                     ICompletionSink& sink)
    : config_(config), store_(store), http_(http), system_(system), sink_(sink),
      rng_(std::random_device{}()) {}

DownloadScheduler::~DownloadScheduler() {
    stop();
}

Result<void> DownloadScheduler::start() {
    {
        std::lock_guard<std::mutex> lock(updateMutex_);
        if (started_) {
            return Error{ErrorCode::InvalidState, "scheduler already started"};
        }
    }
    shuttingDown_ = false;

    sink_.cancelAllNotifications();

    if (auto trimmed = store_.trimCompleted(config_.maxRecords); !trimmed) {
        spdlog::warn("[DownloadScheduler] Trim failed: {}", trimmed.error().message);
    } else if (trimmed.value() > 0) {
        spdlog::info("[DownloadScheduler] Trimmed {} old completed downloads", trimmed.value());
    }

    removeSpuriousFiles();

    try {
        schedulerPool_ = std::make_unique<WorkCoordinator>();
        transferPool_ = std::make_unique<WorkCoordinator>();
        schedulerPool_->start(1);
        transferPool_->start(std::max<std::size_t>(1, config_.maxConcurrentTransfers));
        wakeTimer_ = std::make_unique<boost::asio::steady_timer>(*schedulerPool_->getIOContext());
    } catch (const std::exception& e) {
        wakeTimer_.reset();
        schedulerPool_.reset();
        transferPool_.reset();
        return Error{ErrorCode::Unknown, std::string("failed to start worker pools: ") + e.what()};
    }

    store_.setChangeListener([this] { requestUpdate(); });

    {
        std::lock_guard<std::mutex> lock(updateMutex_);
        started_ = true;
        pendingUpdate_ = true;
        postUpdateLocked();
    }
    spdlog::info("[DownloadScheduler] Started with {} transfer slots",
                 transferPool_->getWorkerCount());
    return {};
}

void DownloadScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(updateMutex_);
        if (!started_) {
            return;
        }
        started_ = false;
        shuttingDown_ = true;
    }
    store_.setChangeListener({});
    spdlog::info("[DownloadScheduler] Stopping with {} active transfers", activeTransfers());

    // The pass worker finishes its current pass; queued passes and the wake are dropped.
    schedulerPool_->stop();
    schedulerPool_->join();
    wakeTimer_.reset();

    // Running transfers see Shutdown at their next chunk; queued ones never start.
    transferPool_->stop();
    transferPool_->join();

    schedulerPool_.reset();
    transferPool_.reset();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(updateMutex_);
        pendingUpdate_ = false;
        updateInFlight_ = false;
        retryWakePending_ = false;
        activeCount_ = 0;
    }
    idleCv_.notify_all();
    spdlog::info("[DownloadScheduler] Stopped");
}

bool DownloadScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(updateMutex_);
    return started_;
}

void DownloadScheduler::requestUpdate() {
    std::lock_guard<std::mutex> lock(updateMutex_);
    if (!started_) {
        return;
    }
    pendingUpdate_ = true;
    postUpdateLocked();
}

void DownloadScheduler::onConnectivityChanged() {
    spdlog::debug("[DownloadScheduler] Connectivity changed to {}",
                  toString(system_.activeNetworkType()));
    requestUpdate();
}

void DownloadScheduler::postUpdateLocked() {
    if (updateInFlight_) {
        return;
    }
    updateInFlight_ = true;
    schedulerPool_->post([this] { runPasses(); });
}

void DownloadScheduler::runPasses() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(updateMutex_);
            if (!pendingUpdate_ || !started_) {
                updateInFlight_ = false;
                break;
            }
            pendingUpdate_ = false;
        }
        try {
            updateOnce();
        } catch (const std::exception& e) {
            spdlog::error("[DownloadScheduler] Update pass failed: {}", e.what());
        }
    }
    idleCv_.notify_all();
}

void DownloadScheduler::updateOnce() {
    const Millis now = system_.currentTimeMillis();
    Millis nextRetry = std::numeric_limits<Millis>::max();
    bool waitingForNetwork = false;
    std::vector<Teardown> teardowns;
    std::vector<DownloadInfo> visible;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto rows = store_.queryAll();
        if (!rows) {
            spdlog::error("[DownloadScheduler] Failed to query downloads: {}",
                          rows.error().message);
            return;
        }

        std::set<DownloadId> seen;
        for (const auto& row : rows.value()) {
            seen.insert(row.id);

            if (row.deleted) {
                purgeDeleted(row);
                continue;
            }

            std::shared_ptr<DownloadRecord> record;
            if (auto it = records_.find(row.id); it != records_.end()) {
                record = it->second;
                const auto oldStatus = record->info().status;
                const auto oldVisibility = record->info().visibility;
                record->mergeFrom(row);

                const bool lostCompletedVisibility =
                    oldVisibility == Visibility::VisibleNotifyCompleted &&
                    row.visibility != Visibility::VisibleNotifyCompleted &&
                    status::isCompleted(row.status);
                const bool newlyCompleted =
                    !status::isCompleted(oldStatus) && status::isCompleted(row.status);
                if (lostCompletedVisibility || newlyCompleted) {
                    sink_.cancelNotification(row.id);
                }
            } else {
                std::uniform_int_distribution<int> fuzz(0, 1000);
                record = std::make_shared<DownloadRecord>(row, fuzz(rng_),
                                                          config_.retryFirstDelaySec);
                records_.emplace(row.id, record);
                spdlog::debug("[DownloadScheduler] Tracking download {} ({})", row.id,
                              status::toString(row.status));
            }

            startIfReady(record, now);

            const auto next = record->nextAction(now);
            if (next > 0) {
                nextRetry = std::min(nextRetry, next);
            } else if (next == 0 && !record->hasActiveThread() &&
                       isWaitingForNetwork(record->info())) {
                waitingForNetwork = true;
            }
            visible.push_back(record->info());
        }

        for (auto it = records_.begin(); it != records_.end();) {
            if (seen.count(it->first)) {
                ++it;
                continue;
            }
            auto& info = it->second->info();
            const bool active = it->second->hasActiveThread();
            if (info.status == status::Running) {
                info.status = status::Canceled;
            }
            teardowns.push_back(Teardown{it->first, info.filename, info.destination, active});
            it = records_.erase(it);
        }
    }

    for (const auto& t : teardowns) {
        tearDown(t);
    }

    sink_.updateNotifications(collateNotifications(visible));
    scheduleWake(nextRetry == std::numeric_limits<Millis>::max() ? -1 : nextRetry,
                 waitingForNetwork);
}

void DownloadScheduler::startIfReady(const std::shared_ptr<DownloadRecord>& record, Millis now) {
    if (shuttingDown_ || !record->isReadyToStart(now, system_)) {
        return;
    }

    auto& info = record->info();
    if (info.status != status::Running) {
        RecordUpdate update;
        update.status = status::Running;
        if (auto r = store_.update(info.id, update); !r) {
            spdlog::warn("[DownloadScheduler] Could not mark download {} running: {}", info.id,
                         r.error().message);
            return;
        }
        info.status = status::Running;
    }

    record->setActiveThread(true);
    activeCount_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("[DownloadScheduler] Starting download {}", info.id);

    transferPool_->post(
        [this, record, snapshot = info]() mutable { runTransfer(record, std::move(snapshot)); });
}

void DownloadScheduler::runTransfer(std::shared_ptr<DownloadRecord> record, DownloadInfo snapshot) {
    const auto id = snapshot.id;
    try {
        TransferExecutor executor(std::move(snapshot), config_,
                                  ExecutorDependencies{store_, http_, system_, sink_},
                                  [this, record] { return controlSignalFor(*record); });
        executor.run();
    } catch (const std::exception& e) {
        spdlog::error("[DownloadScheduler] Transfer {} aborted: {}", id, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->setActiveThread(false);
    }

    {
        std::lock_guard<std::mutex> lock(updateMutex_);
        if (started_) {
            pendingUpdate_ = true;
            postUpdateLocked();
        }
        if (activeCount_ > 0) {
            activeCount_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idleCv_.notify_all();
}

ControlSignal DownloadScheduler::controlSignalFor(const DownloadRecord& record) const {
    if (shuttingDown_) {
        return ControlSignal::Shutdown;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& info = record.info();
    if (info.deleted || info.status == status::Canceled) {
        return ControlSignal::Canceled;
    }
    if (info.control == Control::Paused) {
        return ControlSignal::Paused;
    }
    return ControlSignal::Proceed;
}

void DownloadScheduler::purgeDeleted(const DownloadInfo& row) {
    bool active = false;
    if (auto it = records_.find(row.id); it != records_.end()) {
        auto& info = it->second->info();
        info.deleted = true;
        if (!status::isCompleted(info.status)) {
            info.status = status::Canceled;
        }
        active = it->second->hasActiveThread();
    }

    // An active executor removes its own partial file when it stops.
    if (!active && !isExternallyVisible(row.destination)) {
        deleteFileQuietly(row.id, row.filename);
    }

    if (auto r = store_.remove(row.id); !r && r.error().code != ErrorCode::NotFound) {
        spdlog::warn("[DownloadScheduler] Could not remove deleted download {}: {}", row.id,
                     r.error().message);
    } else {
        spdlog::info("[DownloadScheduler] Removed download {}", row.id);
    }
}

void DownloadScheduler::tearDown(const Teardown& t) {
    spdlog::debug("[DownloadScheduler] Dropping download {}", t.id);
    if (!t.active && !isExternallyVisible(t.destination)) {
        deleteFileQuietly(t.id, t.filename);
    }
    sink_.cancelNotification(t.id);
}

void DownloadScheduler::scheduleWake(Millis retryDelay, bool waitingForNetwork) {
    Millis delay = retryDelay;
    if (waitingForNetwork && config_.networkRecheckMs > 0) {
        delay = delay < 0 ? config_.networkRecheckMs : std::min(delay, config_.networkRecheckMs);
    }

    {
        std::lock_guard<std::mutex> lock(updateMutex_);
        retryWakePending_ = retryDelay > 0;
    }

    wakeTimer_->cancel();
    if (delay < 0) {
        return;
    }

    spdlog::debug("[DownloadScheduler] Next wake in {} ms", delay);
    wakeTimer_->expires_after(std::chrono::milliseconds(delay));
    wakeTimer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(updateMutex_);
            retryWakePending_ = false;
            if (started_) {
                pendingUpdate_ = true;
                postUpdateLocked();
            }
        }
        idleCv_.notify_all();
    });
}

void DownloadScheduler::removeSpuriousFiles() {
    std::error_code ec;
    if (config_.cacheDir.empty() || !fs::is_directory(config_.cacheDir, ec)) {
        return;
    }

    auto rows = store_.queryAll();
    if (!rows) {
        spdlog::warn("[DownloadScheduler] Skipping spurious file cleanup: {}",
                     rows.error().message);
        return;
    }

    std::set<fs::path> referenced;
    for (const auto& row : rows.value()) {
        if (!row.filename.empty()) {
            referenced.insert(fs::path(row.filename).lexically_normal());
        }
    }
    const auto dbName = config_.databasePath.filename().string();

    for (const auto& entry : fs::directory_iterator(config_.cacheDir, ec)) {
        std::error_code fileEc;
        if (!entry.is_regular_file(fileEc)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (!dbName.empty() && name.rfind(dbName, 0) == 0) {
            continue;
        }
        if (referenced.count(entry.path().lexically_normal())) {
            continue;
        }
        spdlog::info("[DownloadScheduler] Deleting spurious file {}", entry.path().string());
        fs::remove(entry.path(), fileEc);
        if (fileEc) {
            spdlog::warn("[DownloadScheduler] Could not delete {}: {}", entry.path().string(),
                         fileEc.message());
        }
    }
}

bool DownloadScheduler::isIdleLocked() const {
    return !pendingUpdate_ && !updateInFlight_ && !retryWakePending_ &&
           activeCount_.load(std::memory_order_relaxed) == 0;
}

bool DownloadScheduler::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(updateMutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return isIdleLocked(); });
}

std::vector<DownloadInfo> DownloadScheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadInfo> out;
    out.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        out.push_back(record->info());
    }
    return out;
}

} // namespace fetchd::downloader
