#include <fetchd/storage/download_store.h>

#include <algorithm>
#include <map>
#include <mutex>

namespace fetchd::storage {

using downloader::ChangeListener;
using downloader::DownloadInfo;
using downloader::RecordUpdate;

namespace {

class InMemoryDownloadStore final : public IDownloadStore {
public:
    Result<DownloadId> insert(const DownloadInfo& info) override {
        DownloadId id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = nextId_++;
            auto row = info;
            row.id = id;
            rows_.emplace(id, std::move(row));
        }
        notifyChanged();
        return id;
    }

    Result<std::optional<DownloadInfo>> query(DownloadId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rows_.find(id);
        if (it == rows_.end()) {
            return std::optional<DownloadInfo>{};
        }
        return std::optional<DownloadInfo>{it->second};
    }

    Result<std::vector<DownloadInfo>> queryAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DownloadInfo> out;
        out.reserve(rows_.size());
        for (const auto& [id, row] : rows_) {
            out.push_back(row);
        }
        return out;
    }

    Result<std::vector<DownloadInfo>> queryByOwner(const std::string& owner) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DownloadInfo> out;
        for (const auto& [id, row] : rows_) {
            if (row.owner == owner) {
                out.push_back(row);
            }
        }
        return out;
    }

    Result<void> update(DownloadId id, const RecordUpdate& update) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = rows_.find(id);
            if (it == rows_.end()) {
                return Error{ErrorCode::NotFound, "no download with id " + std::to_string(id)};
            }
            update.applyTo(it->second);
        }
        notifyChanged();
        return {};
    }

    Result<void> remove(DownloadId id) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (rows_.erase(id) == 0) {
                return Error{ErrorCode::NotFound, "no download with id " + std::to_string(id)};
            }
        }
        notifyChanged();
        return {};
    }

    Result<std::size_t> trimCompleted(std::size_t maxRecords) override {
        std::size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<const DownloadInfo*> completed;
            for (const auto& [id, row] : rows_) {
                if (downloader::status::isCompleted(row.status)) {
                    completed.push_back(&row);
                }
            }
            if (completed.size() <= maxRecords) {
                return std::size_t{0};
            }
            std::sort(completed.begin(), completed.end(),
                      [](const DownloadInfo* a, const DownloadInfo* b) {
                          return a->lastModified < b->lastModified;
                      });
            std::vector<DownloadId> victims;
            for (std::size_t i = 0; i < completed.size() - maxRecords; ++i) {
                victims.push_back(completed[i]->id);
            }
            for (auto id : victims) {
                removed += rows_.erase(id);
            }
        }
        notifyChanged();
        return removed;
    }

    void setChangeListener(ChangeListener listener) override {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener_ = std::move(listener);
    }

private:
    void notifyChanged() {
        ChangeListener listener;
        {
            std::lock_guard<std::mutex> lock(listenerMutex_);
            listener = listener_;
        }
        if (listener) {
            listener();
        }
    }

    std::mutex mutex_;
    std::map<DownloadId, DownloadInfo> rows_;
    DownloadId nextId_{1};

    std::mutex listenerMutex_;
    ChangeListener listener_;
};

} // namespace

std::unique_ptr<IDownloadStore> makeInMemoryDownloadStore() {
    return std::make_unique<InMemoryDownloadStore>();
}

} // namespace fetchd::storage
