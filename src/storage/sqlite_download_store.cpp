/*
 * sqlite_download_store.cpp
 *
 * Notes
 * - One connection guarded by a mutex; every call is a short statement or a small
 *   transaction, so serializing them costs little next to network transfers.
 * - Custom request headers are kept as a JSON array of {"name","value"} objects.
 * - The change listener runs after the mutex is released.
 */

#include <fetchd/storage/database.h>
#include <fetchd/storage/download_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <mutex>
#include <system_error>
#include <variant>

namespace fetchd::storage {

using downloader::ChangeListener;
using downloader::DownloadInfo;
using downloader::Header;
using downloader::RecordUpdate;
using json = nlohmann::json;

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS downloads (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    uri TEXT NOT NULL,
    hint TEXT NOT NULL DEFAULT '',
    mime_type TEXT NOT NULL DEFAULT '',
    destination INTEGER NOT NULL DEFAULT 1,
    request_headers TEXT NOT NULL DEFAULT '[]',
    cookies TEXT NOT NULL DEFAULT '',
    user_agent TEXT NOT NULL DEFAULT '',
    referer TEXT NOT NULL DEFAULT '',
    mode INTEGER NOT NULL DEFAULT 0,
    no_integrity INTEGER NOT NULL DEFAULT 0,
    owner TEXT NOT NULL DEFAULT '',
    notification_class TEXT NOT NULL DEFAULT '',
    extras TEXT NOT NULL DEFAULT '',
    title TEXT NOT NULL DEFAULT '',
    description TEXT NOT NULL DEFAULT '',
    visibility INTEGER NOT NULL DEFAULT 0,
    filename TEXT NOT NULL DEFAULT '',
    total_bytes INTEGER NOT NULL DEFAULT -1,
    current_bytes INTEGER NOT NULL DEFAULT 0,
    etag TEXT NOT NULL DEFAULT '',
    allowed_network_types INTEGER NOT NULL DEFAULT -1,
    allow_roaming INTEGER NOT NULL DEFAULT 1,
    bypass_recommended_size_limit INTEGER NOT NULL DEFAULT 0,
    status INTEGER NOT NULL DEFAULT 190,
    control INTEGER NOT NULL DEFAULT 0,
    num_failed INTEGER NOT NULL DEFAULT 0,
    retry_after INTEGER NOT NULL DEFAULT 0,
    last_modified INTEGER NOT NULL DEFAULT 0,
    deleted INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_downloads_owner ON downloads(owner);
CREATE INDEX IF NOT EXISTS idx_downloads_status_modified ON downloads(status, last_modified);
)SQL";

constexpr const char* kSelectColumns =
    "SELECT id, uri, hint, mime_type, destination, request_headers, cookies, user_agent, "
    "referer, mode, no_integrity, owner, notification_class, extras, title, description, "
    "visibility, filename, total_bytes, current_bytes, etag, allowed_network_types, "
    "allow_roaming, bypass_recommended_size_limit, status, control, num_failed, retry_after, "
    "last_modified, deleted FROM downloads";

std::string headersToJson(const std::vector<Header>& headers) {
    json arr = json::array();
    for (const auto& h : headers) {
        arr.push_back({{"name", h.name}, {"value", h.value}});
    }
    return arr.dump();
}

std::vector<Header> headersFromJson(const std::string& text, DownloadId id) {
    std::vector<Header> headers;
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        spdlog::warn("[SqliteDownloadStore] Ignoring malformed headers for download {}", id);
        return headers;
    }
    for (const auto& item : parsed) {
        if (item.is_object()) {
            headers.push_back(
                Header{item.value("name", std::string{}), item.value("value", std::string{})});
        }
    }
    return headers;
}

DownloadInfo readRow(const Statement& stmt) {
    DownloadInfo info;
    int c = 0;
    info.id = stmt.getInt64(c++);
    info.uri = stmt.getString(c++);
    info.hint = stmt.getString(c++);
    info.mimeType = stmt.getString(c++);
    info.destination = static_cast<downloader::Destination>(stmt.getInt(c++));
    auto headersText = stmt.getString(c++);
    info.requestHeaders = headersFromJson(headersText, info.id);
    info.cookies = stmt.getString(c++);
    info.userAgent = stmt.getString(c++);
    info.referer = stmt.getString(c++);
    info.mode = static_cast<downloader::RequestMode>(stmt.getInt(c++));
    info.noIntegrity = stmt.getInt(c++) != 0;
    info.owner = stmt.getString(c++);
    info.notificationClass = stmt.getString(c++);
    info.extras = stmt.getString(c++);
    info.title = stmt.getString(c++);
    info.description = stmt.getString(c++);
    info.visibility = static_cast<downloader::Visibility>(stmt.getInt(c++));
    info.filename = stmt.getString(c++);
    info.totalBytes = stmt.getInt64(c++);
    info.currentBytes = stmt.getInt64(c++);
    info.etag = stmt.getString(c++);
    info.allowedNetworkTypes = stmt.getInt(c++);
    info.allowRoaming = stmt.getInt(c++) != 0;
    info.bypassRecommendedSizeLimit = stmt.getInt(c++) != 0;
    info.status = stmt.getInt(c++);
    info.control = static_cast<downloader::Control>(stmt.getInt(c++));
    info.numFailed = stmt.getInt(c++);
    info.retryAfter = stmt.getInt64(c++);
    info.lastModified = stmt.getInt64(c++);
    info.deleted = stmt.getInt(c++) != 0;
    return info;
}

// Column assignment for a partial update
using Value = std::variant<int64_t, std::string>;

std::vector<std::pair<const char*, Value>> assignments(const RecordUpdate& u) {
    std::vector<std::pair<const char*, Value>> out;
    if (u.status)
        out.emplace_back("status", static_cast<int64_t>(*u.status));
    if (u.control)
        out.emplace_back("control", static_cast<int64_t>(*u.control));
    if (u.numFailed)
        out.emplace_back("num_failed", static_cast<int64_t>(*u.numFailed));
    if (u.retryAfter)
        out.emplace_back("retry_after", static_cast<int64_t>(*u.retryAfter));
    if (u.lastModified)
        out.emplace_back("last_modified", static_cast<int64_t>(*u.lastModified));
    if (u.uri)
        out.emplace_back("uri", *u.uri);
    if (u.filename)
        out.emplace_back("filename", *u.filename);
    if (u.mimeType)
        out.emplace_back("mime_type", *u.mimeType);
    if (u.etag)
        out.emplace_back("etag", *u.etag);
    if (u.totalBytes)
        out.emplace_back("total_bytes", static_cast<int64_t>(*u.totalBytes));
    if (u.currentBytes)
        out.emplace_back("current_bytes", static_cast<int64_t>(*u.currentBytes));
    if (u.bypassRecommendedSizeLimit)
        out.emplace_back("bypass_recommended_size_limit",
                         static_cast<int64_t>(*u.bypassRecommendedSizeLimit ? 1 : 0));
    if (u.deleted)
        out.emplace_back("deleted", static_cast<int64_t>(*u.deleted ? 1 : 0));
    return out;
}

class SqliteDownloadStore final : public IDownloadStore {
public:
    explicit SqliteDownloadStore(Database db) : db_(std::move(db)) {}

    Result<DownloadId> insert(const DownloadInfo& info) override {
        DownloadId id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto stmtResult = db_.prepare(
                "INSERT INTO downloads (uri, hint, mime_type, destination, request_headers, "
                "cookies, user_agent, referer, mode, no_integrity, owner, notification_class, "
                "extras, title, description, visibility, filename, total_bytes, current_bytes, "
                "etag, allowed_network_types, allow_roaming, bypass_recommended_size_limit, "
                "status, control, num_failed, retry_after, last_modified, deleted) VALUES "
                "(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
                "?, ?, ?)");
            if (!stmtResult)
                return stmtResult.error();

            Statement stmt = std::move(stmtResult).value();
            auto bound = stmt.bindAll(
                info.uri, info.hint, info.mimeType, static_cast<int>(info.destination),
                headersToJson(info.requestHeaders), info.cookies, info.userAgent, info.referer,
                static_cast<int>(info.mode), info.noIntegrity ? 1 : 0, info.owner,
                info.notificationClass, info.extras, info.title, info.description,
                static_cast<int>(info.visibility), info.filename,
                static_cast<int64_t>(info.totalBytes), static_cast<int64_t>(info.currentBytes),
                info.etag, info.allowedNetworkTypes, info.allowRoaming ? 1 : 0,
                info.bypassRecommendedSizeLimit ? 1 : 0, info.status,
                static_cast<int>(info.control), info.numFailed,
                static_cast<int64_t>(info.retryAfter), static_cast<int64_t>(info.lastModified),
                info.deleted ? 1 : 0);
            if (!bound)
                return bound.error();
            if (auto r = stmt.execute(); !r)
                return r.error();
            id = db_.lastInsertRowId();
        }
        notifyChanged();
        return id;
    }

    Result<std::optional<DownloadInfo>> query(DownloadId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtResult = db_.prepare(std::string(kSelectColumns) + " WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, static_cast<int64_t>(id)); !r)
            return r.error();
        auto step = stmt.step();
        if (!step)
            return step.error();
        if (!step.value())
            return std::optional<DownloadInfo>{};
        return std::optional<DownloadInfo>{readRow(stmt)};
    }

    Result<std::vector<DownloadInfo>> queryAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtResult = db_.prepare(std::string(kSelectColumns) + " ORDER BY id");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        return collect(stmt);
    }

    Result<std::vector<DownloadInfo>> queryByOwner(const std::string& owner) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto stmtResult = db_.prepare(std::string(kSelectColumns) + " WHERE owner = ? ORDER BY id");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, owner); !r)
            return r.error();
        return collect(stmt);
    }

    Result<void> update(DownloadId id, const RecordUpdate& update) override {
        const auto sets = assignments(update);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (sets.empty()) {
                auto exists = rowExists(id);
                if (!exists)
                    return exists.error();
                if (!exists.value())
                    return Error{ErrorCode::NotFound, "no download with id " + std::to_string(id)};
                return {};
            }

            std::string sql = "UPDATE downloads SET ";
            for (std::size_t i = 0; i < sets.size(); ++i) {
                if (i > 0)
                    sql += ", ";
                sql += sets[i].first;
                sql += " = ?";
            }
            sql += " WHERE id = ?";

            auto stmtResult = db_.prepare(sql);
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();

            int index = 1;
            for (const auto& [column, value] : sets) {
                auto bound = std::visit([&](const auto& v) { return stmt.bind(index, v); }, value);
                if (!bound)
                    return bound.error();
                ++index;
            }
            if (auto r = stmt.bind(index, static_cast<int64_t>(id)); !r)
                return r.error();
            if (auto r = stmt.execute(); !r)
                return r.error();
            if (db_.changes() == 0) {
                return Error{ErrorCode::NotFound, "no download with id " + std::to_string(id)};
            }
        }
        notifyChanged();
        return {};
    }

    Result<void> remove(DownloadId id) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto stmtResult = db_.prepare("DELETE FROM downloads WHERE id = ?");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            if (auto r = stmt.bind(1, static_cast<int64_t>(id)); !r)
                return r.error();
            if (auto r = stmt.execute(); !r)
                return r.error();
            if (db_.changes() == 0) {
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
            auto countResult = db_.prepare("SELECT COUNT(*) FROM downloads WHERE status >= 200");
            if (!countResult)
                return countResult.error();
            Statement count = std::move(countResult).value();
            auto step = count.step();
            if (!step)
                return step.error();
            const auto completed = static_cast<std::size_t>(count.getInt64(0));
            if (completed <= maxRecords) {
                return std::size_t{0};
            }

            auto stmtResult = db_.prepare(
                "DELETE FROM downloads WHERE id IN (SELECT id FROM downloads WHERE status >= 200 "
                "ORDER BY last_modified ASC, id ASC LIMIT ?)");
            if (!stmtResult)
                return stmtResult.error();
            Statement stmt = std::move(stmtResult).value();
            if (auto r = stmt.bind(1, static_cast<int64_t>(completed - maxRecords)); !r)
                return r.error();
            if (auto r = stmt.execute(); !r)
                return r.error();
            removed = static_cast<std::size_t>(db_.changes());
        }
        spdlog::info("[SqliteDownloadStore] Trimmed {} completed downloads", removed);
        notifyChanged();
        return removed;
    }

    void setChangeListener(ChangeListener listener) override {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener_ = std::move(listener);
    }

private:
    Result<std::vector<DownloadInfo>> collect(Statement& stmt) {
        std::vector<DownloadInfo> rows;
        for (;;) {
            auto step = stmt.step();
            if (!step)
                return step.error();
            if (!step.value())
                break;
            rows.push_back(readRow(stmt));
        }
        return rows;
    }

    Result<bool> rowExists(DownloadId id) {
        auto stmtResult = db_.prepare("SELECT 1 FROM downloads WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.bind(1, static_cast<int64_t>(id)); !r)
            return r.error();
        return stmt.step();
    }

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
    Database db_;

    std::mutex listenerMutex_;
    ChangeListener listener_;
};

} // namespace

Result<std::unique_ptr<IDownloadStore>> makeSqliteDownloadStore(const std::filesystem::path& path) {
    const bool inMemory = path == ":memory:";
    if (!inMemory && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create database directory " +
                                                 path.parent_path().string() + ": " + ec.message()};
        }
    }

    Database db;
    auto opened = db.open(path.string(), inMemory ? ConnectionMode::Memory : ConnectionMode::Create);
    if (!opened)
        return opened.error();

    if (!inMemory) {
        if (auto r = db.enableWAL(); !r) {
            spdlog::warn("[SqliteDownloadStore] WAL unavailable: {}", r.error().message);
        }
    }
    if (auto r = db.execute(kSchema); !r)
        return r.error();

    spdlog::debug("[SqliteDownloadStore] Opened {} (SQLite {})", path.string(), Database::version());
    return std::unique_ptr<IDownloadStore>(std::make_unique<SqliteDownloadStore>(std::move(db)));
}

} // namespace fetchd::storage
