#include <gtest/gtest.h>

#include <fetchd/storage/download_store.h>

#include "downloader_test_support.h"

#include <atomic>
#include <memory>

using namespace fetchd;
using namespace fetchd::downloader;
using namespace fetchd::test;

namespace {

enum class StoreKind { Memory, Sqlite };

std::string kindName(const ::testing::TestParamInfo<StoreKind>& info) {
    return info.param == StoreKind::Memory ? "Memory" : "Sqlite";
}

class DownloadStoreTest : public ::testing::TestWithParam<StoreKind> {
protected:
    void SetUp() override {
        if (GetParam() == StoreKind::Memory) {
            store_ = storage::makeInMemoryDownloadStore();
        } else {
            auto opened = storage::makeSqliteDownloadStore(":memory:");
            ASSERT_TRUE(opened) << opened.error().message;
            store_ = std::move(opened).value();
        }
    }

    DownloadId add(const std::string& owner, int st = status::Pending, Millis modified = 0) {
        DownloadInfo info;
        info.uri = "http://example.com/" + owner;
        info.owner = owner;
        info.status = st;
        info.lastModified = modified;
        auto id = store_->insert(info);
        EXPECT_TRUE(id);
        return id.value();
    }

    std::unique_ptr<IDownloadStore> store_;
};

} // namespace

TEST_P(DownloadStoreTest, InsertAssignsIncreasingIds) {
    auto first = add("a");
    auto second = add("b");
    EXPECT_GT(first, 0);
    EXPECT_GT(second, first);

    auto all = store_->queryAll();
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 2u);
    EXPECT_EQ(all.value()[0].id, first);
    EXPECT_EQ(all.value()[1].id, second);
}

TEST_P(DownloadStoreTest, StoresEveryField) {
    DownloadInfo info;
    info.uri = "https://example.com/x.iso";
    info.hint = "x.iso";
    info.mimeType = "application/octet-stream";
    info.destination = Destination::External;
    info.requestHeaders = {{"Authorization", "Bearer t"}, {"X-Trace", "1"}};
    info.cookies = "c=1";
    info.userAgent = "agent";
    info.referer = "https://example.com/";
    info.mode = RequestMode::Public;
    info.noIntegrity = true;
    info.owner = "owner";
    info.notificationClass = "cls";
    info.extras = "extra";
    info.title = "title";
    info.description = "desc";
    info.visibility = Visibility::Hidden;
    info.filename = "/tmp/x.iso";
    info.totalBytes = 123;
    info.currentBytes = 45;
    info.etag = "tag";
    info.allowedNetworkTypes = network_flags::Wifi;
    info.allowRoaming = false;
    info.bypassRecommendedSizeLimit = true;
    info.status = status::WaitingToRetry;
    info.control = Control::Paused;
    info.numFailed = 2;
    info.retryAfter = 30000;
    info.lastModified = 99;

    auto id = store_->insert(info);
    ASSERT_TRUE(id);
    auto row = store_->query(id.value());
    ASSERT_TRUE(row);
    ASSERT_TRUE(row.value().has_value());
    const auto& got = *row.value();

    EXPECT_EQ(got.id, id.value());
    EXPECT_EQ(got.uri, info.uri);
    EXPECT_EQ(got.hint, info.hint);
    EXPECT_EQ(got.mimeType, info.mimeType);
    EXPECT_EQ(got.destination, Destination::External);
    ASSERT_EQ(got.requestHeaders.size(), 2u);
    EXPECT_EQ(got.requestHeaders[0].name, "Authorization");
    EXPECT_EQ(got.requestHeaders[1].value, "1");
    EXPECT_EQ(got.cookies, "c=1");
    EXPECT_EQ(got.userAgent, "agent");
    EXPECT_EQ(got.referer, info.referer);
    EXPECT_EQ(got.mode, RequestMode::Public);
    EXPECT_TRUE(got.noIntegrity);
    EXPECT_EQ(got.owner, "owner");
    EXPECT_EQ(got.notificationClass, "cls");
    EXPECT_EQ(got.extras, "extra");
    EXPECT_EQ(got.title, "title");
    EXPECT_EQ(got.description, "desc");
    EXPECT_EQ(got.visibility, Visibility::Hidden);
    EXPECT_EQ(got.filename, "/tmp/x.iso");
    EXPECT_EQ(got.totalBytes, 123);
    EXPECT_EQ(got.currentBytes, 45);
    EXPECT_EQ(got.etag, "tag");
    EXPECT_EQ(got.allowedNetworkTypes, network_flags::Wifi);
    EXPECT_FALSE(got.allowRoaming);
    EXPECT_TRUE(got.bypassRecommendedSizeLimit);
    EXPECT_EQ(got.status, status::WaitingToRetry);
    EXPECT_EQ(got.control, Control::Paused);
    EXPECT_EQ(got.numFailed, 2);
    EXPECT_EQ(got.retryAfter, 30000);
    EXPECT_EQ(got.lastModified, 99);
    EXPECT_FALSE(got.deleted);
}

TEST_P(DownloadStoreTest, QueryMissingIdIsEmpty) {
    auto row = store_->query(4242);
    ASSERT_TRUE(row);
    EXPECT_FALSE(row.value().has_value());
}

TEST_P(DownloadStoreTest, UpdateTouchesOnlySetFields) {
    auto id = add("a");

    RecordUpdate update;
    update.status = status::Running;
    update.currentBytes = 512;
    ASSERT_TRUE(store_->update(id, update));

    auto row = store_->query(id);
    ASSERT_TRUE(row);
    const auto& got = *row.value();
    EXPECT_EQ(got.status, status::Running);
    EXPECT_EQ(got.currentBytes, 512);
    EXPECT_EQ(got.totalBytes, -1);
    EXPECT_EQ(got.owner, "a");
}

TEST_P(DownloadStoreTest, UpdateTogglesSizeLimitBypass) {
    auto id = add("a");
    auto before = store_->query(id);
    ASSERT_TRUE(before);
    EXPECT_FALSE(before.value()->bypassRecommendedSizeLimit);

    RecordUpdate update;
    update.bypassRecommendedSizeLimit = true;
    ASSERT_TRUE(store_->update(id, update));
    auto after = store_->query(id);
    ASSERT_TRUE(after);
    EXPECT_TRUE(after.value()->bypassRecommendedSizeLimit);

    update.bypassRecommendedSizeLimit = false;
    ASSERT_TRUE(store_->update(id, update));
    EXPECT_FALSE(store_->query(id).value()->bypassRecommendedSizeLimit);
}

TEST_P(DownloadStoreTest, UpdateAndRemoveOfMissingIdAreNotFound) {
    RecordUpdate update;
    update.status = status::Running;
    auto updated = store_->update(99, update);
    ASSERT_FALSE(updated);
    EXPECT_EQ(updated.error().code, ErrorCode::NotFound);

    auto empty = store_->update(99, RecordUpdate{});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::NotFound);

    auto removed = store_->remove(99);
    ASSERT_FALSE(removed);
    EXPECT_EQ(removed.error().code, ErrorCode::NotFound);
}

TEST_P(DownloadStoreTest, RemoveDeletesRow) {
    auto id = add("a");
    ASSERT_TRUE(store_->remove(id));
    auto row = store_->query(id);
    ASSERT_TRUE(row);
    EXPECT_FALSE(row.value().has_value());
}

TEST_P(DownloadStoreTest, QueryByOwner) {
    add("a");
    add("b");
    add("a");

    auto rows = store_->queryByOwner("a");
    ASSERT_TRUE(rows);
    ASSERT_EQ(rows.value().size(), 2u);
    for (const auto& row : rows.value()) {
        EXPECT_EQ(row.owner, "a");
    }
    auto none = store_->queryByOwner("nobody");
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}

TEST_P(DownloadStoreTest, TrimRemovesOldestCompleted) {
    auto oldest = add("a", status::Success, 100);
    auto middle = add("a", 404, 200);
    auto newest = add("a", status::Success, 300);
    auto running = add("a", status::Running, 50);

    auto trimmed = store_->trimCompleted(2);
    ASSERT_TRUE(trimmed);
    EXPECT_EQ(trimmed.value(), 1u);

    EXPECT_FALSE(store_->query(oldest).value().has_value());
    EXPECT_TRUE(store_->query(middle).value().has_value());
    EXPECT_TRUE(store_->query(newest).value().has_value());
    EXPECT_TRUE(store_->query(running).value().has_value());

    auto again = store_->trimCompleted(2);
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), 0u);
}

TEST_P(DownloadStoreTest, ListenerFiresOnEveryMutation) {
    std::atomic<int> changes{0};
    store_->setChangeListener([&changes] { ++changes; });

    auto id = add("a", status::Success);
    RecordUpdate update;
    update.deleted = true;
    ASSERT_TRUE(store_->update(id, update));
    ASSERT_TRUE(store_->remove(id));
    EXPECT_EQ(changes.load(), 3);

    store_->setChangeListener({});
    add("b");
    EXPECT_EQ(changes.load(), 3);
}

TEST_P(DownloadStoreTest, ListenerMayReadTheStore) {
    std::atomic<std::size_t> seen{0};
    store_->setChangeListener([this, &seen] {
        auto rows = store_->queryAll();
        if (rows) {
            seen = rows.value().size();
        }
    });
    add("a");
    EXPECT_EQ(seen.load(), 1u);
}

INSTANTIATE_TEST_SUITE_P(Stores, DownloadStoreTest,
                         ::testing::Values(StoreKind::Memory, StoreKind::Sqlite), kindName);

TEST(SqliteDownloadStoreTest, SurvivesReopen) {
    auto dir = make_temp_dir();
    const auto path = dir / "nested" / "downloads.db";

    DownloadId id = 0;
    {
        auto opened = storage::makeSqliteDownloadStore(path);
        ASSERT_TRUE(opened) << opened.error().message;
        DownloadInfo info;
        info.uri = "http://example.com/persist";
        info.requestHeaders = {{"X-Key", "v"}};
        auto inserted = opened.value()->insert(info);
        ASSERT_TRUE(inserted);
        id = inserted.value();
    }

    {
        auto reopened = storage::makeSqliteDownloadStore(path);
        ASSERT_TRUE(reopened) << reopened.error().message;
        auto row = reopened.value()->query(id);
        ASSERT_TRUE(row);
        ASSERT_TRUE(row.value().has_value());
        EXPECT_EQ(row.value()->uri, "http://example.com/persist");
        ASSERT_EQ(row.value()->requestHeaders.size(), 1u);
        EXPECT_EQ(row.value()->requestHeaders[0].name, "X-Key");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}
