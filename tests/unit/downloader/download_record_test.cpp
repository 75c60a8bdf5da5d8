#include <gtest/gtest.h>

#include <fetchd/downloader/download_record.h>
#include <fetchd/downloader/notifications.h>

#include "downloader_test_support.h"

using namespace fetchd;
using namespace fetchd::downloader;
using namespace fetchd::test;

namespace {

constexpr Millis kNow = 1'700'000'000'000;

DownloadInfo makeInfo(int st = status::Pending) {
    DownloadInfo info;
    info.id = 7;
    info.uri = "http://example.com/a.bin";
    info.status = st;
    return info;
}

} // namespace

TEST(DownloadRecordTest, RestartTimeIsNowWithoutFailures) {
    auto info = makeInfo(status::WaitingToRetry);
    info.lastModified = kNow - 5000;
    DownloadRecord record(info, 0);
    EXPECT_EQ(record.restartTime(kNow), kNow);
}

TEST(DownloadRecordTest, RestartTimeBacksOffExponentially) {
    auto info = makeInfo(status::WaitingToRetry);
    info.lastModified = kNow;

    info.numFailed = 1;
    EXPECT_EQ(DownloadRecord(info, 0).restartTime(kNow), kNow + 30'000);

    info.numFailed = 3;
    EXPECT_EQ(DownloadRecord(info, 0).restartTime(kNow), kNow + 120'000);

    info.numFailed = 2;
    EXPECT_EQ(DownloadRecord(info, 500).restartTime(kNow), kNow + 90'000);
}

TEST(DownloadRecordTest, RestartTimeUsesServerRetryAfter) {
    auto info = makeInfo(status::WaitingToRetry);
    info.lastModified = kNow;
    info.numFailed = 4;
    info.retryAfter = 45'000;
    EXPECT_EQ(DownloadRecord(info, 999).restartTime(kNow), kNow + 45'000);
}

TEST(DownloadRecordTest, FuzzIsClamped) {
    EXPECT_EQ(DownloadRecord(makeInfo(), 5000).fuzz(), 1000);
    EXPECT_EQ(DownloadRecord(makeInfo(), -3).fuzz(), 0);
}

TEST(DownloadRecordTest, ReadinessFollowsStatusAndControl) {
    FakeSystemFacade system;

    EXPECT_TRUE(DownloadRecord(makeInfo(status::Pending), 0).isReadyToStart(kNow, system));
    EXPECT_TRUE(DownloadRecord(makeInfo(status::Running), 0).isReadyToStart(kNow, system));
    EXPECT_TRUE(DownloadRecord(makeInfo(status::Unknown), 0).isReadyToStart(kNow, system));
    EXPECT_FALSE(DownloadRecord(makeInfo(status::Success), 0).isReadyToStart(kNow, system));
    EXPECT_FALSE(DownloadRecord(makeInfo(404), 0).isReadyToStart(kNow, system));

    auto paused = makeInfo(status::Pending);
    paused.control = Control::Paused;
    EXPECT_FALSE(DownloadRecord(paused, 0).isReadyToStart(kNow, system));

    // An owner pause only holds while control says so.
    auto stillPaused = makeInfo(status::PausedByApp);
    stillPaused.control = Control::Paused;
    EXPECT_FALSE(DownloadRecord(stillPaused, 0).isReadyToStart(kNow, system));
    EXPECT_TRUE(DownloadRecord(makeInfo(status::PausedByApp), 0).isReadyToStart(kNow, system));

    DownloadRecord active(makeInfo(status::Pending), 0);
    active.setActiveThread(true);
    EXPECT_FALSE(active.isReadyToStart(kNow, system));
}

TEST(DownloadRecordTest, WaitingToRetryBecomesReadyAtRestartTime) {
    FakeSystemFacade system;
    auto info = makeInfo(status::WaitingToRetry);
    info.numFailed = 1;
    info.lastModified = kNow;
    DownloadRecord record(info, 0);

    EXPECT_FALSE(record.isReadyToStart(kNow + 29'999, system));
    EXPECT_TRUE(record.isReadyToStart(kNow + 30'000, system));
}

TEST(DownloadRecordTest, WaitingForNetworkDependsOnConnectivity) {
    FakeSystemFacade system;
    DownloadRecord record(makeInfo(status::WaitingForNetwork), 0);

    system.setNetwork(NetworkType::None);
    EXPECT_FALSE(record.isReadyToStart(kNow, system));
    system.setNetwork(NetworkType::Ethernet);
    EXPECT_TRUE(record.isReadyToStart(kNow, system));
}

TEST(DownloadRecordTest, NextAction) {
    EXPECT_EQ(DownloadRecord(makeInfo(status::Success), 0).nextAction(kNow), -1);
    EXPECT_EQ(DownloadRecord(makeInfo(status::Canceled), 0).nextAction(kNow), -1);
    EXPECT_EQ(DownloadRecord(makeInfo(status::Pending), 0).nextAction(kNow), 0);
    EXPECT_EQ(DownloadRecord(makeInfo(status::WaitingForNetwork), 0).nextAction(kNow), 0);

    auto retry = makeInfo(status::WaitingToRetry);
    retry.numFailed = 1;
    retry.lastModified = kNow;
    EXPECT_EQ(DownloadRecord(retry, 0).nextAction(kNow + 10'000), 20'000);
    EXPECT_EQ(DownloadRecord(retry, 0).nextAction(kNow + 40'000), 0);
}

TEST(DownloadRecordTest, MergeKeepsTransientState) {
    DownloadRecord record(makeInfo(status::Pending), 0);
    record.setActiveThread(true);

    auto row = makeInfo(status::Running);
    row.currentBytes = 42;
    record.mergeFrom(row);

    EXPECT_TRUE(record.hasActiveThread());
    EXPECT_EQ(record.info().status, status::Running);
    EXPECT_EQ(record.info().currentBytes, 42);
}

TEST(DownloadRecordTest, CompletionNotificationNeedsVisibility) {
    auto info = makeInfo(status::Success);
    EXPECT_FALSE(DownloadRecord(info, 0).hasCompletionNotification());
    info.visibility = Visibility::VisibleNotifyCompleted;
    EXPECT_TRUE(DownloadRecord(info, 0).hasCompletionNotification());
    info.status = status::Running;
    EXPECT_FALSE(DownloadRecord(info, 0).hasCompletionNotification());
}

TEST(NetworkPolicyTest, NoConnection) {
    FakeSystemFacade system;
    system.setNetwork(NetworkType::None);
    EXPECT_EQ(checkCanUseNetwork(makeInfo(), system), NetworkUsability::NoConnection);
}

TEST(NetworkPolicyTest, RoamingAndTypeOnlyBindPublicRequests) {
    FakeSystemFacade system;
    system.setNetwork(NetworkType::Mobile);
    system.setRoaming(true);

    auto info = makeInfo();
    info.allowRoaming = false;
    info.allowedNetworkTypes = network_flags::Wifi;

    info.mode = RequestMode::Legacy;
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::Ok);

    info.mode = RequestMode::Public;
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::CannotUseRoaming);

    system.setRoaming(false);
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::TypeDisallowedByRequestor);

    system.setNetwork(NetworkType::Ethernet);
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::Ok);
}

TEST(NetworkPolicyTest, SizeLimitsApplyOnMobileOnly) {
    FakeSystemFacade system;
    system.setLimits(1000, 100);

    auto info = makeInfo();
    info.mode = RequestMode::Public;
    info.totalBytes = 5000;

    system.setNetwork(NetworkType::Wifi);
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::Ok);

    system.setNetwork(NetworkType::Mobile);
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::UnusableDueToSize);

    info.totalBytes = 500;
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::RecommendedUnusableDueToSize);

    info.bypassRecommendedSizeLimit = true;
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::Ok);

    info.bypassRecommendedSizeLimit = false;
    info.mode = RequestMode::Legacy;
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::Ok);

    info.totalBytes = -1;
    info.mode = RequestMode::Public;
    EXPECT_EQ(checkCanUseNetwork(info, system), NetworkUsability::Ok);
}

TEST(CompletionEventTest, PublicEventIsAddressedByOwner) {
    auto info = makeInfo();
    info.mode = RequestMode::Public;
    info.owner = "app";
    info.notificationClass = "ignored.Receiver";

    auto ev = makeCompletionEvent(info, status::Success);
    EXPECT_EQ(ev.id, info.id);
    EXPECT_EQ(ev.status, status::Success);
    EXPECT_TRUE(ev.notificationClass.empty());
    EXPECT_TRUE(ev.contentLocator.empty());
    EXPECT_TRUE(wantsCompletionSignal(ev));

    info.owner.clear();
    EXPECT_FALSE(wantsCompletionSignal(makeCompletionEvent(info, status::Success)));
}

TEST(CompletionEventTest, LegacyEventNeedsClass) {
    auto info = makeInfo();
    info.owner = "app";
    EXPECT_FALSE(wantsCompletionSignal(makeCompletionEvent(info, 404)));

    info.notificationClass = "app.Receiver";
    auto ev = makeCompletionEvent(info, 404);
    EXPECT_TRUE(wantsCompletionSignal(ev));
    EXPECT_EQ(ev.contentLocator, "content://downloads/download/7");
}

TEST(StatusTest, Ranges) {
    EXPECT_TRUE(status::isInformational(status::Pending));
    EXPECT_TRUE(status::isSuccess(status::Success));
    EXPECT_TRUE(status::isClientError(status::Canceled));
    EXPECT_TRUE(status::isServerError(503));
    EXPECT_TRUE(status::isCompleted(404));
    EXPECT_FALSE(status::isCompleted(status::WaitingToRetry));
}

TEST(StatusTest, Names) {
    EXPECT_EQ(status::toString(status::Running), "running");
    EXPECT_EQ(status::toString(status::CannotResume), "cannot-resume");
    EXPECT_EQ(status::toString(404), "http-404");
    EXPECT_EQ(status::toString(150), "status-150");
}

TEST(StatusTest, UserFacingCategories) {
    EXPECT_EQ(userFacingCategory(status::Success), ErrorCategory::None);
    EXPECT_EQ(userFacingCategory(status::FileAlreadyExists), ErrorCategory::AlreadyExists);
    EXPECT_EQ(userFacingCategory(status::InsufficientSpace), ErrorCategory::InsufficientSpace);
    EXPECT_EQ(userFacingCategory(status::DeviceNotFound), ErrorCategory::DeviceMissing);
    EXPECT_EQ(userFacingCategory(status::CannotResume), ErrorCategory::CannotResume);
    EXPECT_EQ(userFacingCategory(500), ErrorCategory::Generic);
    EXPECT_STREQ(categoryMessage(ErrorCategory::None), "");
}

TEST(NotificationsTest, ActiveDownloadsAreGroupedByOwner) {
    std::vector<DownloadInfo> rows;
    auto a = makeInfo(status::Running);
    a.id = 1;
    a.owner = "app";
    a.currentBytes = 10;
    a.totalBytes = 100;
    auto b = makeInfo(status::Pending);
    b.id = 2;
    b.owner = "app";
    b.currentBytes = 5;
    b.totalBytes = 50;
    auto hidden = makeInfo(status::Running);
    hidden.id = 3;
    hidden.owner = "app";
    hidden.visibility = Visibility::Hidden;
    auto other = makeInfo(status::WaitingForNetwork);
    other.id = 4;
    other.owner = "other";
    other.totalBytes = -1;
    rows = {a, b, hidden, other};

    auto items = collateNotifications(rows);
    ASSERT_EQ(items.size(), 2u);

    EXPECT_EQ(items[0].owner, "app");
    EXPECT_EQ(items[0].kind, NotificationItem::Kind::Active);
    EXPECT_EQ(items[0].ids, (std::vector<DownloadId>{1, 2}));
    EXPECT_EQ(items[0].currentBytes, 15);
    EXPECT_EQ(items[0].totalBytes, 150);
    EXPECT_FALSE(items[0].paused);

    EXPECT_EQ(items[1].owner, "other");
    EXPECT_EQ(items[1].totalBytes, 0);
    EXPECT_TRUE(items[1].paused);
}

TEST(NotificationsTest, CompletedItemsNeedNotifyCompleted) {
    auto done = makeInfo(status::Success);
    done.id = 1;
    done.visibility = Visibility::VisibleNotifyCompleted;
    auto quiet = makeInfo(status::Success);
    quiet.id = 2;
    auto gone = makeInfo(status::Success);
    gone.id = 3;
    gone.visibility = Visibility::VisibleNotifyCompleted;
    gone.deleted = true;

    auto items = collateNotifications({done, quiet, gone});
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].kind, NotificationItem::Kind::Completed);
    EXPECT_EQ(items[0].ids, (std::vector<DownloadId>{1}));
    EXPECT_EQ(items[0].status, status::Success);
}
