#include <gtest/gtest.h>

#include <fetchd/downloader/downloader.hpp>

#include "downloader_test_support.h"

#include <stdexcept>

using namespace fetchd;
using namespace fetchd::downloader;
using namespace fetchd::test;

namespace {

// file:// keeps these exchanges on the local machine; the callback plumbing is the same.
class CurlHttpAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = make_temp_dir("fetchd-curl-");
        payload_ = make_payload(5000);
        write_file(root_ / "body.bin", payload_);
        request_.url = "file://" + (root_ / "body.bin").string();
        adapter_ = makeCurlHttpAdapter(TransportConfig{});
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    std::string payload_;
    HttpRequest request_;
    std::unique_ptr<IHttpAdapter> adapter_;
};

} // namespace

TEST_F(CurlHttpAdapterTest, StreamsBodyAfterHead) {
    int heads = 0;
    std::string body;
    auto r = adapter_->execute(
        request_,
        [&](const HttpResponseHead&) {
            ++heads;
            return true;
        },
        [&](ByteSpan bytes) {
            body.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
            return true;
        });
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(heads, 1);
    EXPECT_EQ(body, payload_);
}

TEST_F(CurlHttpAdapterTest, RefusingTheHeadCancelsTheExchange) {
    std::size_t received = 0;
    auto r = adapter_->execute(
        request_, [](const HttpResponseHead&) { return false; },
        [&](ByteSpan bytes) {
            received += bytes.size();
            return true;
        });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(received, 0u);
}

TEST_F(CurlHttpAdapterTest, HeadHandlerExceptionReachesCaller) {
    EXPECT_THROW(adapter_->execute(
                     request_,
                     [](const HttpResponseHead&) -> bool {
                         throw std::runtime_error("head handler failed");
                     },
                     [](ByteSpan) { return true; }),
                 std::runtime_error);
}

TEST_F(CurlHttpAdapterTest, BodySinkExceptionReachesCaller) {
    int calls = 0;
    try {
        (void)adapter_->execute(
            request_, [](const HttpResponseHead&) { return true; },
            [&](ByteSpan) -> bool {
                ++calls;
                throw std::length_error("sink full");
            });
        FAIL() << "exception was not rethrown";
    } catch (const std::length_error& e) {
        EXPECT_STREQ(e.what(), "sink full");
    }
    EXPECT_EQ(calls, 1);

    // The adapter stays usable after an aborted exchange.
    std::size_t received = 0;
    auto again = adapter_->execute(
        request_, [](const HttpResponseHead&) { return true; },
        [&](ByteSpan bytes) {
            received += bytes.size();
            return true;
        });
    ASSERT_TRUE(again) << again.error().message;
    EXPECT_EQ(received, payload_.size());
}
