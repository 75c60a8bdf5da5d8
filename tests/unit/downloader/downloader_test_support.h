#pragma once

#include <fetchd/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace fetchd::test {

using namespace fetchd::downloader;

// Unique temporary directory, removed by the caller
inline fs::path make_temp_dir(const std::string& prefix = "fetchd-dl-test-") {
    auto base = fs::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned long long> dist;
    fs::path dir;
    for (int i = 0; i < 5; ++i) {
        dir = base / (prefix + std::to_string(dist(gen)));
        if (!fs::exists(dir)) {
            fs::create_directories(dir);
            break;
        }
    }
    return dir;
}

inline void write_file(const fs::path& p, const std::string& data) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

inline std::string make_payload(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>('a' + (i % 26));
    }
    return s;
}

inline std::optional<std::string> find_header(const std::vector<Header>& headers,
                                              const std::string& name) {
    for (const auto& h : headers) {
        if (h.name == name) {
            return h.value;
        }
    }
    return std::nullopt;
}

// Polls `pred` until it holds or the timeout passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

class FakeSystemFacade final : public ISystemFacade {
public:
    Millis currentTimeMillis() const override { return now_.load(); }
    NetworkType activeNetworkType() const override { return type_.load(); }
    bool isNetworkRoaming() const override { return roaming_.load(); }

    std::optional<std::int64_t> maxBytesOverMobile() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return maxMobile_;
    }
    std::optional<std::int64_t> recommendedMaxBytesOverMobile() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return recommendedMobile_;
    }

    void setNow(Millis now) { now_ = now; }
    void setNetwork(NetworkType type) { type_ = type; }
    void setRoaming(bool roaming) { roaming_ = roaming; }
    void setLimits(std::optional<std::int64_t> max, std::optional<std::int64_t> recommended) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxMobile_ = max;
        recommendedMobile_ = recommended;
    }

private:
    std::atomic<Millis> now_{fetchd::currentTimeMillis()};
    std::atomic<NetworkType> type_{NetworkType::Wifi};
    std::atomic<bool> roaming_{false};
    mutable std::mutex mutex_;
    std::optional<std::int64_t> maxMobile_;
    std::optional<std::int64_t> recommendedMobile_;
};

struct ScriptedResponse {
    int status{200};
    std::vector<Header> headers;
    std::string body;
    std::size_t chunkSize{100};
    // Transport failure before any response head
    std::optional<ErrorCode> failBeforeHead;
    // Transport failure once this many body bytes were delivered
    std::optional<std::size_t> failAfterBytes;

    static ScriptedResponse ok(std::string body, std::vector<Header> extra = {}) {
        ScriptedResponse r;
        r.headers = std::move(extra);
        r.headers.push_back({"Content-Length", std::to_string(body.size())});
        r.body = std::move(body);
        return r;
    }
};

/**
 * IHttpAdapter replaying scripted responses in order. When the script runs dry the default
 * response is used, if one was set. Bodies can be held back until release() so tests can
 * observe transfers mid-flight.
 */
class ScriptedHttpAdapter final : public IHttpAdapter {
public:
    ~ScriptedHttpAdapter() override { release(); }

    void push(ScriptedResponse r) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(r));
    }

    void setDefault(ScriptedResponse r) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_ = std::move(r);
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    Result<void> execute(const HttpRequest& request, const HeadHandler& onHead,
                         const BodySink& onBody) override {
        ScriptedResponse response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (!script_.empty()) {
                response = std::move(script_.front());
                script_.pop_front();
            } else if (default_) {
                response = *default_;
            } else {
                return Error{ErrorCode::NetworkError, "no scripted response for " + request.url};
            }
        }

        if (response.failBeforeHead) {
            return Error{*response.failBeforeHead, "scripted failure for " + request.url};
        }

        HttpResponseHead head;
        head.statusCode = response.status;
        head.headers = response.headers;
        if (onHead && !onHead(head)) {
            return Error{ErrorCode::OperationCancelled, "exchange stopped by caller"};
        }

        enterFlight();
        struct FlightGuard {
            ScriptedHttpAdapter* self;
            ~FlightGuard() { self->leaveFlight(); }
        } guard{this};

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !held_; });
        }

        std::size_t offset = 0;
        while (offset < response.body.size()) {
            if (response.failAfterBytes && offset >= *response.failAfterBytes) {
                return Error{ErrorCode::NetworkError, "connection reset"};
            }
            const auto n = std::min(response.chunkSize, response.body.size() - offset);
            ByteSpan chunk{reinterpret_cast<const std::byte*>(response.body.data() + offset), n};
            bytesDelivered_ += n;
            offset += n;
            if (onBody && !onBody(chunk)) {
                return Error{ErrorCode::OperationCancelled, "exchange stopped by caller"};
            }
        }
        return Result<void>{};
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t requestCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::size_t bytesDelivered() const { return bytesDelivered_.load(); }
    int inFlight() const { return inFlight_.load(); }
    int maxInFlight() const { return maxInFlight_.load(); }

private:
    void enterFlight() {
        const int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }
    }
    void leaveFlight() { --inFlight_; }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ScriptedResponse> script_;
    std::optional<ScriptedResponse> default_;
    std::vector<HttpRequest> requests_;
    bool held_{false};
    std::atomic<std::size_t> bytesDelivered_{0};
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
};

class RecordingSink final : public ICompletionSink {
public:
    void downloadCompleted(const CompletionEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        completions.push_back(event);
    }
    void cancelNotification(DownloadId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled.push_back(id);
    }
    void cancelAllNotifications() override { ++cancelAllCount; }
    void pausedForSize(DownloadId id, bool isWifiRequired) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pausedForSizeCalls.emplace_back(id, isWifiRequired);
    }
    void updateNotifications(const std::vector<NotificationItem>& items) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastItems = items;
        }
        ++updateCount;
        if (updateDelay.count() > 0) {
            std::this_thread::sleep_for(updateDelay);
        }
    }

    std::vector<CompletionEvent> completionsSnapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completions;
    }

    mutable std::mutex mutex_;
    std::vector<CompletionEvent> completions;
    std::vector<DownloadId> cancelled;
    std::vector<std::pair<DownloadId, bool>> pausedForSizeCalls;
    std::vector<NotificationItem> lastItems;
    std::atomic<int> cancelAllCount{0};
    std::atomic<int> updateCount{0};
    std::chrono::milliseconds updateDelay{0};
};

} // namespace fetchd::test
