/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - One GET per execute() on a fresh easy handle, so the adapter is safe to share between
 *   transfer threads.
 * - Redirects are never followed here; the executor sees every 3xx and decides.
 * - The response head is delivered once the final header block ends (1xx blocks are
 *   skipped), then the body streams through the sink in CURLOPT_BUFFERSIZE pieces.
 * - No overall deadline: connect timeout plus a low-speed window act as the I/O timeout.
 * - Exceptions from the callbacks never cross libcurl: they are parked in the exchange
 *   context, the transfer is aborted, and execute() rethrows after cleanup.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <fetchd/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <memory>
#include <mutex>
#include <string_view>

namespace fetchd::downloader {

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Case-insensitive starts_with
static bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// Per-exchange state shared by the header and write callbacks
struct ExchangeContext {
    const HeadHandler* onHead{nullptr};
    const BodySink* onBody{nullptr};
    HttpResponseHead head;
    bool headDelivered{false};
    bool stoppedByCallback{false};
    std::exception_ptr failure;
};

static bool deliverHead(ExchangeContext& ctx) {
    ctx.headDelivered = true;
    try {
        if (ctx.onHead && *ctx.onHead && !(*ctx.onHead)(ctx.head)) {
            ctx.stoppedByCallback = true;
            return false;
        }
    } catch (...) {
        ctx.failure = std::current_exception();
        return false;
    }
    return true;
}

static bool deliverBody(ExchangeContext& ctx, std::span<const std::byte> bytes) {
    try {
        if (ctx.onBody && *ctx.onBody && !(*ctx.onBody)(bytes)) {
            ctx.stoppedByCallback = true;
            return false;
        }
    } catch (...) {
        ctx.failure = std::current_exception();
        return false;
    }
    return true;
}

// "HTTP/1.1 200 OK" / "HTTP/2 503"
static int parseStatusLine(std::string_view line) {
    auto sp = line.find(' ');
    if (sp == std::string_view::npos)
        return 0;
    auto rest = line.substr(sp + 1);
    int code = 0;
    auto res = std::from_chars(rest.data(), rest.data() + std::min<size_t>(rest.size(), 3), code);
    return res.ec == std::errc() ? code : 0;
}

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<ExchangeContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (istarts_with(line, "HTTP/")) {
        ctx->head = HttpResponseHead{};
        ctx->head.statusCode = parseStatusLine(line);
        return total;
    }

    if (line.empty()) {
        // End of a header block; interim 1xx responses are followed by the real one.
        if (ctx->head.statusCode >= 100 && ctx->head.statusCode < 200) {
            return total;
        }
        if (!ctx->headDelivered && !deliverHead(*ctx)) {
            return 0;
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    ctx->head.headers.push_back(Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    return total;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<ExchangeContext*>(userdata);
    if (total == 0)
        return 0;

    if (!ctx->headDelivered && !deliverHead(*ctx)) {
        return 0;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    if (!deliverBody(*ctx, bytes)) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const TransportConfig& cfg) {
    // Connect timeout plus a stall window; no overall deadline
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg.connectTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                     std::max<long>(1L, static_cast<long>(cfg.ioTimeout.count() / 1000)));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE,
                     static_cast<long>(std::max<std::size_t>(cfg.bufferSize, 1024)));

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.insecure ? 0L : 2L);
    if (!cfg.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.caPath.c_str());
    }

    // Proxy
    if (cfg.proxy && !cfg.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
        // CONNECT responses would otherwise look like the final head
        curl_easy_setopt(curl, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    explicit CurlHttpAdapter(TransportConfig config) : config_(std::move(config)) {}
    ~CurlHttpAdapter() override = default;

    Result<void> execute(const HttpRequest& request, const HeadHandler& onHead,
                         const BodySink& onBody) override {
        std::unique_ptr<CURL, CurlEasyDeleter> handle(curl_easy_init());
        if (!handle) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }
        CURL* curl = handle.get();

        std::unique_ptr<curl_slist, CurlSlistDeleter> list(build_header_list(request.headers));
        ExchangeContext ctx{};
        ctx.onHead = &onHead;
        ctx.onBody = &onBody;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list.get());

        configure_common(curl, config_);

        CURLcode rc = curl_easy_perform(curl);

        if (rc == CURLE_OK && !ctx.headDelivered) {
            // Bodiless response that never produced an empty header line
            long http_status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
            ctx.head.statusCode = static_cast<int>(http_status);
            deliverHead(ctx);
        }

        list.reset();
        handle.reset();

        if (ctx.failure) {
            std::rethrow_exception(ctx.failure);
        }
        if (ctx.stoppedByCallback) {
            return Error{ErrorCode::OperationCancelled, "exchange stopped by caller"};
        }
        if (rc != CURLE_OK) {
            auto err = makeCurlError(rc, "GET " + request.url);
            spdlog::debug("HTTP transport failure: {}", err.message);
            return err;
        }
        return Result<void>{};
    }

private:
    TransportConfig config_;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(TransportConfig config) {
    static std::once_flag curlInit;
    std::call_once(curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return std::make_unique<CurlHttpAdapter>(std::move(config));
}

} // namespace fetchd::downloader
