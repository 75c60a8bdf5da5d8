#include <fetchd/config/config_helpers.h>
#include <fetchd/config/downloader_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <optional>
#include <system_error>

namespace fetchd::config {

namespace {

// Typed lookups over the flat key map; absent keys leave the target untouched.
class Reader {
public:
    explicit Reader(const std::map<std::string, std::string>& values) : values_(values) {}

    const std::string* find(const std::string& key) const {
        auto it = values_.find(key);
        return it == values_.end() ? nullptr : &it->second;
    }

    template <typename T> Result<void> number(const std::string& key, T& out) const {
        const auto* raw = find(key);
        if (!raw)
            return {};
        T value{};
        auto res = std::from_chars(raw->data(), raw->data() + raw->size(), value);
        if (res.ec != std::errc() || res.ptr != raw->data() + raw->size()) {
            return Error{ErrorCode::InvalidArgument,
                         "invalid number for " + key + ": '" + *raw + "'"};
        }
        out = value;
        return {};
    }

    template <typename T> Result<void> optionalNumber(const std::string& key,
                                                      std::optional<T>& out) const {
        if (!find(key))
            return {};
        T value{};
        auto r = number(key, value);
        if (!r)
            return r;
        out = value;
        return {};
    }

    Result<void> boolean(const std::string& key, bool& out) const {
        const auto* raw = find(key);
        if (!raw)
            return {};
        std::string lower = *raw;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            out = true;
        } else if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            out = false;
        } else {
            return Error{ErrorCode::InvalidArgument,
                         "invalid boolean for " + key + ": '" + *raw + "'"};
        }
        return {};
    }

    void string(const std::string& key, std::string& out) const {
        if (const auto* raw = find(key))
            out = *raw;
    }

    void path(const std::string& key, std::filesystem::path& out) const {
        if (const auto* raw = find(key); raw && !raw->empty())
            out = expand_tilde(*raw);
    }

private:
    const std::map<std::string, std::string>& values_;
};

std::filesystem::path underDataDir(const std::filesystem::path& dataDir,
                                   const std::filesystem::path& p) {
    if (p.empty() || p.is_absolute())
        return p;
    return dataDir / p;
}

bool isKnownLevel(const std::string& level) {
    static const char* const kLevels[] = {"trace", "debug", "info",     "warn",
                                          "error", "critical", "off"};
    return std::find(std::begin(kLevels), std::end(kLevels), level) != std::end(kLevels);
}

} // namespace

Result<AppConfig> buildAppConfig(const std::map<std::string, std::string>& values) {
    Reader in(values);
    AppConfig cfg;
    auto& d = cfg.downloads;

    cfg.dataDir = get_data_dir();
    in.path("downloads.data_dir", cfg.dataDir);
    if (const char* env = std::getenv("FETCHD_DATA_DIR"); env && *env) {
        cfg.dataDir = expand_tilde(env);
    }

    d.cacheDir = get_cache_dir() / "downloads";
    in.path("downloads.cache_dir", d.cacheDir);
    d.cacheDir = underDataDir(cfg.dataDir, d.cacheDir);

    d.externalDir = get_download_dir();
    in.path("downloads.external_dir", d.externalDir);
    d.externalDir = underDataDir(cfg.dataDir, d.externalDir);

    d.databasePath = "downloads.db";
    in.path("downloads.database", d.databasePath);
    d.databasePath = underDataDir(cfg.dataDir, d.databasePath);

    in.string("downloads.user_agent", d.userAgent);
    for (const auto& r : {in.number("downloads.max_concurrent_transfers", d.maxConcurrentTransfers),
                          in.number("downloads.max_records", d.maxRecords),
                          in.number("downloads.buffer_size", d.transport.bufferSize),
                          in.number("downloads.min_progress_step", d.minProgressStep),
                          in.number("downloads.min_progress_time_ms", d.minProgressTimeMs),
                          in.number("downloads.max_retries", d.maxRetries),
                          in.number("downloads.max_redirects", d.maxRedirects),
                          in.number("downloads.retry_first_delay_s", d.retryFirstDelaySec),
                          in.number("downloads.min_retry_after_s", d.minRetryAfterSec),
                          in.number("downloads.max_retry_after_s", d.maxRetryAfterSec),
                          in.number("downloads.network_recheck_ms", d.networkRecheckMs)}) {
        if (!r)
            return r.error();
    }

    if (d.maxConcurrentTransfers == 0) {
        return Error{ErrorCode::InvalidArgument, "downloads.max_concurrent_transfers must be > 0"};
    }
    if (d.minRetryAfterSec > d.maxRetryAfterSec) {
        return Error{ErrorCode::InvalidArgument,
                     "downloads.min_retry_after_s exceeds downloads.max_retry_after_s"};
    }

    long long connectMs = d.transport.connectTimeout.count();
    long long ioMs = d.transport.ioTimeout.count();
    for (const auto& r :
         {in.optionalNumber("network.max_bytes_over_mobile", d.limits.maxBytesOverMobile),
          in.optionalNumber("network.recommended_max_bytes_over_mobile",
                            d.limits.recommendedMaxBytesOverMobile),
          in.number("network.connect_timeout_ms", connectMs),
          in.number("network.io_timeout_ms", ioMs),
          in.boolean("network.insecure", d.transport.insecure)}) {
        if (!r)
            return r.error();
    }
    d.transport.connectTimeout = std::chrono::milliseconds(connectMs);
    d.transport.ioTimeout = std::chrono::milliseconds(ioMs);

    if (const auto* proxy = in.find("network.proxy"); proxy && !proxy->empty()) {
        d.transport.proxy = *proxy;
    }
    in.string("network.ca_path", d.transport.caPath);

    in.string("logging.level", cfg.logging.level);
    if (const char* env = std::getenv("FETCHD_LOG_LEVEL"); env && *env) {
        cfg.logging.level = env;
    }
    if (!isKnownLevel(cfg.logging.level)) {
        return Error{ErrorCode::InvalidArgument, "unknown log level '" + cfg.logging.level + "'"};
    }
    in.path("logging.file", cfg.logging.file);
    cfg.logging.file = underDataDir(cfg.dataDir, cfg.logging.file);

    return cfg;
}

Result<AppConfig> loadAppConfig(const std::string& overridePath) {
    const bool explicitPath = !overridePath.empty() || std::getenv("FETCHD_CONFIG") != nullptr;
    const auto path = get_config_path(overridePath);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (explicitPath) {
            return Error{ErrorCode::FileNotFound, "config file not found: " + path.string()};
        }
        spdlog::debug("No config at {}, using defaults", path.string());
        return buildAppConfig({});
    }

    spdlog::debug("Loading config from {}", path.string());
    return buildAppConfig(parse_toml_flat(path));
}

} // namespace fetchd::config
