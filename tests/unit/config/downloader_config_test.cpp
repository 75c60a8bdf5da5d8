#include <gtest/gtest.h>

#include <fetchd/config/config_helpers.h>
#include <fetchd/config/downloader_config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include <unistd.h>

using namespace fetchd;
using namespace fetchd::config;
namespace fs = std::filesystem;

namespace {

class DownloaderConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("FETCHD_DATA_DIR");
        ::unsetenv("FETCHD_LOG_LEVEL");
        ::unsetenv("FETCHD_CONFIG");
        dir_ = fs::temp_directory_path() / ("fetchd-config-test-" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        ::unsetenv("FETCHD_DATA_DIR");
        ::unsetenv("FETCHD_LOG_LEVEL");
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path writeConfig(const std::string& text) {
        auto p = dir_ / "config.toml";
        std::ofstream out(p);
        out << text;
        return p;
    }

    fs::path dir_;
};

} // namespace

TEST_F(DownloaderConfigTest, DefaultsWithoutAnyKeys) {
    auto cfg = buildAppConfig({{"downloads.data_dir", dir_.string()}});
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& d = cfg.value().downloads;

    EXPECT_EQ(cfg.value().dataDir, dir_);
    EXPECT_EQ(d.databasePath, dir_ / "downloads.db");
    EXPECT_EQ(d.maxConcurrentTransfers, 4u);
    EXPECT_EQ(d.maxRetries, 5);
    EXPECT_EQ(d.maxRedirects, 5);
    EXPECT_EQ(d.minRetryAfterSec, 30);
    EXPECT_EQ(d.maxRetryAfterSec, 86400);
    EXPECT_EQ(d.networkRecheckMs, 30000);
    EXPECT_FALSE(d.limits.maxBytesOverMobile.has_value());
    EXPECT_FALSE(d.transport.proxy.has_value());
    EXPECT_EQ(cfg.value().logging.level, "info");
    EXPECT_TRUE(cfg.value().logging.file.empty());
}

TEST_F(DownloaderConfigTest, ReadsEveryKnownKey) {
    std::map<std::string, std::string> values = {
        {"downloads.data_dir", dir_.string()},
        {"downloads.database", "state/dl.db"},
        {"downloads.cache_dir", "/var/tmp/fetchd-cache"},
        {"downloads.external_dir", "public"},
        {"downloads.max_concurrent_transfers", "2"},
        {"downloads.max_records", "50"},
        {"downloads.user_agent", "agent/2"},
        {"downloads.buffer_size", "8192"},
        {"downloads.min_progress_step", "65536"},
        {"downloads.min_progress_time_ms", "500"},
        {"downloads.max_retries", "3"},
        {"downloads.max_redirects", "7"},
        {"downloads.retry_first_delay_s", "10"},
        {"downloads.min_retry_after_s", "5"},
        {"downloads.max_retry_after_s", "600"},
        {"downloads.network_recheck_ms", "0"},
        {"network.max_bytes_over_mobile", "1000000"},
        {"network.recommended_max_bytes_over_mobile", "500000"},
        {"network.connect_timeout_ms", "1500"},
        {"network.io_timeout_ms", "2500"},
        {"network.insecure", "yes"},
        {"network.proxy", "http://proxy:3128"},
        {"network.ca_path", "/etc/ssl/ca.pem"},
        {"logging.level", "debug"},
        {"logging.file", "logs/fetchd.log"},
    };

    auto cfg = buildAppConfig(values);
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& app = cfg.value();
    const auto& d = app.downloads;

    EXPECT_EQ(d.databasePath, dir_ / "state" / "dl.db");
    EXPECT_EQ(d.cacheDir, fs::path("/var/tmp/fetchd-cache"));
    EXPECT_EQ(d.externalDir, dir_ / "public");
    EXPECT_EQ(d.maxConcurrentTransfers, 2u);
    EXPECT_EQ(d.maxRecords, 50u);
    EXPECT_EQ(d.userAgent, "agent/2");
    EXPECT_EQ(d.transport.bufferSize, 8192u);
    EXPECT_EQ(d.minProgressStep, 65536);
    EXPECT_EQ(d.minProgressTimeMs, 500);
    EXPECT_EQ(d.maxRetries, 3);
    EXPECT_EQ(d.maxRedirects, 7);
    EXPECT_EQ(d.retryFirstDelaySec, 10);
    EXPECT_EQ(d.minRetryAfterSec, 5);
    EXPECT_EQ(d.maxRetryAfterSec, 600);
    EXPECT_EQ(d.networkRecheckMs, 0);
    EXPECT_EQ(d.limits.maxBytesOverMobile.value_or(0), 1000000);
    EXPECT_EQ(d.limits.recommendedMaxBytesOverMobile.value_or(0), 500000);
    EXPECT_EQ(d.transport.connectTimeout.count(), 1500);
    EXPECT_EQ(d.transport.ioTimeout.count(), 2500);
    EXPECT_TRUE(d.transport.insecure);
    EXPECT_EQ(d.transport.proxy.value_or(""), "http://proxy:3128");
    EXPECT_EQ(d.transport.caPath, "/etc/ssl/ca.pem");
    EXPECT_EQ(app.logging.level, "debug");
    EXPECT_EQ(app.logging.file, dir_ / "logs" / "fetchd.log");
}

TEST_F(DownloaderConfigTest, InvalidNumberNamesTheKey) {
    auto cfg = buildAppConfig({{"downloads.max_retries", "many"}});
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(cfg.error().message.find("downloads.max_retries"), std::string::npos);
}

TEST_F(DownloaderConfigTest, InvalidBoolean) {
    auto cfg = buildAppConfig({{"network.insecure", "maybe"}});
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().message.find("network.insecure"), std::string::npos);
}

TEST_F(DownloaderConfigTest, RejectsInconsistentValues) {
    EXPECT_FALSE(buildAppConfig({{"downloads.max_concurrent_transfers", "0"}}));
    EXPECT_FALSE(
        buildAppConfig({{"downloads.min_retry_after_s", "100"}, {"downloads.max_retry_after_s", "10"}}));
    EXPECT_FALSE(buildAppConfig({{"logging.level", "loud"}}));
}

TEST_F(DownloaderConfigTest, EnvironmentOverridesFile) {
    ::setenv("FETCHD_DATA_DIR", dir_.c_str(), 1);
    ::setenv("FETCHD_LOG_LEVEL", "warn", 1);

    auto cfg = buildAppConfig({{"downloads.data_dir", "/elsewhere"}, {"logging.level", "debug"}});
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().dataDir, dir_);
    EXPECT_EQ(cfg.value().downloads.databasePath, dir_ / "downloads.db");
    EXPECT_EQ(cfg.value().logging.level, "warn");
}

TEST_F(DownloaderConfigTest, ParsesFlatToml) {
    auto path = writeConfig(R"(# fetchd configuration
top = "level"

[downloads]
max_concurrent_transfers = 3   # inline comment
user_agent = "agent # not a comment"
external_dir = '~/Public'

[ network ]
insecure = false
)");

    auto values = parse_toml_flat(path);
    EXPECT_EQ(values["top"], "level");
    EXPECT_EQ(values["downloads.max_concurrent_transfers"], "3");
    EXPECT_EQ(values["downloads.user_agent"], "agent # not a comment");
    EXPECT_EQ(values["downloads.external_dir"], "~/Public");
    EXPECT_EQ(values["network.insecure"], "false");

    EXPECT_TRUE(parse_toml_flat(dir_ / "missing.toml").empty());
}

TEST_F(DownloaderConfigTest, LoadsExplicitFile) {
    auto path = writeConfig("[downloads]\ndata_dir = \"" + dir_.string() +
                            "\"\nmax_concurrent_transfers = 6\n");
    auto cfg = loadAppConfig(path.string());
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().downloads.maxConcurrentTransfers, 6u);
}

TEST_F(DownloaderConfigTest, MissingExplicitFileIsAnError) {
    auto cfg = loadAppConfig((dir_ / "nope.toml").string());
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::FileNotFound);

    ::setenv("FETCHD_CONFIG", (dir_ / "nope.toml").c_str(), 1);
    auto viaEnv = loadAppConfig();
    ::unsetenv("FETCHD_CONFIG");
    ASSERT_FALSE(viaEnv);
    EXPECT_EQ(viaEnv.error().code, ErrorCode::FileNotFound);
}

TEST_F(DownloaderConfigTest, ConfigPathResolution) {
    EXPECT_EQ(get_config_path("/explicit/c.toml"), fs::path("/explicit/c.toml"));

    ::setenv("FETCHD_CONFIG", "/from/env.toml", 1);
    EXPECT_EQ(get_config_path(), fs::path("/from/env.toml"));
    ::unsetenv("FETCHD_CONFIG");

    EXPECT_EQ(get_config_path(), get_config_dir() / "config.toml");
}

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  padded\t";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
}

TEST(ConfigHelpersTest, ExpandTilde) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(expand_tilde("~"), fs::path(home));
    EXPECT_EQ(expand_tilde("~/x/y"), fs::path(home) / "x/y");
    EXPECT_EQ(expand_tilde("/abs"), fs::path("/abs"));
}
