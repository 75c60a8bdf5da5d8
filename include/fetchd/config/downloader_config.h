#pragma once

#include <fetchd/core/types.h>
#include <fetchd/downloader/downloader.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace fetchd::config {

struct LoggingConfig {
    std::string level{"info"};
    std::filesystem::path file;
};

struct AppConfig {
    std::filesystem::path dataDir;
    downloader::DownloaderConfig downloads;
    LoggingConfig logging;
};

/**
 * @brief Build the configuration from parsed "section.key" values.
 *
 * FETCHD_DATA_DIR and FETCHD_LOG_LEVEL override the file. Relative database, cache and log
 * paths are taken relative to the data directory.
 *
 * Errors: InvalidArgument naming the offending key when a value does not parse.
 */
Result<AppConfig> buildAppConfig(const std::map<std::string, std::string>& values);

/**
 * @brief Resolve the config file and load it.
 *
 * A missing file is an error only when it was named explicitly (flag or FETCHD_CONFIG).
 */
Result<AppConfig> loadAppConfig(const std::string& overridePath = "");

} // namespace fetchd::config
