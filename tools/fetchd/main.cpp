#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <fetchd/config/config_helpers.h>
#include <fetchd/config/downloader_config.h>
#include <fetchd/downloader/download_control.h>
#include <fetchd/downloader/download_scheduler.h>
#include <fetchd/storage/download_store.h>

namespace {

using namespace fetchd;
using namespace fetchd::downloader;
using json = nlohmann::json;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

struct AddOptions {
    std::string url;
    std::string hint;
    std::string mime;
    std::string destination{"external"};
    std::vector<std::string> headers;
    std::string owner{"fetchd-cli"};
    std::string title;
    bool wifiOnly{false};
    bool noRoaming{false};
    bool hidden{false};
    bool notifyCompleted{false};
};

struct ListOptions {
    std::string owner;
    bool json{false};
};

struct RunOptions {
    bool untilIdle{false};
    int pollMs{5000};
};

void setupLogging(const config::LoggingConfig& logging) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logging.file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(logging.file.parent_path(), ec);
        // 5 MiB per file, three rotated files kept
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logging.file.string(), 5 * 1024 * 1024, 3));
    }
    auto logger = std::make_shared<spdlog::logger>("fetchd", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(logging.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

Result<Header> parseHeader(const std::string& raw) {
    auto colon = raw.find(':');
    if (colon == std::string::npos || colon == 0) {
        return Error{ErrorCode::InvalidArgument, "header must look like 'Name: value': " + raw};
    }
    std::string name = raw.substr(0, colon);
    std::string value = raw.substr(colon + 1);
    config::trim(name);
    config::trim(value);
    return Header{name, value};
}

Destination parseDestination(const std::string& name) {
    if (name == "cache")
        return Destination::Cache;
    if (name == "file")
        return Destination::FileUri;
    return Destination::External;
}

int reportError(const Error& err) {
    std::cerr << "error: " << err.message << std::endl;
    return 1;
}

int cmdAdd(DownloadControl& control, const AddOptions& opts) {
    DownloadRequest request;
    request.uri = opts.url;
    request.hint = opts.hint;
    request.mimeType = opts.mime;
    request.destination = parseDestination(opts.destination);
    request.owner = opts.owner;
    request.title = opts.title.empty() ? opts.url : opts.title;
    request.mode = RequestMode::Public;
    request.allowRoaming = !opts.noRoaming;
    if (opts.wifiOnly) {
        request.allowedNetworkTypes = network_flags::Wifi;
    }
    if (opts.hidden) {
        request.visibility = Visibility::Hidden;
    } else if (opts.notifyCompleted) {
        request.visibility = Visibility::VisibleNotifyCompleted;
    }
    for (const auto& raw : opts.headers) {
        auto header = parseHeader(raw);
        if (!header)
            return reportError(header.error());
        request.headers.push_back(header.value());
    }

    auto id = control.enqueue(request);
    if (!id)
        return reportError(id.error());
    std::cout << id.value() << std::endl;
    return 0;
}

json toJson(const DownloadInfo& info) {
    return json{{"id", info.id},
                {"uri", info.uri},
                {"status", info.status},
                {"status_name", status::toString(info.status)},
                {"paused", info.control == Control::Paused},
                {"filename", info.filename},
                {"mime_type", info.mimeType},
                {"current_bytes", info.currentBytes},
                {"total_bytes", info.totalBytes},
                {"num_failed", info.numFailed},
                {"owner", info.owner},
                {"title", info.title},
                {"last_modified", info.lastModified}};
}

int cmdList(DownloadControl& control, const ListOptions& opts) {
    auto rows = opts.owner.empty() ? control.list() : control.list(opts.owner);
    if (!rows)
        return reportError(rows.error());

    if (opts.json) {
        json out = json::array();
        for (const auto& info : rows.value()) {
            out.push_back(toJson(info));
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    for (const auto& info : rows.value()) {
        std::string progress = std::to_string(info.currentBytes);
        if (info.totalBytes >= 0) {
            progress += "/" + std::to_string(info.totalBytes);
        }
        std::cout << fmt::format("{:>6}  {:<22} {:>21}  {}{}", info.id,
                                 status::toString(info.status), progress, info.uri,
                                 info.control == Control::Paused ? "  (paused)" : "")
                  << std::endl;
        if (!info.filename.empty()) {
            std::cout << fmt::format("{:>8}-> {}", "", info.filename) << std::endl;
        }
    }
    return 0;
}

int cmdRun(const config::AppConfig& cfg, IDownloadStore& store, const RunOptions& opts) {
    auto http = makeCurlHttpAdapter(cfg.downloads.transport);
    auto system = makeLinuxSystemFacade(cfg.downloads.limits);
    auto sink = makeLoggingCompletionSink([](const CompletionEvent& ev) {
        std::cout << fmt::format("{} {}", ev.id, status::toString(ev.status)) << std::endl;
    });

    DownloadScheduler scheduler(cfg.downloads, store, *http, *system, *sink);
    if (auto started = scheduler.start(); !started)
        return reportError(started.error());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // Other processes change the store without our listener seeing it.
    auto lastPoll = std::chrono::steady_clock::now();
    const auto pollInterval = std::chrono::milliseconds(std::max(opts.pollMs, 100));
    while (g_running) {
        if (opts.untilIdle) {
            if (scheduler.waitForIdle(std::chrono::milliseconds(250))) {
                spdlog::info("No more work, exiting");
                break;
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
        if (std::chrono::steady_clock::now() - lastPoll >= pollInterval) {
            scheduler.requestUpdate();
            lastPoll = std::chrono::steady_clock::now();
        }
    }

    scheduler.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"fetchd - background download manager"};
    app.require_subcommand(1);

    std::string configPath;
    std::string logLevel;
    std::string logFile;
    app.add_option("-c,--config", configPath, "Config file (default: FETCHD_CONFIG or XDG)");
    app.add_option("-l,--log-level", logLevel, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--log-file", logFile, "Rotating log file");

    AddOptions addOpts;
    auto* add = app.add_subcommand("add", "Queue a download and print its id");
    add->add_option("url", addOpts.url, "http(s) URL")->required();
    add->add_option("--hint", addOpts.hint, "Preferred file name, or the path for --to file");
    add->add_option("--mime", addOpts.mime, "Expected MIME type");
    add->add_option("--to", addOpts.destination, "Destination kind")
        ->check(CLI::IsMember({"external", "cache", "file"}))
        ->default_val("external");
    add->add_option("-H,--header", addOpts.headers, "Extra request header 'Name: value'");
    add->add_option("--owner", addOpts.owner, "Owner identity")->default_val("fetchd-cli");
    add->add_option("--title", addOpts.title, "Title shown in listings");
    add->add_flag("--wifi-only", addOpts.wifiOnly, "Never use mobile networks");
    add->add_flag("--no-roaming", addOpts.noRoaming, "Never use roaming networks");
    add->add_flag("--hidden", addOpts.hidden, "Hide from notifications");
    add->add_flag("--notify-completed", addOpts.notifyCompleted,
                  "Keep a notification after completion");

    ListOptions listOpts;
    auto* list = app.add_subcommand("list", "List downloads");
    list->add_option("--owner", listOpts.owner, "Only downloads of this owner");
    list->add_flag("--json", listOpts.json, "Print JSON");

    DownloadId controlId = 0;
    auto* pause = app.add_subcommand("pause", "Pause a download");
    auto* resume = app.add_subcommand("resume", "Resume a paused download");
    auto* cancel = app.add_subcommand("cancel", "Cancel and remove a download");
    auto* restart = app.add_subcommand("restart", "Restart a finished download");
    auto* allowMobile = app.add_subcommand(
        "allow-mobile", "Let a download exceed the recommended size over mobile data");
    for (auto* sub : {pause, resume, cancel, restart, allowMobile}) {
        sub->add_option("id", controlId, "Download id")->required();
    }

    RunOptions runOpts;
    auto* run = app.add_subcommand("run", "Run the scheduler");
    run->add_flag("--until-idle", runOpts.untilIdle, "Exit once nothing is left to do");
    run->add_option("--poll-ms", runOpts.pollMs, "Store re-read interval")->default_val(5000);

    CLI11_PARSE(app, argc, argv);

    auto cfg = config::loadAppConfig(configPath);
    if (!cfg)
        return reportError(cfg.error());
    auto appConfig = std::move(cfg).value();
    if (!logLevel.empty())
        appConfig.logging.level = logLevel;
    if (!logFile.empty())
        appConfig.logging.file = logFile;

    try {
        setupLogging(appConfig.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    try {
        auto store = storage::makeSqliteDownloadStore(appConfig.downloads.databasePath);
        if (!store)
            return reportError(store.error());
        auto& db = *store.value();
        DownloadControl control(db);

        if (add->parsed())
            return cmdAdd(control, addOpts);
        if (list->parsed())
            return cmdList(control, listOpts);
        if (run->parsed())
            return cmdRun(appConfig, db, runOpts);

        Result<void> r;
        if (pause->parsed())
            r = control.pause(controlId);
        else if (resume->parsed())
            r = control.resume(controlId);
        else if (cancel->parsed())
            r = control.cancel(controlId);
        else if (restart->parsed())
            r = control.restart(controlId);
        else if (allowMobile->parsed())
            r = control.bypassRecommendedSizeLimit(controlId);
        if (!r)
            return reportError(r.error());
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
