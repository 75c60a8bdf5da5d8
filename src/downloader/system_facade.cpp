/*
 * system_facade.cpp
 *
 * Linux connectivity oracle
 * - An interface counts when /sys/class/net/<if>/operstate reads "up" (or "unknown" with
 *   carrier=1, as tun and some ppp links report) and it is not loopback.
 * - wireless/ or phy80211/ marks Wi-Fi; wwan*, ppp*, rmnet* are mobile; everything else up
 *   is ethernet.
 * - With several links up the best one wins: ethernet, then Wi-Fi, then mobile.
 * - Roaming is not observable from sysfs and is always reported false.
 */

#include <fetchd/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <system_error>

namespace fetchd::downloader {

namespace {

std::string readFirstLine(const fs::path& path) {
    std::ifstream in(path);
    std::string line;
    if (in) {
        std::getline(in, line);
    }
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

bool startsWith(const std::string& s, std::string_view prefix) {
    return s.rfind(prefix, 0) == 0;
}

int rank(NetworkType type) {
    switch (type) {
        case NetworkType::Ethernet:
            return 3;
        case NetworkType::Wifi:
            return 2;
        case NetworkType::Mobile:
            return 1;
        case NetworkType::None:
            break;
    }
    return 0;
}

class LinuxSystemFacade final : public ISystemFacade {
public:
    LinuxSystemFacade(NetworkLimits limits, fs::path netClassRoot)
        : limits_(std::move(limits)), root_(std::move(netClassRoot)) {}

    Millis currentTimeMillis() const override { return fetchd::currentTimeMillis(); }

    NetworkType activeNetworkType() const override {
        std::error_code ec;
        fs::directory_iterator it(root_, ec);
        if (ec) {
            spdlog::debug("[SystemFacade] Cannot list {}: {}", root_.string(), ec.message());
            return NetworkType::None;
        }

        NetworkType best = NetworkType::None;
        for (const auto& entry : it) {
            const auto name = entry.path().filename().string();
            if (name == "lo" || !isUp(entry.path())) {
                continue;
            }
            auto type = classify(entry.path(), name);
            if (rank(type) > rank(best)) {
                best = type;
            }
        }
        return best;
    }

    bool isNetworkRoaming() const override { return false; }

    std::optional<std::int64_t> maxBytesOverMobile() const override {
        return limits_.maxBytesOverMobile;
    }

    std::optional<std::int64_t> recommendedMaxBytesOverMobile() const override {
        return limits_.recommendedMaxBytesOverMobile;
    }

private:
    static bool isUp(const fs::path& dir) {
        const auto state = readFirstLine(dir / "operstate");
        if (state == "up") {
            return true;
        }
        return state == "unknown" && readFirstLine(dir / "carrier") == "1";
    }

    static NetworkType classify(const fs::path& dir, const std::string& name) {
        std::error_code ec;
        if (fs::exists(dir / "wireless", ec) || fs::exists(dir / "phy80211", ec)) {
            return NetworkType::Wifi;
        }
        if (startsWith(name, "wwan") || startsWith(name, "ppp") || startsWith(name, "rmnet")) {
            return NetworkType::Mobile;
        }
        return NetworkType::Ethernet;
    }

    NetworkLimits limits_;
    fs::path root_;
};

} // namespace

std::unique_ptr<ISystemFacade> makeLinuxSystemFacade(NetworkLimits limits, fs::path netClassRoot) {
    return std::make_unique<LinuxSystemFacade>(std::move(limits), std::move(netClassRoot));
}

} // namespace fetchd::downloader
