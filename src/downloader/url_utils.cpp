#include <fetchd/downloader/url_utils.h>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace fetchd::downloader {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* u) const noexcept { curl_url_cleanup(u); }
};

struct CurlStringDeleter {
    void operator()(char* s) const noexcept { curl_free(s); }
};

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<std::string> resolveUrl(std::string_view base, std::string_view reference) {
    std::unique_ptr<CURLU, CurlUrlDeleter> handle{curl_url()};
    if (!handle) {
        return std::nullopt;
    }
    const std::string baseStr{base};
    if (curl_url_set(handle.get(), CURLUPART_URL, baseStr.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    // Setting a relative URL on a handle that already holds one resolves it against the base.
    const std::string refStr{reference};
    if (curl_url_set(handle.get(), CURLUPART_URL, refStr.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }
    char* out = nullptr;
    if (curl_url_get(handle.get(), CURLUPART_URL, &out, 0) != CURLUE_OK || out == nullptr) {
        return std::nullopt;
    }
    std::unique_ptr<char, CurlStringDeleter> owned{out};
    return std::string{owned.get()};
}

std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hexValue(in[i + 1]);
            const int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

std::string lastPathSegment(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    // Skip scheme and authority
    if (auto scheme = url.find("://"); scheme != std::string_view::npos) {
        auto pathStart = url.find('/', scheme + 3);
        if (pathStart == std::string_view::npos) {
            return {};
        }
        url = url.substr(pathStart);
    }
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    auto slash = url.rfind('/');
    return std::string{slash == std::string_view::npos ? url : url.substr(slash + 1)};
}

bool isHttpUrl(std::string_view url) {
    auto lower = [](std::string_view s) {
        std::string out{s};
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    };
    const auto prefix = lower(url.substr(0, std::min<std::size_t>(url.size(), 8)));
    return prefix.rfind("http://", 0) == 0 || prefix.rfind("https://", 0) == 0;
}

} // namespace fetchd::downloader
