#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fetchd::downloader {

// RFC 3986 reference resolution; nullopt when either side cannot be parsed.
std::optional<std::string> resolveUrl(std::string_view base, std::string_view reference);

// Decodes %XX escapes; malformed escapes are copied through unchanged.
std::string percentDecode(std::string_view in);

// Last non-empty path segment of a URL, without query or fragment.
std::string lastPathSegment(std::string_view url);

bool isHttpUrl(std::string_view url);

} // namespace fetchd::downloader
