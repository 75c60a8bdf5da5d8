#include <fstream>
#include <fetchd/config/config_helpers.h>

namespace fetchd::config {

namespace {

// Strip a trailing # comment that is not inside a quoted string.
std::string stripComment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::filesystem::path homeRelative(const char* xdgVar, const char* fallback) {
    if (const char* xdg = std::getenv(xdgVar); xdg && *xdg) {
        return std::filesystem::path(xdg) / "fetchd";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / fallback / "fetchd";
    }
    return std::filesystem::current_path() / ".fetchd";
}

} // namespace

std::map<std::string, std::string> parse_toml_flat(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file)
        return config;

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        line = stripComment(line);
        trim(line);
        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = line.substr(1, line.size() - 2);
            trim(currentSection);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = unquote(line.substr(eq + 1));
        if (currentSection.empty()) {
            config[key] = value;
        } else {
            config[currentSection + "." + key] = value;
        }
    }
    return config;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("FETCHD_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_config_dir() {
    return homeRelative("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "fetchd";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "fetchd";
    }
    return std::filesystem::current_path() / ".fetchd";
}

std::filesystem::path get_cache_dir() {
    return homeRelative("XDG_CACHE_HOME", ".cache");
}

std::filesystem::path get_download_dir() {
    if (const char* xdg = std::getenv("XDG_DOWNLOAD_DIR"); xdg && *xdg) {
        return expand_tilde(xdg);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / "Downloads";
    }
    return std::filesystem::current_path() / "Downloads";
}

} // namespace fetchd::config
