#include <routelog/reader/reader_config.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace routelog {

bool parse_bool(const std::string &value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

ReaderConfig ReaderConfig::from_env() {
    ReaderConfig config;
    if (const char *cache = std::getenv(constants::env::CACHE)) {
        config.cache_enabled = parse_bool(cache);
    }
    if (const char *dir = std::getenv(constants::env::CACHE_DIR)) {
        config.cache_dir = dir;
    }
    if (const char *api = std::getenv(constants::env::API)) {
        if (*api != '\0') config.api_url = api;
    }
    return config;
}

fs::path ReaderConfig::resolved_cache_dir() const {
    if (!cache_dir.empty()) {
        return fs::path(cache_dir);
    }
    return utils::home_directory() / constants::cache::DEFAULT_DIR_NAME;
}

}  // namespace routelog
