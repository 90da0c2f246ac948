#ifndef ROUTELOG_READER_READER_CONFIG_H
#define ROUTELOG_READER_READER_CONFIG_H

#include <routelog/common/constants.h>
#include <routelog/utils/filesystem.h>

#include <chrono>
#include <string>

namespace routelog {

/**
 * Process level settings for fetching. Built once (usually from the
 * environment) and handed to readers explicitly.
 */
struct ReaderConfig {
    bool cache_enabled = false;
    // empty means $HOME/.routelog_cache
    std::string cache_dir;
    std::string api_url = constants::backend::DEFAULT_API_HOST;
    std::chrono::seconds fetch_timeout{
        constants::fetch::DEFAULT_TIMEOUT_SECONDS};
    int retry_attempts = constants::fetch::DEFAULT_RETRY_ATTEMPTS;
    std::chrono::milliseconds retry_delay{
        constants::fetch::DEFAULT_RETRY_DELAY_MS};
    // probe remote files with HEAD before selecting a source
    bool validate_files = false;

    /**
     * Read ROUTELOG_CACHE, ROUTELOG_CACHE_DIR and ROUTELOG_API
     */
    static ReaderConfig from_env();

    fs::path resolved_cache_dir() const;
};

/**
 * "1", "true", "yes", "on" (any case) are true; everything else false
 */
bool parse_bool(const std::string &value);

}  // namespace routelog

#endif  // ROUTELOG_READER_READER_CONFIG_H
