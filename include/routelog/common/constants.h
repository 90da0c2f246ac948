#ifndef ROUTELOG_COMMON_CONSTANTS_H
#define ROUTELOG_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace routelog::constants {
namespace decoder {
static constexpr std::size_t INFLATE_BUFFER_SIZE = 65536;  // 64KB
static constexpr int ZLIB_GZIP_WINDOW_BITS = 31;           // 15 + 16 for gzip
static constexpr int ZLIB_WINDOW_BITS = 15;
static constexpr int ZLIB_RAW_WINDOW_BITS = -15;
}  // namespace decoder

namespace fetch {
static constexpr long DEFAULT_TIMEOUT_SECONDS = 60;
static constexpr int DEFAULT_RETRY_ATTEMPTS = 3;
static constexpr long DEFAULT_RETRY_DELAY_MS = 500;
static constexpr std::size_t FILE_IO_BUFFER_SIZE = 262144;  // 256KB
}  // namespace fetch

namespace backend {
static constexpr const char *DEFAULT_API_HOST = "https://api.commadotai.com";
static constexpr const char *ROUTE_ENDPOINT = "/v1/route/";
static constexpr const char *FILES_SUFFIX = "/files";
static constexpr const char *MAX_SEGMENT_FIELD = "maxqlog";
static constexpr const char *FULL_LOGS_FIELD = "logs";
static constexpr const char *QUICK_LOGS_FIELD = "qlogs";
// upper bound on segments per route accepted from the backend
static constexpr std::int64_t MAX_SEGMENTS = 100000;
}  // namespace backend

namespace cache {
static constexpr const char *DEFAULT_DIR_NAME = ".routelog_cache";
static constexpr const char *TEMP_SUFFIX = ".tmp";
}  // namespace cache

namespace env {
static constexpr const char *CACHE = "ROUTELOG_CACHE";
static constexpr const char *CACHE_DIR = "ROUTELOG_CACHE_DIR";
static constexpr const char *API = "ROUTELOG_API";
static constexpr const char *LOG_LEVEL = "ROUTELOG_LOG_LEVEL";
}  // namespace env
}  // namespace routelog::constants

#endif  // ROUTELOG_COMMON_CONSTANTS_H
