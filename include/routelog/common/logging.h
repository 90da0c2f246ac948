#ifndef ROUTELOG_COMMON_LOGGING_H
#define ROUTELOG_COMMON_LOGGING_H

#include <routelog/utils/logger.h>
#include <spdlog/spdlog.h>

// fmt-style format strings, e.g. ROUTELOG_LOG_DEBUG("fetched {} bytes", n)
#define ROUTELOG_INTERNAL_LOG(level, ...)                                   \
    ::routelog::logger::get()->log(                                         \
        spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, (level), \
        __VA_ARGS__)

#define ROUTELOG_LOGGER_INIT() ::routelog::logger::init_from_env()
#define ROUTELOG_LOGGER_LEVEL(level) ::routelog::logger::set_log_level(level)

#define ROUTELOG_LOG_TRACE(...) \
    ROUTELOG_INTERNAL_LOG(spdlog::level::trace, __VA_ARGS__)
#define ROUTELOG_LOG_DEBUG(...) \
    ROUTELOG_INTERNAL_LOG(spdlog::level::debug, __VA_ARGS__)
#define ROUTELOG_LOG_INFO(...) \
    ROUTELOG_INTERNAL_LOG(spdlog::level::info, __VA_ARGS__)
#define ROUTELOG_LOG_WARN(...) \
    ROUTELOG_INTERNAL_LOG(spdlog::level::warn, __VA_ARGS__)
#define ROUTELOG_LOG_ERROR(...) \
    ROUTELOG_INTERNAL_LOG(spdlog::level::err, __VA_ARGS__)

#endif  // ROUTELOG_COMMON_LOGGING_H
