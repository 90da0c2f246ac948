#include <routelog/common/constants.h>
#include <routelog/utils/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <string>

namespace routelog::logger {

static constexpr const char *LOGGER_NAME = "routelog";

/**
 * Convert string log level to spdlog level enum, returns false if the name
 * is not a level
 */
static bool string_to_log_level_internal(const std::string &level_str,
                                         spdlog::level::level_enum &level) {
    std::string lower_level = level_str;
    std::transform(lower_level.begin(), lower_level.end(),
                   lower_level.begin(), ::tolower);

    if (lower_level == "trace") {
        level = spdlog::level::trace;
    } else if (lower_level == "debug") {
        level = spdlog::level::debug;
    } else if (lower_level == "info") {
        level = spdlog::level::info;
    } else if (lower_level == "warn" || lower_level == "warning") {
        level = spdlog::level::warn;
    } else if (lower_level == "err" || lower_level == "error") {
        level = spdlog::level::err;
    } else if (lower_level == "critical") {
        level = spdlog::level::critical;
    } else if (lower_level == "off") {
        level = spdlog::level::off;
    } else {
        return false;
    }
    return true;
}

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get(LOGGER_NAME);
        if (!instance) {
            instance = spdlog::stderr_color_mt(LOGGER_NAME);
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

int set_log_level(const std::string &level_str) {
    spdlog::level::level_enum level;
    if (!string_to_log_level_internal(level_str, level)) {
        return -1;
    }
    get()->set_level(level);
    return 0;
}

int set_log_level_int(int level) {
    if (level < 0 || level > 6) {
        return -1;
    }
    get()->set_level(static_cast<spdlog::level::level_enum>(level));
    return 0;
}

std::string get_log_level_string() {
    switch (get()->level()) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "info";
    }
}

int get_log_level_int() { return static_cast<int>(get()->level()); }

void init_from_env() {
    const char *level = std::getenv(constants::env::LOG_LEVEL);
    if (level != nullptr && set_log_level(level) != 0) {
        get()->warn("Ignoring unknown {} value '{}'", constants::env::LOG_LEVEL,
                    level);
    }
}

}  // namespace routelog::logger
