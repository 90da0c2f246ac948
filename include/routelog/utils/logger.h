#ifndef ROUTELOG_UTILS_LOGGER_H
#define ROUTELOG_UTILS_LOGGER_H

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace routelog::logger {

/**
 * Get the "routelog" spdlog logger, creating it (stderr sink) on first use
 */
std::shared_ptr<spdlog::logger> get();

/**
 * Set the log level for the library
 * @param level_str String representation of log level (case insensitive)
 *                  Valid values: "trace", "debug", "info", "warn"/"warning",
 *                  "err"/"error", "critical", "off"
 * @return 0 on success, -1 on failure
 */
int set_log_level(const std::string &level_str);

/**
 * Set the log level for the library
 * @param level Integer representation of log level:
 *              0=trace, 1=debug, 2=info, 3=warn, 4=error, 5=critical, 6=off
 * @return 0 on success, -1 if level is out of range
 */
int set_log_level_int(int level);

/**
 * Get the log level of the library as a string
 */
std::string get_log_level_string();

/**
 * Get the log level of the library as an integer (0-6)
 */
int get_log_level_int();

/**
 * Apply ROUTELOG_LOG_LEVEL from the environment, if set
 */
void init_from_env();

}  // namespace routelog::logger

#endif  // ROUTELOG_UTILS_LOGGER_H
