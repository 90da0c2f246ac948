#ifndef ROUTELOG_READER_LOG_RECORD_H
#define ROUTELOG_READER_LOG_RECORD_H

#include <cstdint>
#include <optional>
#include <string>

namespace routelog {

/**
 * One decoded log message. `which` is the message type used by
 * LogReader::first and LogReader::filter; `raw` holds the full record as a
 * single JSON object.
 */
struct LogRecord {
    std::string which;
    std::uint64_t log_mono_time = 0;
    std::string raw;

    /**
     * Field lookup by JSON pointer, e.g. "/carParams/carFingerprint".
     * Strings are returned unquoted, other values as minified JSON.
     */
    std::optional<std::string> get(const std::string &pointer) const;

    bool operator==(const LogRecord &other) const {
        return which == other.which && log_mono_time == other.log_mono_time &&
               raw == other.raw;
    }
};

}  // namespace routelog

#endif  // ROUTELOG_READER_LOG_RECORD_H
