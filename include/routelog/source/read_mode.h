#ifndef ROUTELOG_SOURCE_READ_MODE_H
#define ROUTELOG_SOURCE_READ_MODE_H

#include <optional>
#include <string>

namespace routelog {

/**
 * Which file variant to read for each segment.
 * QUICK: compact low-rate log only. FULL: complete log only.
 * AUTO: full log, falling back to the quick log per segment.
 */
enum class ReadMode { QUICK, FULL, AUTO };

/**
 * Suffix letter used in identifiers: 'q', 'r' or 'a'
 */
char read_mode_suffix(ReadMode mode);

/**
 * Parse a suffix letter or name ("q"/"quick", "r"/"full", "a"/"auto").
 * Returns std::nullopt for anything else.
 */
std::optional<ReadMode> read_mode_from_string(const std::string &text);

std::string read_mode_name(ReadMode mode);

}  // namespace routelog

#endif  // ROUTELOG_SOURCE_READ_MODE_H
