#ifndef ROUTELOG_ROUTE_IDENTIFIER_H
#define ROUTELOG_ROUTE_IDENTIFIER_H

#include <routelog/route/range_selector.h>
#include <routelog/route/route.h>
#include <routelog/source/read_mode.h>

#include <optional>
#include <string>
#include <string_view>

namespace routelog {

/**
 * A route identifier split into its parts
 */
struct ParsedIdentifier {
    Route route;
    RangeSelector selector;
    std::optional<ReadMode> mode;
};

/**
 * Result of unwrapping a web URL that embeds a route in its query string
 */
struct IndirectIdentifier {
    std::string identifier;
    bool is_indirect;
};

/**
 * Unwrap "https://host/?onebox=<route>" and "https://host/?route=<route>"
 * URLs. Anything else is returned unchanged with is_indirect == false.
 */
IndirectIdentifier parse_indirect(const std::string &identifier);

/**
 * Parse "dongle|name[--N]" or "dongle/name[/selector][/q|r|a]" (after
 * unwrapping URLs). Throws ParseError on any grammar violation.
 */
ParsedIdentifier parse_identifier(const std::string &identifier);

/**
 * True for http(s):// and file:// references and for existing local paths.
 * Such identifiers name a log file directly and bypass route parsing.
 */
bool is_direct_reference(const std::string &identifier);

/**
 * Decode %XX escapes and '+' in a URL query value
 */
std::string percent_decode(std::string_view text);

}  // namespace routelog

#endif  // ROUTELOG_ROUTE_IDENTIFIER_H
