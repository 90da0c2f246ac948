#ifndef ROUTELOG_UTILS_JSON_H
#define ROUTELOG_UTILS_JSON_H

#include <simdjson.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace routelog::json {
using JsonParser = simdjson::dom::parser;
using JsonDocument = simdjson::dom::element;

/**
 * Parse one JSON document. The result is only valid until the parser is
 * reused. Throws DecodeError on malformed input.
 */
JsonDocument parse_json(JsonParser &parser, const char *data,
                        std::size_t size);

/**
 * Split a buffer into lines, skipping empty ones (handles "\n" and "\r\n")
 */
std::vector<std::string_view> split_lines(std::string_view data);

std::string get_string_field(const JsonDocument &doc, const std::string &key);
std::uint64_t get_uint64_field(const JsonDocument &doc, const std::string &key);
std::optional<std::int64_t> find_int64_field(const JsonDocument &doc,
                                             const std::string &key);

/**
 * Array of strings; null entries come back as std::nullopt
 */
std::vector<std::optional<std::string>> get_string_array_field(
    const JsonDocument &doc, const std::string &key);

/**
 * Look up a value with a JSON pointer ("/carParams/carFingerprint") and
 * return it as a string (strings unquoted, everything else minified JSON)
 */
std::optional<std::string> find_pointer(const JsonDocument &doc,
                                        const std::string &pointer);
}  // namespace routelog::json

#endif  // ROUTELOG_UTILS_JSON_H
