#include <routelog/common/error.h>
#include <routelog/utils/json.h>

namespace routelog::json {

JsonDocument parse_json(JsonParser &parser, const char *data,
                        std::size_t size) {
    auto result = parser.parse(data, size);
    if (result.error()) {
        throw DecodeError(std::string("malformed JSON: ") +
                          simdjson::error_message(result.error()));
    }
    return result.value();
}

std::vector<std::string_view> split_lines(std::string_view data) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < data.size()) {
        std::size_t end = data.find('\n', start);
        if (end == std::string_view::npos) end = data.size();
        std::string_view line = data.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::string get_string_field(const JsonDocument &doc, const std::string &key) {
    std::string_view value;
    if (doc[key].get(value) == simdjson::SUCCESS) {
        return std::string(value);
    }
    return "";
}

std::uint64_t get_uint64_field(const JsonDocument &doc,
                               const std::string &key) {
    std::uint64_t value = 0;
    if (doc[key].get(value) == simdjson::SUCCESS) {
        return value;
    }
    return 0;
}

std::optional<std::int64_t> find_int64_field(const JsonDocument &doc,
                                             const std::string &key) {
    std::int64_t value = 0;
    if (doc[key].get(value) == simdjson::SUCCESS) {
        return value;
    }
    return std::nullopt;
}

std::vector<std::optional<std::string>> get_string_array_field(
    const JsonDocument &doc, const std::string &key) {
    std::vector<std::optional<std::string>> out;
    simdjson::dom::array array;
    if (doc[key].get(array) != simdjson::SUCCESS) {
        return out;
    }
    for (auto element : array) {
        std::string_view value;
        if (element.get(value) == simdjson::SUCCESS) {
            out.emplace_back(std::string(value));
        } else {
            out.emplace_back(std::nullopt);
        }
    }
    return out;
}

std::optional<std::string> find_pointer(const JsonDocument &doc,
                                        const std::string &pointer) {
    simdjson::dom::element element;
    if (doc.at_pointer(pointer).get(element) != simdjson::SUCCESS) {
        return std::nullopt;
    }
    std::string_view value;
    if (element.get(value) == simdjson::SUCCESS) {
        return std::string(value);
    }
    return simdjson::minify(element);
}

}  // namespace routelog::json
