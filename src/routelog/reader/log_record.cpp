#include <routelog/common/error.h>
#include <routelog/reader/log_record.h>
#include <routelog/utils/json.h>

namespace routelog {

std::optional<std::string> LogRecord::get(const std::string &pointer) const {
    json::JsonParser parser;
    auto doc = json::parse_json(parser, raw.data(), raw.size());
    return json::find_pointer(doc, pointer);
}

}  // namespace routelog
