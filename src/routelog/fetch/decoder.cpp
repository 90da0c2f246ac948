#include "inflater.h"

#include <routelog/common/constants.h>
#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/fetch/decoder.h>
#include <routelog/utils/json.h>

namespace routelog {

std::vector<LogRecord> JsonLinesDecoder::decode(
    const std::string &bytes) const {
    auto format = Inflater::detect_format(bytes);
    std::string text;
    {
        Inflater inflater;
        if (!inflater.inflate_all(bytes, format, text)) {
            throw DecodeError(inflater.error());
        }
    }

    auto lines = json::split_lines(text);
    std::vector<LogRecord> records;
    records.reserve(lines.size());

    json::JsonParser parser;
    std::size_t line_number = 0;
    for (auto line : lines) {
        ++line_number;
        json::JsonDocument doc;
        try {
            doc = json::parse_json(parser, line.data(), line.size());
        } catch (const DecodeError &e) {
            throw DecodeError("line " + std::to_string(line_number) + ": " +
                              e.what());
        }

        LogRecord record;
        record.which = json::get_string_field(doc, "which");
        if (record.which.empty()) {
            throw DecodeError("line " + std::to_string(line_number) +
                              ": record has no 'which' field");
        }
        record.log_mono_time = json::get_uint64_field(doc, "logMonoTime");
        record.raw.assign(line.data(), line.size());
        records.push_back(std::move(record));
    }

    ROUTELOG_LOG_TRACE("decoded {} records from {} bytes", records.size(),
                       bytes.size());
    return records;
}

std::shared_ptr<RecordDecoder> make_default_decoder() {
    return std::make_shared<JsonLinesDecoder>();
}

}  // namespace routelog
