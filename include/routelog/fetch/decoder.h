#ifndef ROUTELOG_FETCH_DECODER_H
#define ROUTELOG_FETCH_DECODER_H

#include <routelog/reader/log_record.h>

#include <memory>
#include <string>
#include <vector>

namespace routelog {

/**
 * Turns the bytes of one segment file into records
 */
class RecordDecoder {
   public:
    virtual ~RecordDecoder() = default;

    /**
     * Throws DecodeError when the bytes are malformed
     */
    virtual std::vector<LogRecord> decode(const std::string &bytes) const = 0;
};

/**
 * Default decoder: optionally gzip/zlib compressed JSON lines, one object
 * per record with a string "which" field and an optional integer
 * "logMonoTime" field.
 */
class JsonLinesDecoder : public RecordDecoder {
   public:
    std::vector<LogRecord> decode(const std::string &bytes) const override;
};

std::shared_ptr<RecordDecoder> make_default_decoder();

}  // namespace routelog

#endif  // ROUTELOG_FETCH_DECODER_H
