#ifndef ROUTELOG_FETCH_INFLATER_H
#define ROUTELOG_FETCH_INFLATER_H

#include <routelog/common/constants.h>
#include <routelog/common/logging.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace routelog {

/**
 * Streaming zlib inflater over an in-memory buffer. Handles gzip, zlib and
 * raw deflate streams, including concatenated gzip members.
 */
class Inflater {
   public:
    static constexpr std::size_t BUFFER_SIZE =
        constants::decoder::INFLATE_BUFFER_SIZE;

    enum class Format { NONE, GZIP, ZLIB, RAW };

    Inflater() : bits_(constants::decoder::ZLIB_GZIP_WINDOW_BITS) {
        std::memset(&stream_, 0, sizeof(stream_));
    }

    ~Inflater() {
        if (initialized_) inflateEnd(&stream_);
    }

    Inflater(const Inflater &) = delete;
    Inflater &operator=(const Inflater &) = delete;

    /**
     * Stream type detection from the first bytes, following zran.c:
     * gzip magic, zlib header check, plain text for JSON, raw otherwise
     */
    static Format detect_format(std::string_view data) {
        if (data.empty()) return Format::NONE;
        auto b0 = static_cast<unsigned char>(data[0]);
        if (b0 == '{' || b0 == '\n' || b0 == '\r' || b0 == ' ' ||
            b0 == '\t') {
            return Format::NONE;
        }
        if (data.size() >= 2) {
            auto b1 = static_cast<unsigned char>(data[1]);
            if (b0 == 0x1f && b1 == 0x8b) return Format::GZIP;
            if ((b0 & 0x0f) == 8 && ((b0 << 8) | b1) % 31 == 0) {
                return Format::ZLIB;
            }
        }
        return Format::RAW;
    }

    /**
     * Inflate the whole input into out. Returns false on a corrupt or
     * truncated stream; error() then describes the failure.
     */
    bool inflate_all(std::string_view input, Format format,
                     std::string &out) {
        switch (format) {
            case Format::NONE:
                out.assign(input.data(), input.size());
                return true;
            case Format::GZIP:
                bits_ = constants::decoder::ZLIB_GZIP_WINDOW_BITS;
                break;
            case Format::ZLIB:
                bits_ = constants::decoder::ZLIB_WINDOW_BITS;
                break;
            case Format::RAW:
                bits_ = constants::decoder::ZLIB_RAW_WINDOW_BITS;
                break;
        }

        if (!initialize()) return false;
        stream_.next_in =
            reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
        stream_.avail_in = static_cast<uInt>(input.size());

        out.clear();
        out.reserve(input.size() * 4);
        bool finished = false;
        while (true) {
            stream_.next_out = buffer_;
            stream_.avail_out = static_cast<uInt>(sizeof(buffer_));
            int ret = inflate(&stream_, Z_NO_FLUSH);
            out.append(reinterpret_cast<const char *>(buffer_),
                       sizeof(buffer_) - stream_.avail_out);

            if (ret == Z_STREAM_END) {
                finished = true;
                // concatenated gzip members
                if (format == Format::GZIP && stream_.avail_in > 0) {
                    if (inflateReset(&stream_) != Z_OK) {
                        error_ = "inflateReset failed";
                        return false;
                    }
                    finished = false;
                    continue;
                }
                break;
            }
            if (ret != Z_OK) {
                error_ = "inflate() failed with error: " + std::to_string(ret) +
                         " (" + (stream_.msg ? stream_.msg : "no message") +
                         ")";
                ROUTELOG_LOG_DEBUG("{}", error_);
                return false;
            }
            if (stream_.avail_in == 0 && stream_.avail_out != 0) {
                break;
            }
        }
        if (!finished) {
            error_ = "compressed stream is truncated";
            return false;
        }
        return true;
    }

    const std::string &error() const { return error_; }

   private:
    bool initialize() {
        if (initialized_) {
            inflateEnd(&stream_);
            initialized_ = false;
        }
        std::memset(&stream_, 0, sizeof(stream_));
        if (inflateInit2(&stream_, bits_) != Z_OK) {
            error_ = "failed to initialize inflater";
            return false;
        }
        initialized_ = true;
        return true;
    }

    int bits_;
    bool initialized_ = false;
    z_stream stream_;
    std::string error_;
    alignas(64) unsigned char buffer_[BUFFER_SIZE];
};

}  // namespace routelog

#endif  // ROUTELOG_FETCH_INFLATER_H
