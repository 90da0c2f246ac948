#include <routelog/common/error.h>

namespace routelog {

std::string Error::format_message(Type type, const std::string &message) {
    std::string prefix;
    switch (type) {
        case PARSE_ERROR:
            prefix = "[PARSE]";
            break;
        case RESOLUTION_ERROR:
            prefix = "[RESOLUTION]";
            break;
        case FETCH_ERROR:
            prefix = "[FETCH]";
            break;
        case DECODE_ERROR:
            prefix = "[DECODE]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace routelog
