#ifndef ROUTELOG_COMMON_ERROR_H
#define ROUTELOG_COMMON_ERROR_H

#include <stdexcept>
#include <string>

namespace routelog {

/**
 * Base class of every error raised by routelog. The message carries a
 * bracketed type prefix, e.g. "[PARSE] invalid segment range".
 */
class Error : public std::runtime_error {
   public:
    enum Type {
        PARSE_ERROR,
        RESOLUTION_ERROR,
        FETCH_ERROR,
        DECODE_ERROR
    };

    Error(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type get_type() const { return type_; }

   private:
    static std::string format_message(Type type, const std::string &message);
    Type type_;
};

/**
 * Malformed identifier or range grammar.
 */
class ParseError : public Error {
   public:
    explicit ParseError(const std::string &message)
        : Error(PARSE_ERROR, message) {}
};

/**
 * Backend lookup failed, returned inconsistent data, or a negative index
 * fell outside the route.
 */
class ResolutionError : public Error {
   public:
    explicit ResolutionError(const std::string &message)
        : Error(RESOLUTION_ERROR, message) {}
};

/**
 * Network or storage failure while retrieving a segment file.
 */
class FetchError : public Error {
   public:
    explicit FetchError(const std::string &message)
        : Error(FETCH_ERROR, message) {}
};

/**
 * Bytes were retrieved but could not be decoded into records.
 */
class DecodeError : public Error {
   public:
    explicit DecodeError(const std::string &message)
        : Error(DECODE_ERROR, message) {}
};

}  // namespace routelog

#endif  // ROUTELOG_COMMON_ERROR_H
