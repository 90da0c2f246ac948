#include <routelog/common/error.h>
#include <routelog/route/route.h>

#include <cctype>
#include <utility>

namespace routelog {

Route::Route(std::string dongle_id, std::string name)
    : dongle_id_(std::move(dongle_id)), name_(std::move(name)) {
    if (!is_valid_dongle_id(dongle_id_)) {
        throw ParseError("invalid dongle id: '" + dongle_id_ + "'");
    }
    if (!is_valid_name(name_)) {
        throw ParseError("invalid route name: '" + name_ + "'");
    }
}

std::string Route::to_string() const { return dongle_id_ + "/" + name_; }

std::string Route::api_name() const { return dongle_id_ + "|" + name_; }

bool Route::is_valid_dongle_id(std::string_view text) {
    if (text.size() != DONGLE_ID_LENGTH) return false;
    for (char c : text) {
        bool lower = c >= 'a' && c <= 'z';
        bool digit = c >= '0' && c <= '9';
        if (!lower && !digit) return false;
    }
    return true;
}

bool Route::is_valid_name(std::string_view text) {
    // YYYY-MM-DD--HH-MM-SS
    static constexpr std::string_view PATTERN = "dddd-dd-dd--dd-dd-dd";
    if (text.size() != PATTERN.size()) return false;
    for (std::size_t i = 0; i < PATTERN.size(); ++i) {
        if (PATTERN[i] == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(text[i])))
                return false;
        } else if (text[i] != PATTERN[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace routelog
