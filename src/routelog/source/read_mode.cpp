#include <routelog/source/read_mode.h>

namespace routelog {

char read_mode_suffix(ReadMode mode) {
    switch (mode) {
        case ReadMode::QUICK:
            return 'q';
        case ReadMode::FULL:
            return 'r';
        case ReadMode::AUTO:
            return 'a';
    }
    return 'a';
}

std::optional<ReadMode> read_mode_from_string(const std::string &text) {
    if (text == "q" || text == "quick") return ReadMode::QUICK;
    if (text == "r" || text == "full") return ReadMode::FULL;
    if (text == "a" || text == "auto") return ReadMode::AUTO;
    return std::nullopt;
}

std::string read_mode_name(ReadMode mode) {
    switch (mode) {
        case ReadMode::QUICK:
            return "quick";
        case ReadMode::FULL:
            return "full";
        case ReadMode::AUTO:
            return "auto";
    }
    return "auto";
}

}  // namespace routelog
