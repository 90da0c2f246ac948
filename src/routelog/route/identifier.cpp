#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/route/identifier.h>
#include <routelog/utils/filesystem.h>

#include <cctype>
#include <system_error>
#include <vector>

namespace routelog {

namespace {

static constexpr std::string_view QUERY_KEYS[] = {"onebox", "route"};

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// Length of the dongle/name separator at the start of text, 0 if none
std::size_t separator_length(std::string_view text) {
    if (text.empty()) return 0;
    if (text[0] == '|' || text[0] == '/' || text[0] == '_') return 1;
    if (text.size() >= 3 && iequals(text.substr(0, 3), "%7c")) return 3;
    return 0;
}

ReadMode parse_mode_suffix(std::string_view text) {
    if (text.size() == 1) {
        auto mode = read_mode_from_string(std::string(text));
        if (mode) return *mode;
    }
    throw ParseError("invalid source suffix '" + std::string(text) + "'");
}

}  // namespace

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(text[i + 1]) * 16 +
                                     hex_value(text[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

IndirectIdentifier parse_indirect(const std::string &identifier) {
    std::string_view view(identifier);
    if (view.find("://") == std::string_view::npos) {
        return {identifier, false};
    }
    std::size_t query_begin = view.find('?');
    if (query_begin == std::string_view::npos) {
        return {identifier, false};
    }
    std::string_view query = view.substr(query_begin + 1);
    query = query.substr(0, query.find('#'));

    while (!query.empty()) {
        std::size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        std::size_t eq = pair.find('=');
        if (eq != std::string_view::npos) {
            std::string_view key = pair.substr(0, eq);
            for (auto accepted : QUERY_KEYS) {
                if (key == accepted) {
                    std::string value = percent_decode(pair.substr(eq + 1));
                    ROUTELOG_LOG_DEBUG("unwrapped '{}' from {}", value,
                                       identifier);
                    return {value, true};
                }
            }
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return {identifier, false};
}

ParsedIdentifier parse_identifier(const std::string &identifier) {
    std::string unwrapped = parse_indirect(identifier).identifier;
    std::string_view text(unwrapped);

    if (text.size() < Route::DONGLE_ID_LENGTH) {
        throw ParseError("identifier too short: '" + unwrapped + "'");
    }
    std::string_view dongle_id = text.substr(0, Route::DONGLE_ID_LENGTH);
    text.remove_prefix(Route::DONGLE_ID_LENGTH);

    std::size_t sep = separator_length(text);
    if (sep == 0) {
        throw ParseError("missing route separator in '" + unwrapped + "'");
    }
    text.remove_prefix(sep);

    if (text.size() < Route::NAME_LENGTH) {
        throw ParseError("invalid route name in '" + unwrapped + "'");
    }
    Route route(std::string(dongle_id),
                std::string(text.substr(0, Route::NAME_LENGTH)));
    text.remove_prefix(Route::NAME_LENGTH);

    if (text.empty()) {
        return {route, RangeSelector::all(), std::nullopt};
    }

    // "--" is shorthand for "/"
    if (starts_with(text, "--")) {
        text.remove_prefix(2);
    } else if (text.front() == '/') {
        text.remove_prefix(1);
    } else {
        throw ParseError("unexpected '" + std::string(text) + "' after route " +
                         route.to_string());
    }

    std::vector<std::string_view> parts;
    std::size_t slash = text.find('/');
    parts.push_back(text.substr(0, slash));
    if (slash != std::string_view::npos) {
        std::string_view rest = text.substr(slash + 1);
        if (rest.find('/') != std::string_view::npos) {
            throw ParseError("too many '/' in '" + unwrapped + "'");
        }
        parts.push_back(rest);
    }

    if (parts.size() == 1) {
        std::string_view part = parts[0];
        if (part.size() == 1 && read_mode_from_string(std::string(part))) {
            return {route, RangeSelector::all(), parse_mode_suffix(part)};
        }
        return {route, RangeSelector::parse(part), std::nullopt};
    }
    return {route, RangeSelector::parse(parts[0]),
            parse_mode_suffix(parts[1])};
}

bool is_direct_reference(const std::string &identifier) {
    std::string_view view(identifier);
    if (starts_with(view, "http://") || starts_with(view, "https://") ||
        starts_with(view, "file://")) {
        return true;
    }
    std::error_code ec;
    return fs::is_regular_file(identifier, ec);
}

}  // namespace routelog
