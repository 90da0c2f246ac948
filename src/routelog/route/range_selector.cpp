#include <routelog/common/error.h>
#include <routelog/route/range_selector.h>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <utility>

namespace routelog {

namespace {

std::int64_t parse_index_field(std::string_view field) {
    std::string_view digits = field;
    if (!digits.empty() && digits.front() == '-') {
        digits.remove_prefix(1);
    }
    if (digits.empty()) {
        throw ParseError("empty index in segment range");
    }
    for (char c : digits) {
        if (c < '0' || c > '9') {
            throw ParseError("invalid index '" + std::string(field) +
                             "' in segment range");
        }
    }
    std::int64_t value = 0;
    auto result =
        std::from_chars(field.data(), field.data() + field.size(), value);
    if (result.ec != std::errc() || result.ptr != field.data() + field.size()) {
        throw ParseError("index '" + std::string(field) + "' out of range");
    }
    return value;
}

std::optional<std::int64_t> parse_optional_field(std::string_view field) {
    if (field.empty()) return std::nullopt;
    return parse_index_field(field);
}

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t begin = 0;
    while (true) {
        std::size_t end = text.find(sep, begin);
        if (end == std::string_view::npos) {
            parts.push_back(text.substr(begin));
            break;
        }
        parts.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }
    return parts;
}

std::int64_t wrap_negative(std::int64_t idx, std::int64_t length) {
    if (idx >= 0) return idx;
    if (idx + length < 0) {
        throw ResolutionError("segment index " + std::to_string(idx) +
                              " out of range for route with " +
                              std::to_string(length) + " segments");
    }
    return idx + length;
}

// Walks first, first + step, ... up to but excluding last. The distance to
// last is checked before stepping so a huge step cannot overflow.
std::vector<std::int64_t> step_through(std::int64_t first, std::int64_t last,
                                       std::int64_t step) {
    std::vector<std::int64_t> out;
    if (step > 0) {
        for (std::int64_t i = first; i < last; i += step) {
            out.push_back(i);
            if (last - i <= step) break;
        }
    } else {
        for (std::int64_t i = first; i > last; i += step) {
            out.push_back(i);
            if (last - i >= step) break;
        }
    }
    return out;
}

}  // namespace

std::vector<std::int64_t> resolve_slice(std::int64_t length,
                                        std::optional<std::int64_t> start,
                                        std::optional<std::int64_t> stop,
                                        std::optional<std::int64_t> step) {
    std::int64_t st = step.value_or(1);
    if (st == 0) {
        throw std::invalid_argument("slice step cannot be zero");
    }
    std::int64_t lower = st < 0 ? -1 : 0;
    std::int64_t upper = st < 0 ? length - 1 : length;

    auto adjust = [&](std::optional<std::int64_t> value,
                      std::int64_t fallback) {
        if (!value) return fallback;
        std::int64_t v = *value;
        if (v < 0) {
            v += length;
            if (v < lower) v = lower;
        } else if (v > upper) {
            v = upper;
        }
        return v;
    };
    std::int64_t first = adjust(start, st < 0 ? upper : lower);
    std::int64_t last = adjust(stop, st < 0 ? lower : upper);

    return step_through(first, last, st);
}

RangeSelector RangeSelector::all() { return RangeSelector(); }

RangeSelector RangeSelector::index(std::int64_t idx) {
    RangeSelector sel;
    sel.kind_ = Kind::INDEX;
    sel.indices_ = {idx};
    return sel;
}

RangeSelector RangeSelector::list(std::vector<std::int64_t> indices) {
    if (indices.empty()) {
        throw std::invalid_argument("segment index list cannot be empty");
    }
    if (indices.size() == 1) {
        return index(indices.front());
    }
    RangeSelector sel;
    sel.kind_ = Kind::LIST;
    sel.indices_ = std::move(indices);
    return sel;
}

RangeSelector RangeSelector::slice(std::optional<std::int64_t> start,
                                   std::optional<std::int64_t> stop,
                                   std::optional<std::int64_t> step) {
    if (step && *step == 0) {
        throw ParseError("slice step cannot be zero");
    }
    if (step && *step == 1) {
        step.reset();
    }
    if (start && *start == 0 && (!step || *step > 0)) {
        start.reset();
    }
    if (!start && !stop && !step) {
        return all();
    }
    RangeSelector sel;
    sel.kind_ = Kind::SLICE;
    sel.start_ = start;
    sel.stop_ = stop;
    sel.step_ = step;
    return sel;
}

RangeSelector RangeSelector::parse(std::string_view text) {
    if (text.empty()) {
        return all();
    }

    if (text.find(',') != std::string_view::npos) {
        std::vector<std::int64_t> indices;
        for (auto field : split(text, ',')) {
            indices.push_back(parse_index_field(field));
        }
        return list(std::move(indices));
    }

    auto fields = split(text, ':');
    if (fields.size() == 1) {
        return index(parse_index_field(fields[0]));
    }
    if (fields.size() > 3) {
        throw ParseError("too many ':' in segment range '" +
                         std::string(text) + "'");
    }
    auto start = parse_optional_field(fields[0]);
    auto stop = parse_optional_field(fields[1]);
    std::optional<std::int64_t> step;
    if (fields.size() == 3) {
        step = parse_optional_field(fields[2]);
    }
    return slice(start, stop, step);
}

bool RangeSelector::needs_length() const {
    switch (kind_) {
        case Kind::ALL:
            return true;
        case Kind::INDEX:
        case Kind::LIST:
            return std::any_of(indices_.begin(), indices_.end(),
                               [](std::int64_t idx) { return idx < 0; });
        case Kind::SLICE: {
            if (!stop_ || *stop_ < 0) return true;
            if (start_ && *start_ < 0) return true;
            // a negative step starts from the end unless start is given
            return step_ && *step_ < 0 && !start_;
        }
    }
    return true;
}

std::vector<std::int64_t> RangeSelector::resolve(
    const std::function<std::int64_t()> &segment_count) const {
    if (!needs_length()) {
        if (kind_ != Kind::SLICE) {
            return indices_;
        }
        return step_through(start_.value_or(0), *stop_, step_.value_or(1));
    }

    std::int64_t length = segment_count();
    switch (kind_) {
        case Kind::ALL:
            return resolve_slice(length, std::nullopt, std::nullopt,
                                 std::nullopt);
        case Kind::INDEX:
        case Kind::LIST: {
            std::vector<std::int64_t> out;
            out.reserve(indices_.size());
            for (std::int64_t idx : indices_) {
                out.push_back(wrap_negative(idx, length));
            }
            return out;
        }
        case Kind::SLICE:
            return resolve_slice(length, start_, stop_, step_);
    }
    return {};
}

std::string RangeSelector::to_string() const {
    switch (kind_) {
        case Kind::ALL:
            return "";
        case Kind::INDEX:
            return std::to_string(indices_.front());
        case Kind::LIST: {
            std::string out;
            for (std::size_t i = 0; i < indices_.size(); ++i) {
                if (i > 0) out += ",";
                out += std::to_string(indices_[i]);
            }
            return out;
        }
        case Kind::SLICE: {
            std::string out;
            if (start_) out += std::to_string(*start_);
            out += ":";
            if (stop_) out += std::to_string(*stop_);
            if (step_) out += ":" + std::to_string(*step_);
            return out;
        }
    }
    return "";
}

bool RangeSelector::operator==(const RangeSelector &other) const {
    return kind_ == other.kind_ && indices_ == other.indices_ &&
           start_ == other.start_ && stop_ == other.stop_ &&
           step_ == other.step_;
}

}  // namespace routelog
