#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/route/identifier.h>
#include <routelog/route/segment_range.h>

#include <utility>

namespace routelog {

SegmentRange::SegmentRange(const std::string &identifier,
                           MaxSegmentLookup lookup)
    : SegmentRange(parse_identifier(identifier)) {
    lookup_ = std::move(lookup);
}

SegmentRange::SegmentRange(ParsedIdentifier parsed)
    : route_(std::move(parsed.route)),
      selector_(std::move(parsed.selector)),
      mode_(parsed.mode) {}

SegmentRange::SegmentRange(Route route, RangeSelector selector,
                           std::optional<ReadMode> mode,
                           MaxSegmentLookup lookup)
    : route_(std::move(route)),
      selector_(std::move(selector)),
      mode_(mode),
      lookup_(std::move(lookup)) {}

std::int64_t SegmentRange::max_segment_count() const {
    if (max_segment_count_) {
        return *max_segment_count_;
    }
    if (!lookup_) {
        throw ResolutionError("no segment count lookup configured for " +
                              route_.to_string());
    }
    std::int64_t count = lookup_(route_);
    if (count < 0) {
        throw ResolutionError("negative segment count " +
                              std::to_string(count) + " for " +
                              route_.to_string());
    }
    ROUTELOG_LOG_DEBUG("route {} has {} segments", route_.to_string(), count);
    max_segment_count_ = count;
    return count;
}

const std::vector<std::int64_t> &SegmentRange::seg_idxs() const {
    if (!seg_idxs_) {
        seg_idxs_ = selector_.resolve([this] { return max_segment_count(); });
    }
    return *seg_idxs_;
}

std::string SegmentRange::to_string() const {
    std::string out = route_.to_string();
    if (selector_.kind() != RangeSelector::Kind::ALL) {
        out += "/" + selector_.to_string();
    }
    if (mode_) {
        out += "/";
        out += read_mode_suffix(*mode_);
    }
    return out;
}

}  // namespace routelog
