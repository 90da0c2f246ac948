#ifndef ROUTELOG_ROUTE_SEGMENT_RANGE_H
#define ROUTELOG_ROUTE_SEGMENT_RANGE_H

#include <routelog/route/range_selector.h>
#include <routelog/route/route.h>
#include <routelog/source/read_mode.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace routelog {

struct ParsedIdentifier;

/**
 * Number of segments a route has, as reported by the backend
 */
using MaxSegmentLookup = std::function<std::int64_t(const Route &)>;

/**
 * A route, a selector over its segments and an optional explicit read mode.
 *
 * The segment count lookup is only called when the selector needs it (all
 * segments, negative indices, open ended slices) and at most once per
 * SegmentRange object. Not safe for concurrent use.
 */
class SegmentRange {
   public:
    /**
     * Parse an identifier (see parse_identifier). Throws ParseError.
     */
    explicit SegmentRange(const std::string &identifier,
                          MaxSegmentLookup lookup = nullptr);
    SegmentRange(Route route, RangeSelector selector,
                 std::optional<ReadMode> mode = std::nullopt,
                 MaxSegmentLookup lookup = nullptr);

    const Route &route() const { return route_; }
    const RangeSelector &selector() const { return selector_; }
    const std::optional<ReadMode> &mode() const { return mode_; }

    /**
     * Concrete segment indices in selector order. Computed once and cached.
     * Throws ResolutionError when the lookup is needed but fails or is
     * missing.
     */
    const std::vector<std::int64_t> &seg_idxs() const;

    /**
     * Segment count of the route, from the lookup (memoized)
     */
    std::int64_t max_segment_count() const;

    /**
     * Canonical form: "dongle/name[/selector][/q|r|a]"
     */
    std::string to_string() const;

    bool operator==(const SegmentRange &other) const {
        return route_ == other.route_ && selector_ == other.selector_ &&
               mode_ == other.mode_;
    }
    bool operator!=(const SegmentRange &other) const {
        return !(*this == other);
    }

   private:
    explicit SegmentRange(ParsedIdentifier parsed);

    Route route_;
    RangeSelector selector_;
    std::optional<ReadMode> mode_;
    MaxSegmentLookup lookup_;

    mutable std::optional<std::int64_t> max_segment_count_;
    mutable std::optional<std::vector<std::int64_t>> seg_idxs_;
};

}  // namespace routelog

#endif  // ROUTELOG_ROUTE_SEGMENT_RANGE_H
