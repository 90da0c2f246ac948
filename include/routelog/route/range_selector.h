#ifndef ROUTELOG_ROUTE_RANGE_SELECTOR_H
#define ROUTELOG_ROUTE_RANGE_SELECTOR_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace routelog {

/**
 * Apply Python slice semantics to range(length): clamp and wrap start/stop
 * the way CPython's PySlice_AdjustIndices does and return the indices.
 * step must not be zero.
 */
std::vector<std::int64_t> resolve_slice(std::int64_t length,
                                        std::optional<std::int64_t> start,
                                        std::optional<std::int64_t> stop,
                                        std::optional<std::int64_t> step);

/**
 * Which segments of a route to read: all of them, one index, an explicit
 * list, or a slice. Negative indices count from the end of the route.
 *
 * Selectors are normalized on construction (slice start 0 and step 1 are
 * dropped, an empty slice becomes all, a one element list becomes an index)
 * so two selectors are equal exactly when their string forms are.
 */
class RangeSelector {
   public:
    enum class Kind { ALL, INDEX, LIST, SLICE };

    RangeSelector() : kind_(Kind::ALL) {}

    static RangeSelector all();
    static RangeSelector index(std::int64_t idx);
    static RangeSelector list(std::vector<std::int64_t> indices);
    static RangeSelector slice(std::optional<std::int64_t> start,
                               std::optional<std::int64_t> stop,
                               std::optional<std::int64_t> step = std::nullopt);

    /**
     * Parse the selector part of an identifier ("", "5", "-1", "2:",
     * "5::2", "1,3,4"). Throws ParseError.
     */
    static RangeSelector parse(std::string_view text);

    Kind kind() const { return kind_; }
    const std::vector<std::int64_t> &indices() const { return indices_; }
    const std::optional<std::int64_t> &start() const { return start_; }
    const std::optional<std::int64_t> &stop() const { return stop_; }
    const std::optional<std::int64_t> &step() const { return step_; }

    /**
     * True when resolving needs the route's segment count
     */
    bool needs_length() const;

    /**
     * Resolve to concrete indices. segment_count is only invoked when
     * needs_length() is true. Throws ResolutionError for a negative index
     * outside the route.
     */
    std::vector<std::int64_t> resolve(
        const std::function<std::int64_t()> &segment_count) const;

    /**
     * "" for all, otherwise the canonical selector text
     */
    std::string to_string() const;

    bool operator==(const RangeSelector &other) const;
    bool operator!=(const RangeSelector &other) const {
        return !(*this == other);
    }

   private:
    Kind kind_;
    std::vector<std::int64_t> indices_;
    std::optional<std::int64_t> start_;
    std::optional<std::int64_t> stop_;
    std::optional<std::int64_t> step_;
};

}  // namespace routelog

#endif  // ROUTELOG_ROUTE_RANGE_SELECTOR_H
