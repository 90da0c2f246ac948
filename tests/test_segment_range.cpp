#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <routelog/common/error.h>
#include <routelog/route/range_selector.h>
#include <routelog/route/segment_range.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "testing_utilities.h"

using namespace routelog;
using namespace routelog_test;

namespace {
struct CountingLookup {
    int calls = 0;
    MaxSegmentLookup lookup() {
        return [this](const Route &) {
            ++calls;
            return NUM_SEGS;
        };
    }
};
}  // namespace

TEST_CASE("C++ SegmentRange - Indirect parsing") {
    const std::string route = TEST_ROUTE;
    const std::string piped = std::string(TEST_DONGLE) + "|" + TEST_NAME;
    const auto all = range(0, NUM_SEGS);

    const std::vector<std::pair<std::string, std::vector<std::int64_t>>>
        cases = {
            {route, all},
            {piped, all},
            {route + "--0", {0}},
            {route + "--5", {5}},
            {route + "/0", {0}},
            {route + "/5", {5}},
            {route + "/0:10", range(0, 10)},
            {route + "/0:0", {}},
            {route + "/4:6", range(4, 6)},
            {route + "/0:-1", range(0, NUM_SEGS - 1)},
            {route + "/:5", range(0, 5)},
            {route + "/2:", range(2, NUM_SEGS)},
            {route + "/2:-1", range(2, NUM_SEGS - 1)},
            {route + "/-1", {NUM_SEGS - 1}},
            {route + "/-2", {NUM_SEGS - 2}},
            {route + "/-2:-1", {NUM_SEGS - 2}},
            {route + "/-4:-2", range(NUM_SEGS - 4, NUM_SEGS - 2)},
            {route + "/:10:2", range(0, 10, 2)},
            {route + "/5::2", range(5, NUM_SEGS, 2)},
            {route + "/1,3,-1", {1, 3, NUM_SEGS - 1}},
            {"https://useradmin.comma.ai/?onebox=" + route, all},
            {"https://useradmin.comma.ai/?onebox=" + piped, all},
            {"https://useradmin.comma.ai/?onebox=" + std::string(TEST_DONGLE) +
                 "%7C" + TEST_NAME,
             all},
            {"https://cabana.comma.ai/?route=" + route, all},
        };

    for (const auto &test : cases) {
        CAPTURE(test.first);
        CountingLookup counter;
        SegmentRange sr(test.first, counter.lookup());
        CHECK(sr.seg_idxs() == test.second);
    }
}

TEST_CASE("C++ SegmentRange - Canonical names") {
    const std::string route = TEST_ROUTE;
    const std::vector<std::pair<std::string, std::string>> cases = {
        {route, route},
        {std::string(TEST_DONGLE) + "|" + TEST_NAME, route},
        {route + "--5", route + "/5"},
        {route + "/0/q", route + "/0/q"},
        {route + "/5:6/r", route + "/5:6/r"},
        {route + "/5", route + "/5"},
        {route + "/a", route + "/a"},
        {route + "/0:5", route + "/:5"},
        {route + "/::1", route},
        {route + "/1:10:2", route + "/1:10:2"},
        {route + "/3,1", route + "/3,1"},
    };

    for (const auto &test : cases) {
        CAPTURE(test.first);
        SegmentRange sr(test.first);
        CHECK(sr.to_string() == test.second);
        CHECK(SegmentRange(sr.to_string()) == sr);
    }
}

TEST_CASE("C++ SegmentRange - Bad ranges") {
    const std::string route = TEST_ROUTE;
    for (const auto &bad :
         {route + "///", route + "---", route + "/-4:--2", route + "/-a",
          route + "/j", route + "/0:1:2:3", route + "/:::3", route + "3",
          route + "-3", route + "--3a", route + "/1::0", route + "/7,"}) {
        CAPTURE(bad);
        CountingLookup counter;
        CHECK_THROWS_AS(SegmentRange(bad, counter.lookup()).seg_idxs(),
                        ParseError);
    }
}

TEST_CASE("C++ SegmentRange - Lookup only when needed") {
    const std::string route = TEST_ROUTE;
    const std::vector<std::pair<std::string, bool>> cases = {
        {route + "/0", false},  {route + "/:2", false},
        {route + "/0:", true},  {route + "/-1", true},
        {route, true},          {route + "/q", true},
        {route + "/2:5:-1", false}, {route + "/::-1", true},
        {route + "/-3:", true}, {route + "/1,2", false},
        {route + "/1,-2", true},
    };

    for (const auto &test : cases) {
        CAPTURE(test.first);
        CountingLookup counter;
        SegmentRange sr(test.first, counter.lookup());
        sr.seg_idxs();
        CHECK((counter.calls > 0) == test.second);
    }

    SUBCASE("Lookup happens at most once") {
        CountingLookup counter;
        SegmentRange sr(route, counter.lookup());
        sr.seg_idxs();
        sr.seg_idxs();
        CHECK(sr.max_segment_count() == NUM_SEGS);
        CHECK(counter.calls == 1);
    }
}

TEST_CASE("C++ SegmentRange - Resolution failures") {
    const std::string route = TEST_ROUTE;

    SUBCASE("Missing lookup") {
        SegmentRange sr(route);
        CHECK_THROWS_AS(sr.seg_idxs(), ResolutionError);

        SegmentRange direct(route + "/3");
        CHECK(direct.seg_idxs() == std::vector<std::int64_t>{3});
    }

    SUBCASE("Negative index past the start") {
        CountingLookup counter;
        SegmentRange sr(route + "/-18", counter.lookup());
        CHECK_THROWS_AS(sr.seg_idxs(), ResolutionError);
    }

    SUBCASE("Failing lookup") {
        SegmentRange sr(route, [](const Route &r) -> std::int64_t {
            throw ResolutionError("no such route " + r.to_string());
        });
        CHECK_THROWS_AS(sr.seg_idxs(), ResolutionError);
    }

    SUBCASE("Negative count") {
        SegmentRange sr(route, [](const Route &) { return std::int64_t{-1}; });
        CHECK_THROWS_AS(sr.seg_idxs(), ResolutionError);
    }
}

TEST_CASE("C++ RangeSelector - Normalization") {
    CHECK(RangeSelector::slice(0, std::nullopt, 1) == RangeSelector::all());
    CHECK(RangeSelector::slice(std::nullopt, 4, std::nullopt) ==
          RangeSelector::slice(0, 4, 1));
    CHECK(RangeSelector::slice(0, std::nullopt, -1).to_string() == "0::-1");
    CHECK(RangeSelector::list({4}) == RangeSelector::index(4));
    CHECK_THROWS_AS(RangeSelector::list({}), std::invalid_argument);
    CHECK_THROWS_AS(RangeSelector::slice(1, 2, 0), ParseError);
    CHECK(RangeSelector::parse("") == RangeSelector::all());
    CHECK(RangeSelector::parse("-3").to_string() == "-3");
}

TEST_CASE("C++ RangeSelector - Slice resolution") {
    SUBCASE("Reverse slices") {
        CHECK(resolve_slice(5, std::nullopt, std::nullopt, -1) ==
              std::vector<std::int64_t>{4, 3, 2, 1, 0});
        CHECK(resolve_slice(5, 3, std::nullopt, -2) ==
              std::vector<std::int64_t>{3, 1});
        CHECK(resolve_slice(5, std::nullopt, 1, -1) ==
              std::vector<std::int64_t>{4, 3, 2});
    }

    SUBCASE("Clamping") {
        CHECK(resolve_slice(5, -100, 100, std::nullopt) == range(0, 5));
        CHECK(resolve_slice(5, 10, std::nullopt, std::nullopt).empty());
        CHECK(resolve_slice(0, std::nullopt, std::nullopt, std::nullopt)
                  .empty());
    }

    SUBCASE("Zero step") {
        CHECK_THROWS_AS(resolve_slice(5, 0, 5, 0), std::invalid_argument);
    }

    SUBCASE("Positive bounded slices need no count") {
        auto selector = RangeSelector::slice(2, 9, 3);
        CHECK_FALSE(selector.needs_length());
        auto idxs = selector.resolve([]() -> std::int64_t {
            throw ResolutionError("not expected");
        });
        CHECK(idxs == std::vector<std::int64_t>{2, 5, 8});
    }

    SUBCASE("Steps larger than the route") {
        auto bounded = RangeSelector::parse("1:2:9223372036854775807");
        CHECK_FALSE(bounded.needs_length());
        CHECK(bounded.resolve([]() -> std::int64_t { return NUM_SEGS; }) ==
              std::vector<std::int64_t>{1});

        auto open = RangeSelector::parse("1::9223372036854775807");
        CHECK(open.needs_length());
        CHECK(open.resolve([]() -> std::int64_t { return NUM_SEGS; }) ==
              std::vector<std::int64_t>{1});

        CHECK(resolve_slice(NUM_SEGS, 15, 0, -9223372036854775807 - 1) ==
              std::vector<std::int64_t>{15});
    }
}
