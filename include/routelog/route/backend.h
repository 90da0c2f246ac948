#ifndef ROUTELOG_ROUTE_BACKEND_H
#define ROUTELOG_ROUTE_BACKEND_H

#include <routelog/net/http_client.h>
#include <routelog/route/route.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace routelog {

/**
 * Where the two variants of one segment live, if anywhere
 */
struct SegmentFiles {
    std::optional<std::string> full_log;
    std::optional<std::string> quick_log;

    bool operator==(const SegmentFiles &other) const {
        return full_log == other.full_log && quick_log == other.quick_log;
    }
};

/**
 * Route metadata service. Failures throw ResolutionError.
 */
class RouteBackend {
   public:
    virtual ~RouteBackend() = default;

    /**
     * Number of segments the route has
     */
    virtual std::int64_t max_segment_count(const Route &route) const = 0;

    /**
     * File locations indexed by segment number. Segments the backend knows
     * nothing about come back with both variants empty.
     */
    virtual std::vector<SegmentFiles> segment_files(
        const Route &route) const = 0;
};

/**
 * Backend talking to the route API over http:
 *   GET {api}/v1/route/{dongle|name}/       -> {"maxqlog": N, ...}
 *   GET {api}/v1/route/{dongle|name}/files  -> {"logs": [...], "qlogs": [...]}
 */
class HttpRouteBackend : public RouteBackend {
   public:
    HttpRouteBackend(std::shared_ptr<HttpClient> http, std::string api_url,
                     std::chrono::seconds timeout);

    std::int64_t max_segment_count(const Route &route) const override;
    std::vector<SegmentFiles> segment_files(const Route &route) const override;

   private:
    std::string request(const Route &route, const std::string &suffix) const;

    std::shared_ptr<HttpClient> http_;
    std::string api_url_;
    std::chrono::seconds timeout_;
};

/**
 * Remembers the answers of another backend per route
 */
class CachingRouteBackend : public RouteBackend {
   public:
    explicit CachingRouteBackend(std::shared_ptr<const RouteBackend> inner);

    std::int64_t max_segment_count(const Route &route) const override;
    std::vector<SegmentFiles> segment_files(const Route &route) const override;

   private:
    std::shared_ptr<const RouteBackend> inner_;
    mutable std::mutex mutex_;
    mutable std::map<Route, std::int64_t> counts_;
    mutable std::map<Route, std::vector<SegmentFiles>> files_;
};

/**
 * Segment number of a log url, taken from its parent directory
 * (".../<dongle>/<name>/<segment>/rlog.bz2"). Throws ResolutionError.
 */
std::int64_t segment_number_from_url(const std::string &url);

}  // namespace routelog

#endif  // ROUTELOG_ROUTE_BACKEND_H
