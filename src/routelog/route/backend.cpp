#include <routelog/common/constants.h>
#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/route/backend.h>
#include <routelog/utils/json.h>

#include <charconv>
#include <string>
#include <utility>

namespace routelog {

std::int64_t segment_number_from_url(const std::string &url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto file_sep = path.rfind('/');
    if (file_sep == std::string::npos || file_sep == 0) {
        throw ResolutionError("cannot find segment number in url " + url);
    }
    auto dir_sep = path.rfind('/', file_sep - 1);
    std::size_t begin = dir_sep == std::string::npos ? 0 : dir_sep + 1;
    std::string_view dir(path.data() + begin, file_sep - begin);

    std::int64_t number = -1;
    auto result = std::from_chars(dir.data(), dir.data() + dir.size(), number);
    if (dir.empty() || result.ec != std::errc() ||
        result.ptr != dir.data() + dir.size() || number < 0) {
        throw ResolutionError("cannot find segment number in url " + url);
    }
    return number;
}

HttpRouteBackend::HttpRouteBackend(std::shared_ptr<HttpClient> http,
                                   std::string api_url,
                                   std::chrono::seconds timeout)
    : http_(std::move(http)), api_url_(std::move(api_url)), timeout_(timeout) {
    while (!api_url_.empty() && api_url_.back() == '/') {
        api_url_.pop_back();
    }
}

std::string HttpRouteBackend::request(const Route &route,
                                      const std::string &suffix) const {
    std::string url = api_url_ + constants::backend::ROUTE_ENDPOINT +
                      http_->encode(route.api_name()) + suffix;
    ROUTELOG_LOG_DEBUG("Route lookup {}", url);

    HttpResponse response;
    try {
        response = http_->get(url, timeout_);
    } catch (const FetchError &e) {
        throw ResolutionError("route lookup for " + route.to_string() +
                              " failed: " + e.what());
    }
    if (!response.ok()) {
        throw ResolutionError("route lookup for " + route.to_string() +
                              " returned HTTP " +
                              std::to_string(response.status));
    }
    return std::move(response.body);
}

std::int64_t HttpRouteBackend::max_segment_count(const Route &route) const {
    std::string body = request(route, "/");
    json::JsonParser parser;
    try {
        auto doc = json::parse_json(parser, body.data(), body.size());
        auto max_segment =
            json::find_int64_field(doc, constants::backend::MAX_SEGMENT_FIELD);
        if (!max_segment || *max_segment < 0) {
            throw ResolutionError("route " + route.to_string() +
                                  " has no segment count");
        }
        if (*max_segment >= constants::backend::MAX_SEGMENTS) {
            throw ResolutionError("route " + route.to_string() +
                                  " reports too many segments (" +
                                  std::to_string(*max_segment) + ")");
        }
        return *max_segment + 1;
    } catch (const DecodeError &e) {
        throw ResolutionError("bad route response for " + route.to_string() +
                              ": " + e.what());
    }
}

std::vector<SegmentFiles> HttpRouteBackend::segment_files(
    const Route &route) const {
    std::string body = request(route, constants::backend::FILES_SUFFIX);
    json::JsonParser parser;
    std::vector<std::optional<std::string>> full_logs;
    std::vector<std::optional<std::string>> quick_logs;
    try {
        auto doc = json::parse_json(parser, body.data(), body.size());
        full_logs = json::get_string_array_field(
            doc, constants::backend::FULL_LOGS_FIELD);
        quick_logs = json::get_string_array_field(
            doc, constants::backend::QUICK_LOGS_FIELD);
    } catch (const DecodeError &e) {
        throw ResolutionError("bad files response for " + route.to_string() +
                              ": " + e.what());
    }

    std::vector<SegmentFiles> files;
    auto slot = [&files, &route](const std::string &url) -> SegmentFiles & {
        auto number = segment_number_from_url(url);
        if (number >= constants::backend::MAX_SEGMENTS) {
            throw ResolutionError("route " + route.to_string() +
                                  " lists a file for segment " +
                                  std::to_string(number) + ": " + url);
        }
        auto idx = static_cast<std::size_t>(number);
        if (idx >= files.size()) files.resize(idx + 1);
        return files[idx];
    };
    for (const auto &url : full_logs) {
        if (url) slot(*url).full_log = *url;
    }
    for (const auto &url : quick_logs) {
        if (url) slot(*url).quick_log = *url;
    }
    ROUTELOG_LOG_DEBUG("Route {} lists files for {} segments",
                       route.to_string(), files.size());
    return files;
}

CachingRouteBackend::CachingRouteBackend(
    std::shared_ptr<const RouteBackend> inner)
    : inner_(std::move(inner)) {}

std::int64_t CachingRouteBackend::max_segment_count(const Route &route) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(route);
        if (it != counts_.end()) return it->second;
    }
    auto count = inner_->max_segment_count(route);
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.emplace(route, count);
    return count;
}

std::vector<SegmentFiles> CachingRouteBackend::segment_files(
    const Route &route) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(route);
        if (it != files_.end()) return it->second;
    }
    auto files = inner_->segment_files(route);
    std::lock_guard<std::mutex> lock(mutex_);
    files_.emplace(route, files);
    return files;
}

}  // namespace routelog
