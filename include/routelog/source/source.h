#ifndef ROUTELOG_SOURCE_SOURCE_H
#define ROUTELOG_SOURCE_SOURCE_H

#include <routelog/net/http_client.h>
#include <routelog/route/backend.h>
#include <routelog/route/segment_range.h>
#include <routelog/source/read_mode.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace routelog {

/**
 * Candidate files for one segment in preference order. Empty when the
 * segment is unavailable in the requested mode.
 */
using SegmentSource = std::vector<std::string>;

/**
 * Maps a resolved range and a mode to one source per selected segment, in
 * seg_idxs() order
 */
using SourceFn =
    std::function<std::vector<SegmentSource>(const SegmentRange &, ReadMode)>;

/**
 * Per segment decision:
 *   QUICK -> quick log
 *   FULL  -> full log
 *   AUTO  -> full log if present, else quick log
 */
std::optional<std::string> select_source(ReadMode mode,
                                         const SegmentFiles &files);

/**
 * The selected file followed by the files to fall back to when it cannot
 * be fetched or decoded. Only AUTO has a fallback (the quick log).
 */
SegmentSource source_candidates(ReadMode mode, const SegmentFiles &files);

/**
 * Drop file locations that do not answer a HEAD request with 2xx
 */
SegmentFiles probe_files(const SegmentFiles &files, const HttpClient &http,
                         std::chrono::seconds timeout);

/**
 * Source backed by the route backend's file listing. With a `validator`
 * client, every candidate location is probed before it is selected.
 */
SourceFn api_source(std::shared_ptr<const RouteBackend> backend,
                    std::shared_ptr<const HttpClient> validator = nullptr,
                    std::chrono::seconds timeout = std::chrono::seconds(10));

}  // namespace routelog

#endif  // ROUTELOG_SOURCE_SOURCE_H
