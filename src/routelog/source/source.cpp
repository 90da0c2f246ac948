#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/source/source.h>

#include <utility>

namespace routelog {

std::optional<std::string> select_source(ReadMode mode,
                                         const SegmentFiles &files) {
    switch (mode) {
        case ReadMode::QUICK:
            return files.quick_log;
        case ReadMode::FULL:
            return files.full_log;
        case ReadMode::AUTO:
            return files.full_log ? files.full_log : files.quick_log;
    }
    return std::nullopt;
}

SegmentSource source_candidates(ReadMode mode, const SegmentFiles &files) {
    SegmentSource candidates;
    if (auto selected = select_source(mode, files)) {
        candidates.push_back(std::move(*selected));
    }
    if (mode == ReadMode::AUTO && files.full_log && files.quick_log) {
        candidates.push_back(*files.quick_log);
    }
    return candidates;
}

namespace {
std::optional<std::string> probe(const std::optional<std::string> &location,
                                 const HttpClient &http,
                                 std::chrono::seconds timeout) {
    if (!location) return std::nullopt;
    try {
        long status = http.head(*location, timeout);
        if (status >= 200 && status < 300) return location;
        ROUTELOG_LOG_DEBUG("HEAD {} returned {}", *location, status);
    } catch (const FetchError &e) {
        ROUTELOG_LOG_DEBUG("HEAD {} failed: {}", *location, e.what());
    }
    return std::nullopt;
}
}  // namespace

SegmentFiles probe_files(const SegmentFiles &files, const HttpClient &http,
                         std::chrono::seconds timeout) {
    return SegmentFiles{probe(files.full_log, http, timeout),
                        probe(files.quick_log, http, timeout)};
}

SourceFn api_source(std::shared_ptr<const RouteBackend> backend,
                    std::shared_ptr<const HttpClient> validator,
                    std::chrono::seconds timeout) {
    return [backend = std::move(backend), validator = std::move(validator),
            timeout](const SegmentRange &range,
                     ReadMode mode) -> std::vector<SegmentSource> {
        const auto &indices = range.seg_idxs();
        std::vector<SegmentSource> sources;
        sources.reserve(indices.size());
        if (indices.empty()) return sources;

        auto files = backend->segment_files(range.route());
        for (auto idx : indices) {
            SegmentFiles segment;
            if (idx >= 0 && static_cast<std::size_t>(idx) < files.size()) {
                segment = files[static_cast<std::size_t>(idx)];
            }
            if (validator) {
                segment = probe_files(segment, *validator, timeout);
            }
            auto source = source_candidates(mode, segment);
            if (source.empty()) {
                ROUTELOG_LOG_WARN("Segment {}/{} has no {} log",
                                  range.route().to_string(), idx,
                                  read_mode_name(mode));
            }
            sources.push_back(std::move(source));
        }
        return sources;
    };
}

}  // namespace routelog
