#include <routelog/common/logging.h>
#include <routelog/reader/log_reader.h>
#include <routelog/route/identifier.h>
#include <routelog/route/segment_range.h>

namespace routelog {

namespace {
ReaderOptions with_defaults(ReaderOptions options) {
    const auto &config = options.config;
    if (!options.http) {
        options.http = make_curl_client();
    }
    if (!options.backend) {
        options.backend = std::make_shared<CachingRouteBackend>(
            std::make_shared<HttpRouteBackend>(options.http, config.api_url,
                                               config.fetch_timeout));
    }
    if (!options.decoder) {
        options.decoder = make_default_decoder();
    }
    if (!options.retry) {
        options.retry = std::make_shared<ExponentialBackoff>(
            config.retry_attempts, config.retry_delay);
    }
    if (!options.source) {
        std::shared_ptr<const HttpClient> validator;
        if (config.validate_files) validator = options.http;
        options.source =
            api_source(options.backend, validator, config.fetch_timeout);
    }
    return options;
}
}  // namespace

LogReader::LogReader(ReaderOptions options)
    : options_(with_defaults(std::move(options))) {
    std::shared_ptr<const FileCache> cache;
    if (options_.config.cache_enabled) {
        cache = std::make_shared<FileCache>(
            options_.config.resolved_cache_dir());
        ROUTELOG_LOG_DEBUG("Caching downloads in {}",
                           cache->directory().string());
    }
    fetcher_ = std::make_shared<FileFetcher>(options_.http, std::move(cache),
                                             options_.retry,
                                             options_.config.fetch_timeout);
}

LogReader::LogReader(const std::string &identifier, ReaderOptions options)
    : LogReader(std::move(options)) {
    add_identifier(identifier);
}

LogReader::LogReader(const std::vector<std::string> &identifiers,
                     ReaderOptions options)
    : LogReader(std::move(options)) {
    for (const auto &identifier : identifiers) {
        add_identifier(identifier);
    }
}

LogReader LogReader::from_files(const std::vector<std::string> &references,
                                ReaderOptions options) {
    LogReader reader(std::move(options));
    for (const auto &reference : references) {
        reader.add_reference(reference);
    }
    return reader;
}

void LogReader::add_identifier(const std::string &identifier) {
    auto indirect = parse_indirect(identifier);
    if (!indirect.is_indirect && is_direct_reference(identifier)) {
        add_reference(identifier);
        return;
    }

    auto backend = options_.backend;
    SegmentRange range(indirect.identifier, [backend](const Route &route) {
        return backend->max_segment_count(route);
    });
    ReadMode mode = range.mode().value_or(options_.default_mode);

    auto sources = options_.source(range, mode);
    std::size_t unavailable = 0;
    for (auto &source : sources) {
        if (source.empty()) {
            ++unavailable;
            continue;
        }
        segments_.push_back(std::make_unique<SegmentFetcher>(
            std::move(source), fetcher_, options_.decoder,
            options_.sort_by_time));
    }
    unavailable_ += unavailable;
    ROUTELOG_LOG_INFO("{}: {} segments in {} mode, {} unavailable",
                      range.to_string(), sources.size(), read_mode_name(mode),
                      unavailable);
}

void LogReader::add_reference(std::string reference) {
    segments_.push_back(std::make_unique<SegmentFetcher>(
        std::move(reference), fetcher_, options_.decoder,
        options_.sort_by_time));
}

const std::vector<LogRecord> *LogReader::segment_records(
    std::size_t position) const {
    return segments_[position]->try_records();
}

std::size_t LogReader::skipped_segments() const {
    std::size_t failed = 0;
    for (const auto &segment : segments_) {
        if (segment->failed()) ++failed;
    }
    return unavailable_ + failed;
}

std::vector<std::string> LogReader::references() const {
    std::vector<std::string> out;
    out.reserve(segments_.size());
    for (const auto &segment : segments_) {
        out.push_back(segment->reference());
    }
    return out;
}

LogReader::FilteredRange LogReader::filter(const std::string &which) const {
    return RecordRange(this, which);
}

std::optional<LogRecord> LogReader::first(const std::string &which) const {
    for (const auto &record : filter(which)) {
        return record;
    }
    return std::nullopt;
}

LogReader::const_iterator LogReader::RecordRange::begin() const {
    return const_iterator(reader_, 0, which_);
}

LogReader::const_iterator LogReader::RecordRange::end() const {
    return const_iterator(reader_, reader_->segments_.size(), which_);
}

LogReader::const_iterator::const_iterator(const LogReader *reader,
                                          std::size_t segment,
                                          std::string which)
    : reader_(reader), segment_(segment), which_(std::move(which)) {
    settle();
}

bool LogReader::const_iterator::matches(const LogRecord &record) const {
    return which_.empty() || record.which == which_;
}

void LogReader::const_iterator::settle() {
    const std::size_t segment_count = reader_->segments_.size();
    while (segment_ < segment_count) {
        if (!records_) {
            records_ = reader_->segment_records(segment_);
        }
        if (records_) {
            while (record_ < records_->size() &&
                   !matches((*records_)[record_])) {
                ++record_;
            }
            if (record_ < records_->size()) return;
        }
        ++segment_;
        record_ = 0;
        records_ = nullptr;
    }
    record_ = 0;
    records_ = nullptr;
}

LogReader::const_iterator &LogReader::const_iterator::operator++() {
    ++record_;
    settle();
    return *this;
}

LogReader::const_iterator LogReader::const_iterator::operator++(int) {
    const_iterator previous = *this;
    ++(*this);
    return previous;
}

}  // namespace routelog
