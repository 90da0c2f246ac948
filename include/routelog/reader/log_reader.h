#ifndef ROUTELOG_READER_LOG_READER_H
#define ROUTELOG_READER_LOG_READER_H

#include <routelog/fetch/decoder.h>
#include <routelog/fetch/file_fetcher.h>
#include <routelog/fetch/retry.h>
#include <routelog/fetch/segment_fetcher.h>
#include <routelog/net/http_client.h>
#include <routelog/reader/log_record.h>
#include <routelog/reader/reader_config.h>
#include <routelog/reader/worker_pool.h>
#include <routelog/route/backend.h>
#include <routelog/source/read_mode.h>
#include <routelog/source/source.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace routelog {

/**
 * Everything a LogReader needs besides the identifiers. Empty members are
 * filled with the defaults built from `config`: a libcurl client, the http
 * route backend (memoized), the JSON lines decoder, exponential backoff and
 * api_source.
 */
struct ReaderOptions {
    ReadMode default_mode = ReadMode::FULL;
    ReaderConfig config;
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<const RouteBackend> backend;
    std::shared_ptr<const RecordDecoder> decoder;
    std::shared_ptr<const RetryPolicy> retry;
    SourceFn source;
    // order records of each segment by logMonoTime
    bool sort_by_time = false;
};

/**
 * Reads the records of one or more routes (or plain log files) as a single
 * ordered stream.
 *
 * Segment files are resolved when the reader is constructed and fetched
 * lazily: a segment is downloaded and decoded the first time iteration
 * reaches it and kept in memory afterwards, so iterating again never
 * refetches. Segments that are unavailable in the requested mode, or that
 * fail to fetch or decode, are skipped with a warning and counted by
 * skipped_segments().
 *
 * Usage:
 * @code
 * routelog::LogReader reader("a2a0ccea32023010/2023-07-27--13-01-19/0:4/q");
 * for (const auto &record : reader.filter("carParams")) {
 *     std::cout << record.raw << std::endl;
 * }
 * @endcode
 */
class LogReader {
   public:
    class RecordRange;

    /**
     * Forward iterator over records, optionally restricted to one `which`
     */
    class const_iterator {
       public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = LogRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const LogRecord *;
        using reference = const LogRecord &;

        const_iterator() = default;

        reference operator*() const { return (*records_)[record_]; }
        pointer operator->() const { return &(*records_)[record_]; }

        const_iterator &operator++();
        const_iterator operator++(int);

        bool operator==(const const_iterator &other) const {
            return reader_ == other.reader_ && segment_ == other.segment_ &&
                   record_ == other.record_;
        }
        bool operator!=(const const_iterator &other) const {
            return !(*this == other);
        }

       private:
        friend class LogReader;
        friend class RecordRange;
        const_iterator(const LogReader *reader, std::size_t segment,
                       std::string which);

        void settle();
        bool matches(const LogRecord &record) const;

        const LogReader *reader_ = nullptr;
        std::size_t segment_ = 0;
        std::size_t record_ = 0;
        const std::vector<LogRecord> *records_ = nullptr;
        std::string which_;
    };

    /**
     * Restartable view returned by iterate() and filter()
     */
    class RecordRange {
       public:
        const_iterator begin() const;
        const_iterator end() const;

       private:
        friend class LogReader;
        RecordRange(const LogReader *reader, std::string which)
            : reader_(reader), which_(std::move(which)) {}

        const LogReader *reader_;
        std::string which_;
    };
    using FilteredRange = RecordRange;

    /**
     * A route identifier (see parse_identifier), a web url embedding one,
     * or a direct file reference. Throws ParseError or ResolutionError.
     */
    explicit LogReader(const std::string &identifier,
                       ReaderOptions options = {});

    /**
     * Several identifiers read back to back
     */
    explicit LogReader(const std::vector<std::string> &identifiers,
                       ReaderOptions options = {});

    /**
     * Read explicit file references, skipping route resolution
     */
    static LogReader from_files(const std::vector<std::string> &references,
                                ReaderOptions options = {});

    LogReader(const LogReader &) = delete;
    LogReader &operator=(const LogReader &) = delete;
    LogReader(LogReader &&) = default;
    LogReader &operator=(LogReader &&) = default;
    ~LogReader() = default;

    RecordRange iterate() const { return RecordRange(this, ""); }
    const_iterator begin() const { return iterate().begin(); }
    const_iterator end() const { return iterate().end(); }

    /**
     * Records whose `which` equals the argument, in stream order
     */
    FilteredRange filter(const std::string &which) const;

    /**
     * First record of the given type. Segments after the match are not
     * fetched.
     */
    std::optional<LogRecord> first(const std::string &which) const;

    /**
     * Apply `fn` to the records of every segment using up to
     * `worker_count` threads. Results come back in segment order; segments
     * that fail to load are left out. `fn` runs concurrently and must be
     * safe to call from several threads. An exception thrown by `fn` is
     * rethrown here once all workers are done.
     */
    template <typename Fn>
    auto run_across_segments(std::size_t worker_count, Fn &&fn) const
        -> std::vector<
            std::invoke_result_t<Fn &, const std::vector<LogRecord> &>>;

    /**
     * Number of segment files the reader will read
     */
    std::size_t segment_count() const { return segments_.size(); }

    /**
     * Unavailable segments plus segments that failed to fetch or decode
     * so far
     */
    std::size_t skipped_segments() const;

    std::vector<std::string> references() const;

    const ReaderOptions &options() const { return options_; }

   private:
    explicit LogReader(ReaderOptions options);

    void add_identifier(const std::string &identifier);
    void add_reference(std::string reference);
    const std::vector<LogRecord> *segment_records(std::size_t position) const;

    ReaderOptions options_;
    std::shared_ptr<const FileFetcher> fetcher_;
    std::vector<std::unique_ptr<SegmentFetcher>> segments_;
    std::size_t unavailable_ = 0;
};

template <typename Fn>
auto LogReader::run_across_segments(std::size_t worker_count, Fn &&fn) const
    -> std::vector<std::invoke_result_t<Fn &, const std::vector<LogRecord> &>> {
    using Result = std::invoke_result_t<Fn &, const std::vector<LogRecord> &>;
    static_assert(!std::is_void<Result>::value,
                  "run_across_segments needs a function returning a value");

    if (worker_count == 0) {
        throw std::invalid_argument("worker count must be at least 1");
    }

    std::vector<std::optional<Result>> slots(segments_.size());
    std::vector<std::exception_ptr> failures(segments_.size());
    if (!segments_.empty()) {
        WorkerPool pool(std::min(worker_count, segments_.size()));
        for (std::size_t position = 0; position < segments_.size();
             ++position) {
            pool.submit([this, &fn, &slots, &failures, position] {
                try {
                    if (const auto *records = segment_records(position)) {
                        slots[position].emplace(fn(*records));
                    }
                } catch (...) {
                    failures[position] = std::current_exception();
                }
            });
        }
        pool.join();
    }

    for (const auto &failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

    std::vector<Result> results;
    results.reserve(slots.size());
    for (auto &slot : slots) {
        if (slot) results.push_back(std::move(*slot));
    }
    return results;
}

}  // namespace routelog

#endif  // ROUTELOG_READER_LOG_READER_H
