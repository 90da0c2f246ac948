#ifndef ROUTELOG_FETCH_SEGMENT_FETCHER_H
#define ROUTELOG_FETCH_SEGMENT_FETCHER_H

#include <routelog/fetch/decoder.h>
#include <routelog/fetch/file_fetcher.h>
#include <routelog/reader/log_record.h>

#include <exception>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace routelog {

/**
 * One segment and its decoded records.
 *
 * The segment may have several candidate files in preference order. On the
 * first call to records() each candidate is fetched and decoded in turn
 * until one succeeds, and the outcome (records or the last error) is kept,
 * so re-iterating never fetches twice. Safe to call from several threads.
 */
class SegmentFetcher {
   public:
    SegmentFetcher(std::string reference,
                   std::shared_ptr<const FileFetcher> fetcher,
                   std::shared_ptr<const RecordDecoder> decoder,
                   bool sort_by_time = false);

    /**
     * `candidates` must not be empty
     */
    SegmentFetcher(std::vector<std::string> candidates,
                   std::shared_ptr<const FileFetcher> fetcher,
                   std::shared_ptr<const RecordDecoder> decoder,
                   bool sort_by_time = false);

    SegmentFetcher(const SegmentFetcher &) = delete;
    SegmentFetcher &operator=(const SegmentFetcher &) = delete;

    /**
     * Throws FetchError or DecodeError, the same one on every call once
     * the segment has failed
     */
    const std::vector<LogRecord> &records() const;

    /**
     * Like records(), but returns nullptr instead of throwing. The failure
     * is logged once.
     */
    const std::vector<LogRecord> *try_records() const;

    bool materialized() const;
    bool failed() const;

    /**
     * The candidate that produced the records, or the preferred one before
     * materialization
     */
    const std::string &reference() const;

   private:
    void materialize_locked() const;
    std::vector<LogRecord> load(const std::string &reference) const;

    std::vector<std::string> candidates_;
    std::shared_ptr<const FileFetcher> fetcher_;
    std::shared_ptr<const RecordDecoder> decoder_;
    bool sort_by_time_;

    mutable std::mutex mutex_;
    mutable std::size_t chosen_ = 0;
    mutable std::optional<std::vector<LogRecord>> records_;
    mutable std::exception_ptr failure_;
};

}  // namespace routelog

#endif  // ROUTELOG_FETCH_SEGMENT_FETCHER_H
