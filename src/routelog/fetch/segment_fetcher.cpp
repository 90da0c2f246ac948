#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/fetch/segment_fetcher.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace routelog {

SegmentFetcher::SegmentFetcher(std::string reference,
                               std::shared_ptr<const FileFetcher> fetcher,
                               std::shared_ptr<const RecordDecoder> decoder,
                               bool sort_by_time)
    : SegmentFetcher(std::vector<std::string>{std::move(reference)},
                     std::move(fetcher), std::move(decoder), sort_by_time) {}

SegmentFetcher::SegmentFetcher(std::vector<std::string> candidates,
                               std::shared_ptr<const FileFetcher> fetcher,
                               std::shared_ptr<const RecordDecoder> decoder,
                               bool sort_by_time)
    : candidates_(std::move(candidates)),
      fetcher_(std::move(fetcher)),
      decoder_(std::move(decoder)),
      sort_by_time_(sort_by_time) {
    if (candidates_.empty()) {
        throw std::invalid_argument("segment needs at least one file");
    }
}

std::vector<LogRecord> SegmentFetcher::load(
    const std::string &reference) const {
    ROUTELOG_LOG_DEBUG("Fetching segment {}", reference);
    auto records = decoder_->decode(fetcher_->fetch(reference));
    if (sort_by_time_) {
        std::stable_sort(records.begin(), records.end(),
                         [](const LogRecord &a, const LogRecord &b) {
                             return a.log_mono_time < b.log_mono_time;
                         });
    }
    ROUTELOG_LOG_DEBUG("Segment {} decoded to {} records", reference,
                       records.size());
    return records;
}

void SegmentFetcher::materialize_locked() const {
    if (records_ || failure_) return;
    std::exception_ptr last_failure;
    for (std::size_t i = 0; i < candidates_.size(); ++i) {
        try {
            records_ = load(candidates_[i]);
            chosen_ = i;
            return;
        } catch (const Error &e) {
            last_failure = std::current_exception();
            if (i + 1 < candidates_.size()) {
                ROUTELOG_LOG_INFO("Falling back from {} to {}: {}",
                                  candidates_[i], candidates_[i + 1],
                                  e.what());
            } else {
                ROUTELOG_LOG_WARN("Skipping segment {}: {}", candidates_[i],
                                  e.what());
            }
        }
    }
    failure_ = last_failure;
}

const std::vector<LogRecord> &SegmentFetcher::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    materialize_locked();
    if (failure_) {
        std::rethrow_exception(failure_);
    }
    return *records_;
}

const std::string &SegmentFetcher::reference() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return candidates_[chosen_];
}

const std::vector<LogRecord> *SegmentFetcher::try_records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    materialize_locked();
    return records_ ? &*records_ : nullptr;
}

bool SegmentFetcher::materialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.has_value();
}

bool SegmentFetcher::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(failure_);
}

}  // namespace routelog
