#include <routelog/common/error.h>
#include <routelog/common/logging.h>
#include <routelog/fetch/file_fetcher.h>
#include <routelog/utils/filesystem.h>

#include <exception>
#include <thread>
#include <utility>

namespace routelog {

FileFetcher::FileFetcher(std::shared_ptr<HttpClient> http,
                         std::shared_ptr<const FileCache> cache,
                         std::shared_ptr<const RetryPolicy> retry,
                         std::chrono::seconds timeout)
    : http_(std::move(http)),
      cache_(std::move(cache)),
      retry_(std::move(retry)),
      timeout_(timeout) {
    if (!retry_) {
        retry_ = std::make_shared<NoRetry>();
    }
}

bool FileFetcher::is_remote(const std::string &reference) {
    return reference.rfind("http://", 0) == 0 ||
           reference.rfind("https://", 0) == 0;
}

std::string FileFetcher::fetch(const std::string &reference) const {
    if (!is_remote(reference)) {
        return fetch_local(reference);
    }

    std::string bytes;
    if (cache_ && cache_->load(reference, bytes)) {
        return bytes;
    }

    bytes = download(reference);
    if (cache_ && !cache_->store(reference, bytes)) {
        ROUTELOG_LOG_WARN("Skipped caching {}", reference);
    }
    return bytes;
}

std::string FileFetcher::fetch_local(const std::string &reference) const {
    std::string path = utils::local_path(reference);
    std::string bytes;
    if (!utils::read_file(path, bytes)) {
        throw FetchError("cannot read file " + path);
    }
    return bytes;
}

std::string FileFetcher::download(const std::string &url) const {
    if (!http_) {
        throw FetchError("no http client configured for " + url);
    }

    int attempts = retry_->max_attempts();
    std::exception_ptr last_failure;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            auto pause = retry_->delay(attempt);
            ROUTELOG_LOG_DEBUG("Retrying {} in {} ms (attempt {}/{})", url,
                               pause.count(), attempt, attempts);
            std::this_thread::sleep_for(pause);
        }

        HttpResponse response;
        try {
            ++downloads_;
            response = http_->get(url, timeout_);
        } catch (const FetchError &e) {
            ROUTELOG_LOG_WARN("Download of {} failed: {}", url, e.what());
            last_failure = std::current_exception();
            continue;
        }

        if (response.ok()) {
            return std::move(response.body);
        }
        std::string message =
            "HTTP " + std::to_string(response.status) + " for " + url;
        last_failure = std::make_exception_ptr(FetchError(message));
        if (response.status < 500) {
            break;
        }
        ROUTELOG_LOG_WARN("{}", message);
    }
    std::rethrow_exception(last_failure);
}

}  // namespace routelog
