#ifndef ROUTELOG_FETCH_FILE_FETCHER_H
#define ROUTELOG_FETCH_FILE_FETCHER_H

#include <routelog/fetch/file_cache.h>
#include <routelog/fetch/retry.h>
#include <routelog/net/http_client.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace routelog {

/**
 * Retrieves the raw bytes behind a file reference: a local path, a
 * file:// url or an http(s) url. Remote files go through the cache when one
 * is configured and are retried on transport errors and 5xx responses.
 */
class FileFetcher {
   public:
    FileFetcher(std::shared_ptr<HttpClient> http,
                std::shared_ptr<const FileCache> cache,
                std::shared_ptr<const RetryPolicy> retry,
                std::chrono::seconds timeout);

    /**
     * Throws FetchError when the file cannot be retrieved
     */
    std::string fetch(const std::string &reference) const;

    /**
     * Number of remote downloads performed (cache hits excluded)
     */
    std::size_t download_count() const { return downloads_.load(); }

    static bool is_remote(const std::string &reference);

   private:
    std::string fetch_local(const std::string &reference) const;
    std::string download(const std::string &url) const;

    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<const FileCache> cache_;
    std::shared_ptr<const RetryPolicy> retry_;
    std::chrono::seconds timeout_;
    mutable std::atomic<std::size_t> downloads_{0};
};

}  // namespace routelog

#endif  // ROUTELOG_FETCH_FILE_FETCHER_H
