#ifndef ROUTELOG_NET_HTTP_CLIENT_H
#define ROUTELOG_NET_HTTP_CLIENT_H

#include <chrono>
#include <memory>
#include <string>

namespace routelog {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * Minimal http client used for backend lookups and segment downloads.
 * Implementations must be safe to call from several threads at once.
 */
class HttpClient {
   public:
    virtual ~HttpClient() = default;

    /**
     * Execute a GET request. Transport failures (including an exceeded
     * timeout) throw FetchError; any http status is returned as is.
     */
    virtual HttpResponse get(const std::string &url,
                             std::chrono::seconds timeout) const = 0;

    /**
     * Execute a HEAD request and return the http status. Transport failures
     * throw FetchError.
     */
    virtual long head(const std::string &url,
                      std::chrono::seconds timeout) const = 0;

    /**
     * Escape a string for use inside a url path or query
     */
    virtual std::string encode(const std::string &str) const = 0;
};

/**
 * libcurl backed HttpClient
 */
std::shared_ptr<HttpClient> make_curl_client();

}  // namespace routelog

#endif  // ROUTELOG_NET_HTTP_CLIENT_H
