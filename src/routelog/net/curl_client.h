#ifndef ROUTELOG_NET_CURL_CLIENT_H
#define ROUTELOG_NET_CURL_CLIENT_H

#include <curl/curl.h>
#include <routelog/net/http_client.h>

#include <memory>
#include <string>

namespace routelog {

class CurlHttpClient : public HttpClient {
   public:
    CurlHttpClient();
    ~CurlHttpClient() override = default;
    CurlHttpClient(const CurlHttpClient &) = delete;
    CurlHttpClient &operator=(const CurlHttpClient &) = delete;

    HttpResponse get(const std::string &url,
                     std::chrono::seconds timeout) const override;
    long head(const std::string &url,
              std::chrono::seconds timeout) const override;
    std::string encode(const std::string &str) const override;

   private:
    struct EasyDeleter {
        void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
    };
    using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

    static EasyHandle make_handle(const std::string &url,
                                  std::chrono::seconds timeout);
    static HttpResponse perform(CURL *handle, const std::string &url,
                                std::string *body);
    static size_t write_memory_callback(void *contents, size_t element_size,
                                        size_t elements_count,
                                        void *user_pointer);
};

}  // namespace routelog

#endif  // ROUTELOG_NET_CURL_CLIENT_H
