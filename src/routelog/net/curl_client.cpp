#include "curl_client.h"

#include <routelog/common/error.h>
#include <routelog/common/logging.h>

#include <mutex>
#include <utility>

namespace routelog {

CurlHttpClient::CurlHttpClient() {
    static std::once_flag global_init;
    std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

CurlHttpClient::EasyHandle CurlHttpClient::make_handle(
    const std::string &url, std::chrono::seconds timeout) {
    EasyHandle handle(curl_easy_init());
    if (!handle) {
        throw FetchError("curl_easy_init failed for url: [" + url + "]");
    }
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT,
                     static_cast<long>(timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    return handle;
}

HttpResponse CurlHttpClient::perform(CURL *handle, const std::string &url,
                                     std::string *body) {
    auto res = curl_easy_perform(handle);
    if (res != CURLE_OK) {
        throw FetchError("request failed for the url: [" + url +
                         "] with the error message: " +
                         curl_easy_strerror(res));
    }
    HttpResponse response;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    if (body != nullptr) {
        response.body = std::move(*body);
    }
    ROUTELOG_LOG_DEBUG("{} -> {} ({} bytes)", url, response.status,
                       response.body.size());
    return response;
}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 std::chrono::seconds timeout) const {
    auto handle = make_handle(url, timeout);
    std::string body;
    curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION,
                     &CurlHttpClient::write_memory_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);
    return perform(handle.get(), url, &body);
}

long CurlHttpClient::head(const std::string &url,
                          std::chrono::seconds timeout) const {
    auto handle = make_handle(url, timeout);
    curl_easy_setopt(handle.get(), CURLOPT_NOBODY, 1L);
    return perform(handle.get(), url, nullptr).status;
}

std::string CurlHttpClient::encode(const std::string &str) const {
    auto curl_str_deleter = [](char *s) { curl_free(s); };
    auto encoded_str = std::unique_ptr<char, decltype(curl_str_deleter)>(
        curl_easy_escape(nullptr, str.c_str(), static_cast<int>(str.length())),
        curl_str_deleter);
    if (!encoded_str) {
        return str;
    }
    return std::string(encoded_str.get());
}

size_t CurlHttpClient::write_memory_callback(void *contents,
                                             size_t element_size,
                                             size_t elements_count,
                                             void *user_pointer) {
    size_t size_increment = element_size * elements_count;
    auto body = static_cast<std::string *>(user_pointer);
    body->append(static_cast<const char *>(contents), size_increment);
    return size_increment;
}

std::shared_ptr<HttpClient> make_curl_client() {
    return std::make_shared<CurlHttpClient>();
}

}  // namespace routelog
