#include "utils/http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace crossarb {

namespace {
    size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    std::once_flag curl_init_flag;
}

HttpClient::HttpClient(long timeout_ms)
    : timeout_ms_(timeout_ms)
{
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpResponse HttpClient::request(const std::string& method,
                                 const std::string& url,
                                 const Headers& headers,
                                 const std::string& body) const {
    HttpResponse response;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (!body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    if (!body.empty()) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }
    for (const auto& [name, value] : headers) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl.get());
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        response.error = std::string("CURL request failed: ") + curl_easy_strerror(res);
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace crossarb
