#pragma once

#include <string>
#include <vector>
#include <utility>

namespace crossarb {

struct HttpResponse {
    long status{0};
    std::string body;
    std::string error;      // Transport failure; empty when a response arrived

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

/**
 * Blocking libcurl wrapper. Never throws; transport failures are reported
 * in HttpResponse::error.
 */
class HttpClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit HttpClient(long timeout_ms = 10000);

    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const Headers& headers = {},
                         const std::string& body = "") const;

    HttpResponse get(const std::string& url, const Headers& headers = {}) const {
        return request("GET", url, headers);
    }

    long timeout_ms() const { return timeout_ms_; }

private:
    long timeout_ms_;
};

} // namespace crossarb
