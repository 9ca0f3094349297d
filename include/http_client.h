#pragma once

#include "errors.h"
#include <map>
#include <memory>
#include <string>

namespace rtvoice {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking JSON-over-HTTP client
 *
 * A transport failure (DNS, TLS, timeout) is an error; any HTTP status,
 * including 4xx/5xx, is a successful response for the caller to inspect.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief POST a JSON body
     * @param headers Extra headers; Content-Type: application/json is always sent
     */
    virtual Result<HttpResponse> post_json(const std::string& url,
                                           const std::string& body,
                                           const std::map<std::string, std::string>& headers,
                                           int timeout_ms) = 0;
};

/**
 * @brief libcurl implementation (one easy handle per request, thread-safe)
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<HttpResponse> post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers,
                                   int timeout_ms) override;
};

} // namespace rtvoice
