#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>

namespace rtvoice {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* buffer = static_cast<std::string*>(userp);
    size_t total_size = size * nmemb;
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

Result<HttpResponse> CurlHttpClient::post_json(const std::string& url,
                                               const std::string& body,
                                               const std::map<std::string, std::string>& headers,
                                               int timeout_ms) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_network_error("Failed to initialize CURL");
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    for (const auto& header : headers) {
        std::string line = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    std::string response_buffer;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    LOG_DEBUG("POST " + url);
    CURLcode res = curl_easy_perform(curl);

    HttpResponse response;
    std::string error_msg;
    if (res != CURLE_OK) {
        error_msg = curl_easy_strerror(res);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        response.body = std::move(response_buffer);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (!error_msg.empty()) {
        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("POST " + url + " timed out");
        }
        return make_network_error("POST " + url + " failed: " + error_msg);
    }
    return response;
}

} // namespace rtvoice
