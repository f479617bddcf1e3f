#include "http_client.h"
#include "common/logging.h"

#include <curl/curl.h>

namespace GreenWatch::Ingestion {

CurlHttpClient::CurlHttpClient(uint32_t timeout_seconds)
    : timeout_seconds_(static_cast<long>(timeout_seconds)) {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        LOG_ERROR("Failed to initialize CURL handle");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_handle_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_handle_));
        curl_handle_ = nullptr;
    }
}

auto CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) -> size_t {
    auto* body = static_cast<std::string*>(userp);
    const size_t total = size * nmemb;
    if (body->size() + total > MAX_RESPONSE_BYTES) {
        // Abort oversized responses
        return 0;
    }
    body->append(static_cast<const char*>(contents), total);
    return total;
}

auto CurlHttpClient::get(const std::string& url) -> HttpResponse {
    HttpResponse response;
    std::lock_guard<std::mutex> lock(mutex_);

    if (!curl_handle_) {
        response.status = HttpStatus::NETWORK_ERROR;
        response.error = "CURL handle not initialized";
        return response;
    }

    CURL* curl = static_cast<CURL*>(curl_handle_);
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.status = res == CURLE_OPERATION_TIMEDOUT ? HttpStatus::TIMEOUT : HttpStatus::NETWORK_ERROR;
        response.error = curl_easy_strerror(res);
        return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.http_code);
    if (response.http_code < 200 || response.http_code >= 300) {
        response.status = HttpStatus::HTTP_ERROR;
        response.error = "HTTP " + std::to_string(response.http_code);
        return response;
    }

    response.status = HttpStatus::OK;
    return response;
}

} // namespace GreenWatch::Ingestion
