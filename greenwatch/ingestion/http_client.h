#pragma once

#include "common/macros.h"

#include <cstdint>
#include <mutex>
#include <string>

namespace GreenWatch::Ingestion {

enum class HttpStatus : uint8_t {
    OK = 0,
    TIMEOUT = 1,
    NETWORK_ERROR = 2,
    HTTP_ERROR = 3     // transport succeeded, status code outside 2xx
};

constexpr auto httpStatusName(HttpStatus status) noexcept -> const char* {
    switch (status) {
        case HttpStatus::OK:            return "OK";
        case HttpStatus::TIMEOUT:       return "TIMEOUT";
        case HttpStatus::NETWORK_ERROR: return "NETWORK_ERROR";
        case HttpStatus::HTTP_ERROR:    return "HTTP_ERROR";
    }
    return "UNKNOWN";
}

struct HttpResponse {
    HttpStatus status{HttpStatus::NETWORK_ERROR};
    long http_code{0};
    std::string body;
    std::string error;

    [[nodiscard]] auto ok() const noexcept -> bool { return status == HttpStatus::OK; }
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    [[nodiscard]] virtual auto get(const std::string& url) -> HttpResponse = 0;
};

/// Blocking GET over one reusable libcurl easy handle.
/// curl_global_init() must have been called by the process before construction.
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(uint32_t timeout_seconds);
    ~CurlHttpClient() override;
    DELETE_COPY_AND_MOVE(CurlHttpClient);

    [[nodiscard]] auto get(const std::string& url) -> HttpResponse override;

private:
    static auto writeCallback(void* contents, size_t size, size_t nmemb, void* userp) -> size_t;

    static constexpr size_t MAX_RESPONSE_BYTES = 1 << 20;

    const long timeout_seconds_;
    void* curl_handle_{nullptr};
    std::mutex mutex_;
};

} // namespace GreenWatch::Ingestion
