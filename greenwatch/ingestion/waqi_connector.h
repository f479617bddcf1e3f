#pragma once

#include "greenwatch/ingestion/connector.h"

#include <string>

namespace GreenWatch::Ingestion {

/// World Air Quality Index station feed: GET <endpoint>/feed/@<waqi_id>/?token=<token>
class WaqiConnector final : public IReadingConnector {
public:
    WaqiConnector(IHttpClient& http, std::string endpoint, std::string token, uint32_t retries);

    [[nodiscard]] auto fetchReading(const StationConfig& station) -> std::optional<Reading> override;

    /// Maps a feed payload onto a Reading for station. False on malformed or non-"ok" payloads.
    [[nodiscard]] static auto parseFeed(const std::string& body, const StationConfig& station, Reading* out) -> bool;

    [[nodiscard]] auto buildUrl(const std::string& waqi_id) const -> std::string;

private:
    IHttpClient& http_;
    const std::string endpoint_;
    const std::string token_;
    const uint32_t retries_;
};

} // namespace GreenWatch::Ingestion
