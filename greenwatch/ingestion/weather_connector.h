#pragma once

#include "greenwatch/ingestion/connector.h"

#include <string>

namespace GreenWatch::Ingestion {

/// OpenWeatherMap current weather: GET <endpoint>?lat=..&lon=..&appid=<key>&units=metric
class WeatherConnector final : public IWeatherConnector {
public:
    WeatherConnector(IHttpClient& http, std::string endpoint, std::string api_key, uint32_t retries);

    [[nodiscard]] auto fetchWeather(double latitude, double longitude) -> std::optional<WeatherContext> override;

    [[nodiscard]] static auto parseWeather(const std::string& body, double latitude, double longitude,
                                           WeatherContext* out) -> bool;

    [[nodiscard]] auto buildUrl(double latitude, double longitude) const -> std::string;

private:
    IHttpClient& http_;
    const std::string endpoint_;
    const std::string api_key_;
    const uint32_t retries_;
};

} // namespace GreenWatch::Ingestion
