#pragma once

#include "config/config.h"
#include "greenwatch/ingestion/http_client.h"
#include "greenwatch/types.h"

#include <optional>
#include <string>

namespace GreenWatch::Ingestion {

/// Current weather at a location, as reported by the weather service
struct WeatherContext {
    double latitude{0.0};
    double longitude{0.0};
    EpochNanos timestamp{0};
    std::optional<double> temperature;
    std::optional<double> feels_like;
    std::optional<double> humidity;
    std::optional<double> pressure;
    std::optional<double> wind_speed;
    std::optional<double> wind_direction;
    std::optional<double> wind_gust;
    std::optional<double> visibility;
    std::optional<int> cloud_cover;
    std::string description;
    bool is_inversion_likely{false};

    /// Copies weather fields into met slots the reading left empty
    auto fillMissing(MetContext* met) const noexcept -> void {
        auto fill = [met](MetField f, const std::optional<double>& v) {
            if (v && !met->get(f)) met->set(f, *v);
        };
        fill(MetField::TEMPERATURE, temperature);
        fill(MetField::HUMIDITY, humidity);
        fill(MetField::WIND_SPEED, wind_speed);
        fill(MetField::WIND_DIRECTION, wind_direction);
        fill(MetField::PRESSURE, pressure);
    }
};

/// Low wind with high humidity traps pollutants near ground level
constexpr auto isInversionLikely(const std::optional<double>& wind_speed,
                                 const std::optional<double>& humidity) noexcept -> bool {
    return wind_speed && humidity && *wind_speed < 2.0 && *humidity > 80.0;
}

/// Fetches the latest reading for a station. Any failure yields no reading this cycle.
class IReadingConnector {
public:
    virtual ~IReadingConnector() = default;
    [[nodiscard]] virtual auto fetchReading(const StationConfig& station) -> std::optional<Reading> = 0;
};

class IWeatherConnector {
public:
    virtual ~IWeatherConnector() = default;
    [[nodiscard]] virtual auto fetchWeather(double latitude, double longitude) -> std::optional<WeatherContext> = 0;
};

/// GET with up to `retries` extra attempts on timeout; other failures are not retried
[[nodiscard]] inline auto getWithRetry(IHttpClient& http, const std::string& url, uint32_t retries) -> HttpResponse {
    HttpResponse response = http.get(url);
    for (uint32_t attempt = 0; attempt < retries && response.status == HttpStatus::TIMEOUT; ++attempt) {
        response = http.get(url);
    }
    return response;
}

} // namespace GreenWatch::Ingestion
