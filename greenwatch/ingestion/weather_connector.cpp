#include "weather_connector.h"
#include "common/logging.h"

#include <rapidjson/document.h>

#include <cstdio>
#include <utility>

namespace GreenWatch::Ingestion {

namespace {

auto number(const rapidjson::Value& obj, const char* key) -> std::optional<double> {
    if (!obj.IsObject() || !obj.HasMember(key) || !obj[key].IsNumber()) return std::nullopt;
    return obj[key].GetDouble();
}

} // namespace

WeatherConnector::WeatherConnector(IHttpClient& http, std::string endpoint, std::string api_key, uint32_t retries)
    : http_(http), endpoint_(std::move(endpoint)), api_key_(std::move(api_key)), retries_(retries) {}

auto WeatherConnector::buildUrl(double latitude, double longitude) const -> std::string {
    char coords[96];
    snprintf(coords, sizeof(coords), "?lat=%.6f&lon=%.6f", latitude, longitude);
    return endpoint_ + coords + "&appid=" + api_key_ + "&units=metric";
}

auto WeatherConnector::parseWeather(const std::string& body, double latitude, double longitude,
                                    WeatherContext* out) -> bool {
    rapidjson::Document doc;
    doc.Parse(body.c_str(), body.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        LOG_ERROR("OpenWeatherMap returned malformed JSON");
        return false;
    }

    static const rapidjson::Value empty(rapidjson::kObjectType);
    const auto& main = doc.HasMember("main") && doc["main"].IsObject() ? doc["main"] : empty;
    const auto& wind = doc.HasMember("wind") && doc["wind"].IsObject() ? doc["wind"] : empty;
    const auto& clouds = doc.HasMember("clouds") && doc["clouds"].IsObject() ? doc["clouds"] : empty;

    WeatherContext ctx;
    ctx.latitude = latitude;
    ctx.longitude = longitude;
    if (auto dt = number(doc, "dt")) {
        ctx.timestamp = Common::secondsToNanos(static_cast<int64_t>(*dt));
    }
    ctx.temperature = number(main, "temp");
    ctx.feels_like = number(main, "feels_like");
    ctx.humidity = number(main, "humidity");
    ctx.pressure = number(main, "pressure");
    ctx.wind_speed = number(wind, "speed");
    ctx.wind_direction = number(wind, "deg");
    ctx.wind_gust = number(wind, "gust");
    ctx.visibility = number(doc, "visibility");
    if (auto all = number(clouds, "all")) {
        ctx.cloud_cover = static_cast<int>(*all);
    }
    if (doc.HasMember("weather") && doc["weather"].IsArray() && !doc["weather"].Empty()) {
        const auto& first = doc["weather"][0];
        if (first.IsObject() && first.HasMember("description") && first["description"].IsString()) {
            ctx.description = first["description"].GetString();
        }
    }
    ctx.is_inversion_likely = isInversionLikely(ctx.wind_speed, ctx.humidity);

    *out = std::move(ctx);
    return true;
}

auto WeatherConnector::fetchWeather(double latitude, double longitude) -> std::optional<WeatherContext> {
    if (api_key_.empty()) {
        LOG_ERROR("OPENWEATHER_API_KEY not set; weather enrichment unavailable");
        return std::nullopt;
    }

    const auto response = getWithRetry(http_, buildUrl(latitude, longitude), retries_);
    if (!response.ok()) {
        LOG_ERROR("OpenWeatherMap request for %.4f,%.4f failed: %s %s", latitude, longitude,
                  httpStatusName(response.status), response.error.c_str());
        return std::nullopt;
    }

    WeatherContext ctx;
    if (!parseWeather(response.body, latitude, longitude, &ctx)) {
        return std::nullopt;
    }

    LOG_INFO("Weather fetched for %.4f,%.4f: T=%.1fC, Wind=%.1fm/s, Humidity=%.0f%%%s", latitude, longitude,
             ctx.temperature.value_or(0.0), ctx.wind_speed.value_or(0.0), ctx.humidity.value_or(0.0),
             ctx.is_inversion_likely ? " (inversion likely)" : "");
    return ctx;
}

} // namespace GreenWatch::Ingestion
