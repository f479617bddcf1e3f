#include "waqi_connector.h"
#include "common/logging.h"
#include "common/time_utils.h"

#include <rapidjson/document.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace GreenWatch::Ingestion {

namespace {

struct MetKey {
    const char* key;
    MetField field;
};

constexpr MetKey MET_KEYS[] = {
    {"t",   MetField::TEMPERATURE},
    {"h",   MetField::HUMIDITY},
    {"w",   MetField::WIND_SPEED},
    {"wd",  MetField::WIND_DIRECTION},
    {"p",   MetField::PRESSURE},
    {"dew", MetField::DEW_POINT}
};

/// Numbers pass through; numeric strings are converted; "-" and anything else is absent
auto toDouble(const rapidjson::Value& v) -> std::optional<double> {
    if (v.IsNumber()) return v.GetDouble();
    if (v.IsString()) {
        const char* s = v.GetString();
        if (*s == '\0') return std::nullopt;
        char* end = nullptr;
        errno = 0;
        const double d = std::strtod(s, &end);
        if (errno != 0 || end == s || *end != '\0') return std::nullopt;
        return d;
    }
    return std::nullopt;
}

auto iaqiValue(const rapidjson::Value& iaqi, const char* key) -> std::optional<double> {
    if (!iaqi.HasMember(key)) return std::nullopt;
    const auto& entry = iaqi[key];
    if (!entry.IsObject() || !entry.HasMember("v")) return std::nullopt;
    return toDouble(entry["v"]);
}

auto parseTime(const rapidjson::Value& data) -> std::optional<EpochNanos> {
    if (!data.HasMember("time") || !data["time"].IsObject()) return std::nullopt;
    const auto& time = data["time"];

    EpochNanos ts = 0;
    if (time.HasMember("iso") && time["iso"].IsString() && Common::parseIso8601(time["iso"].GetString(), &ts)) {
        return ts;
    }
    // Naive local string; treated as UTC
    if (time.HasMember("s") && time["s"].IsString() && Common::parseIso8601(time["s"].GetString(), &ts)) {
        return ts;
    }
    return std::nullopt;
}

} // namespace

WaqiConnector::WaqiConnector(IHttpClient& http, std::string endpoint, std::string token, uint32_t retries)
    : http_(http), endpoint_(std::move(endpoint)), token_(std::move(token)), retries_(retries) {}

auto WaqiConnector::buildUrl(const std::string& waqi_id) const -> std::string {
    return endpoint_ + "/feed/@" + waqi_id + "/?token=" + token_;
}

auto WaqiConnector::parseFeed(const std::string& body, const StationConfig& station, Reading* out) -> bool {
    rapidjson::Document doc;
    doc.Parse(body.c_str(), body.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        LOG_ERROR("WAQI returned malformed JSON for station %s", station.station_id.c_str());
        return false;
    }

    if (!doc.HasMember("status") || !doc["status"].IsString() || std::string(doc["status"].GetString()) != "ok") {
        LOG_ERROR("WAQI status not ok for station %s: %s", station.station_id.c_str(),
                  doc.HasMember("data") && doc["data"].IsString() ? doc["data"].GetString() : "unknown");
        return false;
    }

    if (!doc.HasMember("data") || !doc["data"].IsObject()) {
        LOG_ERROR("WAQI response missing 'data' for station %s", station.station_id.c_str());
        return false;
    }
    const auto& data = doc["data"];

    Reading reading;
    reading.station_id = station.station_id;
    reading.timestamp = parseTime(data);

    if (data.HasMember("iaqi") && data["iaqi"].IsObject()) {
        const auto& iaqi = data["iaqi"];
        for (auto p : ALL_POLLUTANTS) {
            if (auto v = iaqiValue(iaqi, pollutantKey(p))) {
                reading.setPollutant(p, *v);
            }
        }
        for (const auto& m : MET_KEYS) {
            if (auto v = iaqiValue(iaqi, m.key)) {
                reading.met.set(m.field, *v);
            }
        }
    }

    reading.source.station_name = station.name.empty() ? station.station_id : station.name;
    if (data.HasMember("city") && data["city"].IsObject()) {
        const auto& city = data["city"];
        if (city.HasMember("name") && city["name"].IsString()) {
            reading.source.station_name = city["name"].GetString();
        }
        if (city.HasMember("url") && city["url"].IsString()) {
            reading.source.source_url = city["url"].GetString();
        }
    }
    if (data.HasMember("aqi")) {
        // Only finite values in int range are representable
        auto aqi = toDouble(data["aqi"]);
        if (aqi && std::isfinite(*aqi) && *aqi >= static_cast<double>(std::numeric_limits<int>::min()) &&
            *aqi <= static_cast<double>(std::numeric_limits<int>::max())) {
            reading.source.aqi = static_cast<int>(*aqi);
        }
    }

    *out = std::move(reading);
    return true;
}

auto WaqiConnector::fetchReading(const StationConfig& station) -> std::optional<Reading> {
    if (token_.empty()) {
        LOG_ERROR("WAQI_TOKEN not set; cannot fetch station %s", station.station_id.c_str());
        return std::nullopt;
    }
    if (station.waqi_id.empty()) {
        LOG_WARN("Station %s has no waqi_id", station.station_id.c_str());
        return std::nullopt;
    }

    const auto response = getWithRetry(http_, buildUrl(station.waqi_id), retries_);
    if (!response.ok()) {
        LOG_ERROR("WAQI request for station %s (@%s) failed: %s %s", station.station_id.c_str(),
                  station.waqi_id.c_str(), httpStatusName(response.status), response.error.c_str());
        return std::nullopt;
    }

    Reading reading;
    if (!parseFeed(response.body, station, &reading)) {
        return std::nullopt;
    }

    const auto& pm25 = reading.pollutant(Pollutant::PM25);
    LOG_INFO("WAQI reading fetched for station %s: PM2.5=%.1f, AQI=%d", station.station_id.c_str(),
             pm25 ? *pm25 : 0.0, reading.source.aqi ? *reading.source.aqi : -1);
    return reading;
}

} // namespace GreenWatch::Ingestion
