#include <gtest/gtest.h>
#include "common/logging.h"
#include "config/config.h"
#include "greenwatch/ingestion/connector.h"
#include "greenwatch/ingestion/http_client.h"
#include "greenwatch/ingestion/waqi_connector.h"
#include "greenwatch/ingestion/weather_connector.h"

#include <chrono>
#include <deque>
#include <filesystem>
#include <string>
#include <vector>

using namespace GreenWatch;
using namespace GreenWatch::Ingestion;

namespace {

/// Replays canned responses in order and records every requested URL
class FakeHttpClient final : public IHttpClient {
public:
    auto push(HttpStatus status, std::string body = {}, long code = 200) -> void {
        HttpResponse r;
        r.status = status;
        r.http_code = code;
        r.body = std::move(body);
        if (status != HttpStatus::OK) r.error = httpStatusName(status);
        responses_.push_back(std::move(r));
    }

    auto get(const std::string& url) -> HttpResponse override {
        urls.push_back(url);
        if (responses_.empty()) {
            HttpResponse r;
            r.status = HttpStatus::NETWORK_ERROR;
            r.error = "no canned response";
            return r;
        }
        HttpResponse r = std::move(responses_.front());
        responses_.pop_front();
        return r;
    }

    std::vector<std::string> urls;

private:
    std::deque<HttpResponse> responses_;
};

constexpr const char* WAQI_FEED = R"({
  "status": "ok",
  "data": {
    "aqi": 178,
    "idx": 2553,
    "city": {"name": "Anand Vihar, Delhi, India", "url": "https://aqicn.org/city/delhi/anand-vihar"},
    "time": {"s": "2024-01-15 15:30:00", "tz": "+05:30", "iso": "2024-01-15T15:30:00+05:30"},
    "iaqi": {
      "pm25": {"v": 178},
      "pm10": {"v": 142.5},
      "no2": {"v": "38.2"},
      "so2": {"v": "-"},
      "o3": {"v": 12},
      "t": {"v": 18.5},
      "h": {"v": 82},
      "w": {"v": 1.1},
      "wd": {"v": 270},
      "p": {"v": 1016},
      "dew": {"v": 11}
    }
  }
})";

} // namespace

// =============================================================================
// CONNECTOR TEST BASE
// =============================================================================

class ConnectorTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

        test_log_dir_ = "logs/test_connectors_" + std::to_string(timestamp);
        std::filesystem::create_directories(test_log_dir_);

        std::string log_file = test_log_dir_ + "/connectors_test.log";
        Common::initLogging(log_file.c_str());

        LOG_INFO("=== Starting Connector Test ===");

        station_.station_id = "DL001";
        station_.name = "Anand Vihar";
        station_.waqi_id = "2553";
        station_.latitude = 28.6469;
        station_.longitude = 77.3164;
    }

    void TearDown() override {
        LOG_INFO("=== Connector Test Completed ===");
        Common::shutdownLogging();
    }

    std::string test_log_dir_;
    StationConfig station_;
};

// =============================================================================
// 1. WAQI FEED
// =============================================================================

TEST_F(ConnectorTestBase, WaqiFeedParsingContract) {
    // === GIVEN / WHEN ===
    Reading reading;
    ASSERT_TRUE(WaqiConnector::parseFeed(WAQI_FEED, station_, &reading));

    // === THEN ===
    EXPECT_EQ(reading.station_id, "DL001");
    ASSERT_TRUE(reading.timestamp.has_value());
    EXPECT_EQ(*reading.timestamp, 1705312800LL * Common::NANOS_PER_SECOND) << "Offset normalised to UTC";

    EXPECT_DOUBLE_EQ(*reading.pollutant(Pollutant::PM25), 178.0);
    EXPECT_DOUBLE_EQ(*reading.pollutant(Pollutant::PM10), 142.5);
    EXPECT_DOUBLE_EQ(*reading.pollutant(Pollutant::NO2), 38.2) << "Numeric strings accepted";
    EXPECT_FALSE(reading.pollutant(Pollutant::SO2).has_value()) << "'-' means not reported";
    EXPECT_FALSE(reading.pollutant(Pollutant::CO).has_value());
    EXPECT_DOUBLE_EQ(*reading.pollutant(Pollutant::O3), 12.0);

    EXPECT_DOUBLE_EQ(*reading.met.get(MetField::TEMPERATURE), 18.5);
    EXPECT_DOUBLE_EQ(*reading.met.get(MetField::HUMIDITY), 82.0);
    EXPECT_DOUBLE_EQ(*reading.met.get(MetField::WIND_SPEED), 1.1);
    EXPECT_DOUBLE_EQ(*reading.met.get(MetField::WIND_DIRECTION), 270.0);
    EXPECT_DOUBLE_EQ(*reading.met.get(MetField::PRESSURE), 1016.0);
    EXPECT_DOUBLE_EQ(*reading.met.get(MetField::DEW_POINT), 11.0);

    EXPECT_EQ(reading.source.station_name, "Anand Vihar, Delhi, India");
    EXPECT_EQ(reading.source.source_url, "https://aqicn.org/city/delhi/anand-vihar");
    ASSERT_TRUE(reading.source.aqi.has_value());
    EXPECT_EQ(*reading.source.aqi, 178);
}

TEST_F(ConnectorTestBase, WaqiNaiveTimeFallbackContract) {
    const std::string body = R"({"status":"ok","data":{"time":{"s":"2024-01-15 10:00:00"},
                                 "iaqi":{"pm25":{"v":90}}}})";
    Reading reading;
    ASSERT_TRUE(WaqiConnector::parseFeed(body, station_, &reading));
    ASSERT_TRUE(reading.timestamp.has_value());
    EXPECT_EQ(*reading.timestamp, 1705312800LL * Common::NANOS_PER_SECOND);
    EXPECT_EQ(reading.source.station_name, "Anand Vihar") << "Configured name when the feed has no city";
}

TEST_F(ConnectorTestBase, WaqiMissingTimeLeavesTimestampEmptyContract) {
    const std::string body = R"({"status":"ok","data":{"iaqi":{"pm25":{"v":90}}}})";
    Reading reading;
    ASSERT_TRUE(WaqiConnector::parseFeed(body, station_, &reading));
    EXPECT_FALSE(reading.timestamp.has_value()) << "Left for the validator to reject";
}

TEST_F(ConnectorTestBase, WaqiUnrepresentableAqiIgnoredContract) {
    // === INPUT SPECIFICATION ===
    // aqi as NaN text, infinite text, a number beyond int range, and a placeholder dash
    for (const char* aqi : {R"("nan")", R"("inf")", "1e12", R"("-")"}) {
        const std::string body = std::string(R"({"status":"ok","data":{"aqi":)") + aqi +
                                 R"(,"time":{"iso":"2024-01-15T10:00:00Z"},"iaqi":{"pm25":{"v":90}}}})";
        Reading reading;
        ASSERT_TRUE(WaqiConnector::parseFeed(body, station_, &reading)) << aqi;
        EXPECT_FALSE(reading.source.aqi.has_value()) << aqi;
        EXPECT_DOUBLE_EQ(*reading.pollutant(Pollutant::PM25), 90.0);
    }

    const std::string fractional = R"({"status":"ok","data":{"aqi":"95.6","iaqi":{"pm25":{"v":90}}}})";
    Reading reading;
    ASSERT_TRUE(WaqiConnector::parseFeed(fractional, station_, &reading));
    ASSERT_TRUE(reading.source.aqi.has_value());
    EXPECT_EQ(*reading.source.aqi, 95);
}

TEST_F(ConnectorTestBase, WaqiErrorPayloadsContract) {
    Reading reading;
    EXPECT_FALSE(WaqiConnector::parseFeed(R"({"status":"error","data":"Invalid key"})", station_, &reading));
    EXPECT_FALSE(WaqiConnector::parseFeed(R"({"status":"ok"})", station_, &reading));
    EXPECT_FALSE(WaqiConnector::parseFeed("<html>rate limited</html>", station_, &reading));
}

TEST_F(ConnectorTestBase, WaqiFetchBuildsUrlContract) {
    FakeHttpClient http;
    http.push(HttpStatus::OK, WAQI_FEED);
    WaqiConnector connector(http, "https://api.waqi.info", "secret", 1);

    auto reading = connector.fetchReading(station_);
    ASSERT_TRUE(reading.has_value());
    ASSERT_EQ(http.urls.size(), 1u);
    EXPECT_EQ(http.urls[0], "https://api.waqi.info/feed/@2553/?token=secret");
}

TEST_F(ConnectorTestBase, WaqiFetchFailuresYieldNothingContract) {
    FakeHttpClient http;
    WaqiConnector no_token(http, "https://api.waqi.info", "", 1);
    EXPECT_FALSE(no_token.fetchReading(station_).has_value());
    EXPECT_TRUE(http.urls.empty()) << "No request without a token";

    WaqiConnector connector(http, "https://api.waqi.info", "secret", 1);
    StationConfig unmapped = station_;
    unmapped.waqi_id.clear();
    EXPECT_FALSE(connector.fetchReading(unmapped).has_value());

    http.push(HttpStatus::HTTP_ERROR, "", 500);
    EXPECT_FALSE(connector.fetchReading(station_).has_value());
    EXPECT_EQ(http.urls.size(), 1u) << "HTTP errors are not retried";

    http.push(HttpStatus::OK, R"({"status":"error","data":"Unknown station"})");
    EXPECT_FALSE(connector.fetchReading(station_).has_value());
}

TEST_F(ConnectorTestBase, TimeoutRetriedOnceContract) {
    FakeHttpClient http;
    http.push(HttpStatus::TIMEOUT);
    http.push(HttpStatus::OK, WAQI_FEED);
    WaqiConnector connector(http, "https://api.waqi.info", "secret", 1);

    auto reading = connector.fetchReading(station_);
    EXPECT_TRUE(reading.has_value());
    EXPECT_EQ(http.urls.size(), 2u);

    // Two timeouts exhaust a single retry
    http.urls.clear();
    http.push(HttpStatus::TIMEOUT);
    http.push(HttpStatus::TIMEOUT);
    http.push(HttpStatus::OK, WAQI_FEED);
    EXPECT_FALSE(connector.fetchReading(station_).has_value());
    EXPECT_EQ(http.urls.size(), 2u);
}

// =============================================================================
// 2. WEATHER
// =============================================================================

constexpr const char* WEATHER_BODY = R"({
  "coord": {"lon": 77.3164, "lat": 28.6469},
  "weather": [{"id": 721, "main": "Haze", "description": "haze"}],
  "main": {"temp": 14.2, "feels_like": 13.1, "pressure": 1018, "humidity": 88},
  "visibility": 1500,
  "wind": {"speed": 1.5, "deg": 300, "gust": 2.7},
  "clouds": {"all": 40},
  "dt": 1705312800
})";

TEST_F(ConnectorTestBase, WeatherParsingContract) {
    WeatherContext ctx;
    ASSERT_TRUE(WeatherConnector::parseWeather(WEATHER_BODY, 28.6469, 77.3164, &ctx));

    EXPECT_DOUBLE_EQ(*ctx.temperature, 14.2);
    EXPECT_DOUBLE_EQ(*ctx.feels_like, 13.1);
    EXPECT_DOUBLE_EQ(*ctx.humidity, 88.0);
    EXPECT_DOUBLE_EQ(*ctx.pressure, 1018.0);
    EXPECT_DOUBLE_EQ(*ctx.wind_speed, 1.5);
    EXPECT_DOUBLE_EQ(*ctx.wind_direction, 300.0);
    EXPECT_DOUBLE_EQ(*ctx.wind_gust, 2.7);
    EXPECT_DOUBLE_EQ(*ctx.visibility, 1500.0);
    EXPECT_EQ(*ctx.cloud_cover, 40);
    EXPECT_EQ(ctx.description, "haze");
    EXPECT_EQ(ctx.timestamp, 1705312800LL * Common::NANOS_PER_SECOND);
    EXPECT_TRUE(ctx.is_inversion_likely) << "Wind below 2 m/s with humidity above 80%";
}

TEST_F(ConnectorTestBase, InversionHeuristicContract) {
    EXPECT_TRUE(isInversionLikely(1.0, 85.0));
    EXPECT_FALSE(isInversionLikely(2.0, 85.0));
    EXPECT_FALSE(isInversionLikely(1.0, 80.0));
    EXPECT_FALSE(isInversionLikely(std::nullopt, 95.0));
}

TEST_F(ConnectorTestBase, WeatherFillsOnlyMissingFieldsContract) {
    WeatherContext ctx;
    ASSERT_TRUE(WeatherConnector::parseWeather(WEATHER_BODY, 0.0, 0.0, &ctx));

    MetContext met;
    met.set(MetField::TEMPERATURE, 20.0);
    ctx.fillMissing(&met);

    EXPECT_DOUBLE_EQ(*met.get(MetField::TEMPERATURE), 20.0) << "Station measurement wins";
    EXPECT_DOUBLE_EQ(*met.get(MetField::HUMIDITY), 88.0);
    EXPECT_DOUBLE_EQ(*met.get(MetField::WIND_SPEED), 1.5);
    EXPECT_DOUBLE_EQ(*met.get(MetField::WIND_DIRECTION), 300.0);
    EXPECT_DOUBLE_EQ(*met.get(MetField::PRESSURE), 1018.0);
    EXPECT_FALSE(met.get(MetField::DEW_POINT).has_value());
}

TEST_F(ConnectorTestBase, WeatherFetchContract) {
    FakeHttpClient http;
    http.push(HttpStatus::OK, WEATHER_BODY);
    WeatherConnector connector(http, "https://api.openweathermap.org/data/2.5/weather", "k3y", 1);

    auto ctx = connector.fetchWeather(28.6469, 77.3164);
    ASSERT_TRUE(ctx.has_value());
    ASSERT_EQ(http.urls.size(), 1u);
    EXPECT_EQ(http.urls[0], "https://api.openweathermap.org/data/2.5/weather"
                            "?lat=28.646900&lon=77.316400&appid=k3y&units=metric");

    WeatherConnector no_key(http, "https://api.openweathermap.org/data/2.5/weather", "", 1);
    EXPECT_FALSE(no_key.fetchWeather(28.6, 77.3).has_value());

    http.push(HttpStatus::NETWORK_ERROR);
    EXPECT_FALSE(connector.fetchWeather(28.6, 77.3).has_value());
}
