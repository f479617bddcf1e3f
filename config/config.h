#pragma once

#include "common/logging.h"
#include "greenwatch/types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace GreenWatch {

// ============================================================================
// Regulatory limits
// ============================================================================

struct LimitSpec {
    double limit{0.0};
    std::string unit;
    std::string legal_reference;
};

/// Pollutant x averaging period -> limit. Loaded once, read-only afterwards.
struct RegulatoryLimitTable {
    std::string name{"NAAQS"};
    std::string version;
    std::string legal_reference;
    std::map<std::pair<Pollutant, AveragingPeriod>, LimitSpec> limits;

    [[nodiscard]] auto find(Pollutant p, AveragingPeriod period) const noexcept -> const LimitSpec* {
        auto it = limits.find({p, period});
        return it == limits.end() ? nullptr : &it->second;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return limits.empty(); }
};

// ============================================================================
// Zones
// ============================================================================

/// Zone name -> threshold adjustment factor; unknown zones use 1.0
struct ZoneTable {
    static constexpr double DEFAULT_FACTOR = 1.0;

    std::map<std::string, double, std::less<>> factors;

    [[nodiscard]] auto factorFor(std::string_view zone) const noexcept -> double {
        auto it = factors.find(zone);
        return it == factors.end() ? DEFAULT_FACTOR : it->second;
    }
};

// ============================================================================
// Stations
// ============================================================================

struct StationConfig {
    std::string station_id;
    std::string name;
    std::string waqi_id;
    std::string zone{"residential"};
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::vector<std::string> neighbors;
};

// ============================================================================
// Process configuration
// ============================================================================

/// Immutable process configuration. Built once by ConfigLoader and passed by const reference.
struct GreenWatchConfig {
    struct System {
        std::string name{"greenwatch"};
        std::string version{"1.0.0"};
        std::string environment{"development"};
    } system;

    struct Paths {
        std::string logs_dir{"logs"};
        std::string data_dir{"data"};
        std::string limits_file{"config/naaqs_limits.toml"};
        std::string env_file{".env"};
    } paths;

    struct Logging {
        Common::Logger::Level level{Common::Logger::INFO};
    } logging;

    struct Pipeline {
        uint32_t poll_interval_seconds{300};
        uint32_t stream_queue_size{4096};
        uint32_t dedup_horizon_hours{2};
        int polling_core{-1};
        int streaming_core{-1};
    } pipeline;

    struct Ingestion {
        std::string waqi_endpoint{"https://api.waqi.info"};
        std::string weather_endpoint{"https://api.openweathermap.org/data/2.5/weather"};
        uint32_t timeout_seconds{10};
        uint32_t fetch_retries{1};
        bool weather_enabled{false};
        std::string waqi_token;
        std::string weather_api_key;
    } ingestion;

    struct Streaming {
        bool enabled{true};
        bool push_feed_enabled{false};
        std::string push_feed_url;
        uint32_t reconnect_interval_ms{5000};
    } streaming;

    struct Ledger {
        std::string path{"data/audit_ledger.ndjson"};
    } ledger;

    ZoneTable zones;
    std::vector<StationConfig> stations;
    RegulatoryLimitTable limits;

    [[nodiscard]] auto findStation(std::string_view station_id) const noexcept -> const StationConfig* {
        for (const auto& s : stations) {
            if (s.station_id == station_id) return &s;
        }
        return nullptr;
    }
};

// ============================================================================
// Loader
// ============================================================================

/// Parses the TOML subset used by GreenWatch (sections, strings, numbers, booleans,
/// string arrays). Any error is logged and reported as false.
class ConfigLoader {
public:
    /// Loads the main config, the limits file it names and the secrets from the environment.
    /// A missing or empty limits table is a fatal configuration error.
    [[nodiscard]] static auto load(const char* config_file, GreenWatchConfig* out) noexcept -> bool;

    [[nodiscard]] static auto loadLimits(const char* limits_file, RegulatoryLimitTable* out) noexcept -> bool;

    /// KEY=VALUE lines into the process environment; missing file is not an error
    static auto loadEnvFile(const char* env_file) noexcept -> void;

    static auto printConfig(const GreenWatchConfig& config) noexcept -> void;

private:
    [[nodiscard]] static auto parseMainFile(const char* filepath, GreenWatchConfig* config) noexcept -> bool;
    [[nodiscard]] static auto validateConfig(GreenWatchConfig* config) noexcept -> bool;

    // Helpers to extract a value from a "key = value" line; the key must match exactly
    static auto extractStringValue(const char* line, const char* key, std::string* value) noexcept -> bool;
    static auto extractIntValue(const char* line, const char* key, int64_t* value) noexcept -> bool;
    static auto extractUintValue(const char* line, const char* key, uint64_t* value) noexcept -> bool;
    static auto extractDoubleValue(const char* line, const char* key, double* value) noexcept -> bool;
    static auto extractBoolValue(const char* line, const char* key, bool* value) noexcept -> bool;
    static auto extractStringList(const char* line, const char* key, std::vector<std::string>* values) noexcept -> bool;

    /// Splits "key = value" into key and raw value text; false for lines without '='
    static auto splitKeyValue(const char* line, std::string* key, std::string* raw) noexcept -> bool;

};

} // namespace GreenWatch
