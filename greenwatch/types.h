#pragma once

#include "common/time_utils.h"

#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace GreenWatch {

using Common::EpochNanos;

/// Half-away-from-zero rounding to a fixed number of decimal places
inline auto roundTo(double value, int places) noexcept -> double {
    if (!std::isfinite(value)) return value;
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

// ============================================================================
// Pollutants
// ============================================================================

enum class Pollutant : uint8_t {
    PM25 = 0,
    PM10 = 1,
    NO2 = 2,
    SO2 = 3,
    CO = 4,
    O3 = 5
};

constexpr size_t POLLUTANT_COUNT = 6;

constexpr std::array<Pollutant, POLLUTANT_COUNT> ALL_POLLUTANTS = {
    Pollutant::PM25, Pollutant::PM10, Pollutant::NO2,
    Pollutant::SO2, Pollutant::CO, Pollutant::O3
};

/// Lower-case wire key ("pm25", "co", ...)
constexpr auto pollutantKey(Pollutant p) noexcept -> const char* {
    switch (p) {
        case Pollutant::PM25: return "pm25";
        case Pollutant::PM10: return "pm10";
        case Pollutant::NO2:  return "no2";
        case Pollutant::SO2:  return "so2";
        case Pollutant::CO:   return "co";
        case Pollutant::O3:   return "o3";
    }
    return "unknown";
}

/// Display name used in rule names ("PM2.5", "CO", ...)
constexpr auto pollutantDisplayName(Pollutant p) noexcept -> const char* {
    switch (p) {
        case Pollutant::PM25: return "PM2.5";
        case Pollutant::PM10: return "PM10";
        case Pollutant::NO2:  return "NO2";
        case Pollutant::SO2:  return "SO2";
        case Pollutant::CO:   return "CO";
        case Pollutant::O3:   return "O3";
    }
    return "UNKNOWN";
}

[[nodiscard]] inline auto parsePollutant(std::string_view key) noexcept -> std::optional<Pollutant> {
    for (auto p : ALL_POLLUTANTS) {
        if (key == pollutantKey(p)) return p;
    }
    return std::nullopt;
}

constexpr auto pollutantIndex(Pollutant p) noexcept -> size_t {
    return static_cast<size_t>(p);
}

// ============================================================================
// Averaging periods
// ============================================================================

enum class AveragingPeriod : uint8_t {
    ONE_HOUR = 0,
    EIGHT_HOUR = 1,
    TWENTY_FOUR_HOUR = 2,
    ANNUAL = 3
};

/// Horizons maintained by the window engines, shortest first
constexpr std::array<AveragingPeriod, 3> WINDOW_HORIZONS = {
    AveragingPeriod::ONE_HOUR, AveragingPeriod::EIGHT_HOUR, AveragingPeriod::TWENTY_FOUR_HOUR
};

constexpr auto periodLabel(AveragingPeriod period) noexcept -> const char* {
    switch (period) {
        case AveragingPeriod::ONE_HOUR:         return "1hr";
        case AveragingPeriod::EIGHT_HOUR:       return "8hr";
        case AveragingPeriod::TWENTY_FOUR_HOUR: return "24hr";
        case AveragingPeriod::ANNUAL:           return "annual";
    }
    return "unknown";
}

[[nodiscard]] inline auto parsePeriodLabel(std::string_view label) noexcept -> std::optional<AveragingPeriod> {
    if (label == "1hr") return AveragingPeriod::ONE_HOUR;
    if (label == "8hr") return AveragingPeriod::EIGHT_HOUR;
    if (label == "24hr") return AveragingPeriod::TWENTY_FOUR_HOUR;
    if (label == "annual") return AveragingPeriod::ANNUAL;
    return std::nullopt;
}

/// Window length in hours; 0 for the annual period, which no window engine maintains
constexpr auto periodHours(AveragingPeriod period) noexcept -> int {
    switch (period) {
        case AveragingPeriod::ONE_HOUR:         return 1;
        case AveragingPeriod::EIGHT_HOUR:       return 8;
        case AveragingPeriod::TWENTY_FOUR_HOUR: return 24;
        case AveragingPeriod::ANNUAL:           return 0;
    }
    return 0;
}

// ============================================================================
// Readings
// ============================================================================

enum class MetField : uint8_t {
    TEMPERATURE = 0,
    HUMIDITY = 1,
    WIND_SPEED = 2,
    WIND_DIRECTION = 3,
    PRESSURE = 4,
    DEW_POINT = 5
};

constexpr size_t MET_FIELD_COUNT = 6;

constexpr std::array<MetField, MET_FIELD_COUNT> ALL_MET_FIELDS = {
    MetField::TEMPERATURE, MetField::HUMIDITY, MetField::WIND_SPEED,
    MetField::WIND_DIRECTION, MetField::PRESSURE, MetField::DEW_POINT
};

constexpr auto metFieldKey(MetField f) noexcept -> const char* {
    switch (f) {
        case MetField::TEMPERATURE:    return "temperature";
        case MetField::HUMIDITY:       return "humidity";
        case MetField::WIND_SPEED:     return "wind_speed";
        case MetField::WIND_DIRECTION: return "wind_direction";
        case MetField::PRESSURE:       return "pressure";
        case MetField::DEW_POINT:      return "dew_point";
    }
    return "unknown";
}

/// Meteorological context; every field optional
struct MetContext {
    std::array<std::optional<double>, MET_FIELD_COUNT> values{};

    [[nodiscard]] auto get(MetField f) const noexcept -> const std::optional<double>& {
        return values[static_cast<size_t>(f)];
    }

    auto set(MetField f, double v) noexcept -> void {
        values[static_cast<size_t>(f)] = v;
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        for (const auto& v : values) {
            if (v.has_value()) return false;
        }
        return true;
    }
};

struct SourceMetadata {
    std::string station_name;
    std::optional<int> aqi;
    std::string source_url;
};

/// One telemetry sample for one station. Absent pollutants and met fields stay empty.
struct Reading {
    std::string station_id;
    std::optional<EpochNanos> timestamp;
    std::array<std::optional<double>, POLLUTANT_COUNT> pollutants{};
    MetContext met;
    SourceMetadata source;

    [[nodiscard]] auto pollutant(Pollutant p) const noexcept -> const std::optional<double>& {
        return pollutants[pollutantIndex(p)];
    }

    auto setPollutant(Pollutant p, double v) noexcept -> void {
        pollutants[pollutantIndex(p)] = v;
    }

    auto clearPollutant(Pollutant p) noexcept -> void {
        pollutants[pollutantIndex(p)].reset();
    }

    [[nodiscard]] auto hasAnyPollutant() const noexcept -> bool {
        for (const auto& v : pollutants) {
            if (v.has_value()) return true;
        }
        return false;
    }
};

} // namespace GreenWatch
