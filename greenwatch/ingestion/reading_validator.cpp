#include "reading_validator.h"
#include "common/logging.h"

#include <cmath>
#include <cstdarg>
#include <cstdio>

namespace GreenWatch::Ingestion {

namespace {

// Units: pollutants ug/m3 except CO in mg/m3
constexpr PhysicalBound POLLUTANT_BOUNDS[POLLUTANT_COUNT] = {
    {0.0, 1000.0},  // pm25
    {0.0, 2000.0},  // pm10
    {0.0, 2000.0},  // no2
    {0.0, 2000.0},  // so2
    {0.0, 100.0},   // co
    {0.0, 1000.0},  // o3
};

constexpr PhysicalBound MET_BOUNDS[MET_FIELD_COUNT] = {
    {-50.0, 60.0},    // temperature C
    {0.0, 100.0},     // humidity %
    {0.0, 100.0},     // wind_speed m/s
    {0.0, 360.0},     // wind_direction deg
    {800.0, 1100.0},  // pressure hPa
    {-60.0, 60.0},    // dew_point C
};

__attribute__((format(printf, 1, 2)))
std::string formatReason(const char* format, ...);

std::string formatReason(const char* format, ...) {
    char buffer[192];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return buffer;
}

} // namespace

auto ReadingValidator::pollutantBound(Pollutant p) noexcept -> PhysicalBound {
    return POLLUTANT_BOUNDS[pollutantIndex(p)];
}

auto ReadingValidator::metBound(MetField f) noexcept -> PhysicalBound {
    return MET_BOUNDS[static_cast<size_t>(f)];
}

auto ReadingValidator::checkField(const char* name, double value, PhysicalBound bound,
                                  std::vector<std::string>* reasons) -> void {
    if (!std::isfinite(value)) {
        reasons->push_back(formatReason("%s=%f is not a valid number", name, value));
    } else if (value < bound.min) {
        reasons->push_back(formatReason("%s=%g below physical minimum %g", name, value, bound.min));
    } else if (value > bound.max) {
        reasons->push_back(formatReason("%s=%g exceeds physical maximum %g", name, value, bound.max));
    }
}

auto ReadingValidator::validate(const Reading& reading, EpochNanos now) -> ValidationResult {
    ValidationResult result;

    if (reading.station_id.empty()) {
        result.reasons.emplace_back("Missing required field: station_id");
    }
    if (!reading.timestamp) {
        result.reasons.emplace_back("Missing required field: timestamp");
    }
    if (!reading.hasAnyPollutant()) {
        result.reasons.emplace_back("No pollutant values present");
    }

    for (auto p : ALL_POLLUTANTS) {
        if (const auto& value = reading.pollutant(p)) {
            checkField(pollutantKey(p), *value, pollutantBound(p), &result.reasons);
        }
    }
    for (auto f : ALL_MET_FIELDS) {
        if (const auto& value = reading.met.get(f)) {
            checkField(metFieldKey(f), *value, metBound(f), &result.reasons);
        }
    }

    if (reading.timestamp) {
        const EpochNanos age = now - *reading.timestamp;
        if (age > MAX_AGE_NS) {
            result.reasons.push_back(formatReason("Reading is stale: age %llds exceeds %llds",
                static_cast<long long>(age / Common::NANOS_PER_SECOND),
                static_cast<long long>(MAX_AGE_NS / Common::NANOS_PER_SECOND)));
        } else if (-age > MAX_FUTURE_SKEW_NS) {
            result.reasons.push_back(formatReason("Reading timestamp is %llds in the future",
                static_cast<long long>(-age / Common::NANOS_PER_SECOND)));
        }
    }

    result.is_valid = result.reasons.empty();
    if (!result.is_valid) {
        LOG_WARN("Validation failed for station=%s: %zu issue(s), first: %s",
                 reading.station_id.empty() ? "<missing>" : reading.station_id.c_str(),
                 result.reasons.size(), result.reasons.front().c_str());
    }
    return result;
}

} // namespace GreenWatch::Ingestion
