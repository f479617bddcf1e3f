#pragma once

#include "greenwatch/types.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace GreenWatch::Windows {

/// Average and contributing count of one pollutant over one horizon ending at as_of.
/// window_start/window_end are the earliest and latest contributing reading timestamps.
struct WindowResult {
    std::string station_id;
    Pollutant pollutant{Pollutant::PM25};
    AveragingPeriod horizon{AveragingPeriod::ONE_HOUR};
    double average{0.0};
    uint32_t count{0};
    EpochNanos window_start{0};
    EpochNanos window_end{0};
    EpochNanos as_of{0};
    MetContext met;

    [[nodiscard]] auto windowHours() const noexcept -> int { return periodHours(horizon); }
};

/// Running sums of the meteorological fields over a set of readings
class MetAccumulator {
public:
    auto add(const MetContext& met) noexcept -> void {
        for (size_t i = 0; i < MET_FIELD_COUNT; ++i) {
            if (met.values[i]) {
                sums_[i] += *met.values[i];
                ++counts_[i];
            }
        }
    }

    auto remove(const MetContext& met) noexcept -> void {
        for (size_t i = 0; i < MET_FIELD_COUNT; ++i) {
            if (met.values[i] && counts_[i] > 0) {
                sums_[i] -= *met.values[i];
                if (--counts_[i] == 0) sums_[i] = 0.0;
            }
        }
    }

    auto clear() noexcept -> void {
        sums_.fill(0.0);
        counts_.fill(0);
    }

    /// Mean of every field seen at least once, rounded to 2 decimals
    [[nodiscard]] auto snapshot() const noexcept -> MetContext {
        MetContext met;
        for (size_t i = 0; i < MET_FIELD_COUNT; ++i) {
            if (counts_[i] > 0) {
                met.values[i] = roundTo(sums_[i] / static_cast<double>(counts_[i]), 2);
            }
        }
        return met;
    }

private:
    std::array<double, MET_FIELD_COUNT> sums_{};
    std::array<uint32_t, MET_FIELD_COUNT> counts_{};
};

/// A reading contributes to a horizon ending at as_of iff as_of - horizon < timestamp <= as_of
constexpr auto horizonCutoff(AveragingPeriod horizon, EpochNanos as_of) noexcept -> EpochNanos {
    return as_of - Common::hoursToNanos(periodHours(horizon));
}

/// Rolling 1h/8h/24h averages per (station, pollutant).
/// Implementations must agree on window membership and on the produced results.
class IWindowEngine {
public:
    virtual ~IWindowEngine() = default;

    /// Ingests every pollutant present in reading
    virtual auto update(const Reading& reading) -> void = 0;

    /// One result per horizon that has at least one contributing reading, shortest horizon first
    [[nodiscard]] virtual auto currentAverages(const std::string& station_id, Pollutant pollutant,
                                               EpochNanos as_of) -> std::vector<WindowResult> = 0;
};

} // namespace GreenWatch::Windows
