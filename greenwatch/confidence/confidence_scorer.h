#pragma once

#include "greenwatch/types.h"

#include <optional>
#include <string>
#include <vector>

namespace GreenWatch::Confidence {

struct ConfidenceResult {
    std::string station_id;
    Pollutant pollutant{Pollutant::PM25};
    double observed_value{0.0};
    std::optional<double> neighbor_avg;
    std::optional<double> deviation_ratio;
    double score{0.0};
    bool is_quarantined{false};
    std::string reason;
};

/// Cross-validates a reading against concurrent readings of neighbouring stations.
/// Pure functions; no shared state.
class ConfidenceScorer {
public:
    static constexpr double QUARANTINE_THRESHOLD = 60.0;
    static constexpr double NO_NEIGHBOR_SCORE = 70.0;
    static constexpr double ZERO_BASELINE_SUSPICIOUS_SCORE = 20.0;
    static constexpr double RATIO_LOW = 0.5;
    static constexpr double RATIO_HIGH = 2.0;

    [[nodiscard]] static auto score(const std::string& station_id, Pollutant pollutant, double observed,
                                    const std::vector<double>& neighbor_values) -> ConfidenceResult;

    /// Scores every pollutant present in reading against the same pollutant in the neighbours
    [[nodiscard]] static auto scoreAllPollutants(const Reading& reading,
                                                 const std::vector<Reading>& neighbors) -> std::vector<ConfidenceResult>;

    /// Copy of reading with every quarantined pollutant removed
    [[nodiscard]] static auto stripQuarantined(const Reading& reading,
                                               const std::vector<ConfidenceResult>& results) -> Reading;

private:
    [[nodiscard]] static auto ratioScore(double ratio) noexcept -> double;
};

} // namespace GreenWatch::Confidence
