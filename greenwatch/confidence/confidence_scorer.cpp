#include "confidence_scorer.h"
#include "common/logging.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace GreenWatch::Confidence {

auto ConfidenceScorer::ratioScore(double ratio) noexcept -> double {
    if (ratio >= RATIO_LOW && ratio <= RATIO_HIGH) {
        return 100.0;
    }
    if (ratio > RATIO_HIGH) {
        // 0 at 5x the neighbour average
        return std::max(0.0, 100.0 - ((ratio - RATIO_HIGH) / 3.0) * 80.0);
    }
    // 40 at a zero reading against a non-zero baseline
    return std::max(0.0, 100.0 - ((RATIO_LOW - ratio) / RATIO_LOW) * 60.0);
}

auto ConfidenceScorer::score(const std::string& station_id, Pollutant pollutant, double observed,
                             const std::vector<double>& neighbor_values) -> ConfidenceResult {
    ConfidenceResult result;
    result.station_id = station_id;
    result.pollutant = pollutant;
    result.observed_value = observed;

    if (!std::isfinite(observed)) {
        result.score = 0.0;
        result.is_quarantined = true;
        result.reason = "observed value is not a valid number";
        LOG_WARN("Quarantined station=%s pollutant=%s: %s", station_id.c_str(),
                 pollutantKey(pollutant), result.reason.c_str());
        return result;
    }

    double sum = 0.0;
    size_t count = 0;
    for (double v : neighbor_values) {
        if (std::isfinite(v) && v >= 0.0) {
            sum += v;
            ++count;
        }
    }

    if (count == 0) {
        result.score = NO_NEIGHBOR_SCORE;
        result.is_quarantined = result.score < QUARANTINE_THRESHOLD;
        if (result.is_quarantined) {
            result.reason = "Insufficient neighbors for cross-validation";
        }
        LOG_DEBUG("No valid neighbors for station=%s pollutant=%s; neutral score %.0f",
                  station_id.c_str(), pollutantKey(pollutant), result.score);
        return result;
    }

    const double neighbor_avg = sum / static_cast<double>(count);
    result.neighbor_avg = roundTo(neighbor_avg, 4);

    double raw_score;
    if (neighbor_avg == 0.0) {
        if (observed == 0.0) {
            result.deviation_ratio = 1.0;
            raw_score = 100.0;
        } else {
            result.deviation_ratio = std::numeric_limits<double>::infinity();
            raw_score = ZERO_BASELINE_SUSPICIOUS_SCORE;
        }
    } else {
        const double ratio = observed / neighbor_avg;
        result.deviation_ratio = roundTo(ratio, 4);
        raw_score = ratioScore(ratio);
    }

    result.score = roundTo(raw_score, 2);
    result.is_quarantined = result.score < QUARANTINE_THRESHOLD;
    if (result.is_quarantined) {
        char reason[128];
        std::snprintf(reason, sizeof(reason), "Deviation ratio %.4f indicates anomalous reading",
                      *result.deviation_ratio);
        result.reason = reason;
        LOG_WARN("Quarantined station=%s pollutant=%s observed=%.2f neighbor_avg=%.2f score=%.2f",
                 station_id.c_str(), pollutantKey(pollutant), observed, neighbor_avg, result.score);
    }
    return result;
}

auto ConfidenceScorer::scoreAllPollutants(const Reading& reading,
                                          const std::vector<Reading>& neighbors) -> std::vector<ConfidenceResult> {
    std::vector<ConfidenceResult> results;
    std::vector<double> neighbor_values;
    neighbor_values.reserve(neighbors.size());

    for (auto p : ALL_POLLUTANTS) {
        const auto& observed = reading.pollutant(p);
        if (!observed) continue;

        neighbor_values.clear();
        for (const auto& n : neighbors) {
            if (const auto& v = n.pollutant(p)) {
                neighbor_values.push_back(*v);
            }
        }
        results.push_back(score(reading.station_id, p, *observed, neighbor_values));
    }
    return results;
}

auto ConfidenceScorer::stripQuarantined(const Reading& reading,
                                        const std::vector<ConfidenceResult>& results) -> Reading {
    Reading filtered = reading;
    for (const auto& r : results) {
        if (r.is_quarantined) {
            filtered.clearPollutant(r.pollutant);
        }
    }
    return filtered;
}

} // namespace GreenWatch::Confidence
