#include "neighbor_screening.h"
#include "greenwatch/confidence/confidence_scorer.h"

namespace GreenWatch::Pipeline {

auto neighborReadings(const StationConfig& station, const Windows::IReadingHistory& history,
                      EpochNanos ts) -> std::vector<Reading> {
    std::vector<Reading> out;
    for (const auto& neighbor : station.neighbors) {
        auto r = history.latestReading(neighbor, ts - NEIGHBOR_CONCURRENCY_NS, ts + NEIGHBOR_CONCURRENCY_NS);
        if (r) out.push_back(std::move(*r));
    }
    return out;
}

auto screenAgainstNeighbors(const Reading& reading, const StationConfig& station,
                            const Windows::IReadingHistory& history) -> ScreeningResult {
    ScreeningResult result;
    const auto scores = Confidence::ConfidenceScorer::scoreAllPollutants(
        reading, neighborReadings(station, history, *reading.timestamp));
    for (const auto& s : scores) {
        if (s.is_quarantined) ++result.quarantined;
    }
    result.accepted = Confidence::ConfidenceScorer::stripQuarantined(reading, scores);
    return result;
}

} // namespace GreenWatch::Pipeline
