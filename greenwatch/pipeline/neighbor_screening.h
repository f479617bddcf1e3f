#pragma once

#include "config/config.h"
#include "greenwatch/types.h"
#include "greenwatch/windows/reading_history.h"

#include <cstdint>
#include <vector>

namespace GreenWatch::Pipeline {

/// Neighbour readings count as concurrent when within this distance of the reading
constexpr EpochNanos NEIGHBOR_CONCURRENCY_NS = Common::hoursToNanos(1);

struct ScreeningResult {
    Reading accepted;            // quarantined pollutants removed
    uint32_t quarantined{0};
};

/// Latest reading of each configured neighbour within NEIGHBOR_CONCURRENCY_NS of ts
[[nodiscard]] auto neighborReadings(const StationConfig& station, const Windows::IReadingHistory& history,
                                    EpochNanos ts) -> std::vector<Reading>;

/// Scores every pollutant of a validated reading against its neighbours and strips the
/// quarantined ones. The reading must carry a timestamp.
[[nodiscard]] auto screenAgainstNeighbors(const Reading& reading, const StationConfig& station,
                                          const Windows::IReadingHistory& history) -> ScreeningResult;

} // namespace GreenWatch::Pipeline
