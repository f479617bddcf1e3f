#include "recompute_window_engine.h"
#include "common/logging.h"

namespace GreenWatch::Windows {

auto RecomputeWindowEngine::update(const Reading& reading) -> void {
    if (!history_.append(reading)) {
        LOG_ERROR("RecomputeWindowEngine: history append failed for station=%s", reading.station_id.c_str());
    }
}

auto RecomputeWindowEngine::currentAverages(const std::string& station_id, Pollutant pollutant,
                                            EpochNanos as_of) -> std::vector<WindowResult> {
    std::vector<WindowResult> results;

    // The longest horizon covers every shorter one
    const auto readings = history_.readingsBetween(
        station_id, horizonCutoff(WINDOW_HORIZONS.back(), as_of), as_of);

    for (auto horizon : WINDOW_HORIZONS) {
        const EpochNanos cutoff = horizonCutoff(horizon, as_of);
        double sum = 0.0;
        uint32_t count = 0;
        MetAccumulator met;
        WindowResult r;

        for (const auto& reading : readings) {
            const EpochNanos ts = *reading.timestamp;
            const auto& value = reading.pollutant(pollutant);
            if (ts <= cutoff || !value) continue;
            if (count == 0) r.window_start = ts;
            r.window_end = ts;
            sum += *value;
            met.add(reading.met);
            ++count;
        }
        if (count == 0) continue;

        r.station_id = station_id;
        r.pollutant = pollutant;
        r.horizon = horizon;
        r.count = count;
        r.average = roundTo(sum / static_cast<double>(count), 4);
        r.as_of = as_of;
        r.met = met.snapshot();
        LOG_DEBUG("Recomputed window: station=%s pollutant=%s hours=%d avg=%.2f n=%u",
                  station_id.c_str(), pollutantKey(pollutant), r.windowHours(), r.average, r.count);
        results.push_back(std::move(r));
    }
    return results;
}

} // namespace GreenWatch::Windows
