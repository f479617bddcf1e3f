#include "incremental_window_engine.h"
#include "common/logging.h"

#include <algorithm>

namespace GreenWatch::Windows {

namespace {

constexpr size_t LONGEST = WINDOW_HORIZONS.size() - 1;

} // namespace

IncrementalWindowEngine::IncrementalWindowEngine(ResultCallback on_change, EpochNanos retention_ns)
    : on_change_(std::move(on_change)),
      retention_ns_(std::max(retention_ns, Common::hoursToNanos(periodHours(WINDOW_HORIZONS[LONGEST])))),
      keys_mutex_(),
      keys_() {}

auto IncrementalWindowEngine::makeKey(const std::string& station_id, Pollutant pollutant) -> std::string {
    std::string key;
    key.reserve(station_id.size() + 6);
    key.append(station_id).push_back('|');
    key.append(pollutantKey(pollutant));
    return key;
}

auto IncrementalWindowEngine::findOrCreate(const std::string& station_id, Pollutant pollutant) -> KeyWindow* {
    std::lock_guard<std::mutex> lock(keys_mutex_);
    auto& slot = keys_[makeKey(station_id, pollutant)];
    if (!slot) {
        slot = std::make_unique<KeyWindow>();
        slot->station_id = station_id;
        slot->pollutant = pollutant;
    }
    return slot.get();
}

auto IncrementalWindowEngine::find(const std::string& station_id, Pollutant pollutant) const -> KeyWindow* {
    std::lock_guard<std::mutex> lock(keys_mutex_);
    auto it = keys_.find(makeKey(station_id, pollutant));
    return it == keys_.end() ? nullptr : it->second.get();
}

// ============================================================================
// Buffer maintenance
// ============================================================================

auto IncrementalWindowEngine::advance(KeyWindow* window, EpochNanos as_of) -> void {
    if (as_of <= window->watermark) {
        return;
    }
    window->watermark = as_of;

    for (size_t h = 0; h < WINDOW_HORIZONS.size(); ++h) {
        auto& state = window->horizons[h];
        const EpochNanos cutoff = horizonCutoff(WINDOW_HORIZONS[h], as_of);
        while (state.begin < window->samples.size() && window->samples[state.begin].timestamp <= cutoff) {
            const auto& evicted = window->samples[state.begin];
            state.sum -= evicted.value;
            state.met.remove(evicted.met);
            ++state.begin;
        }
        if (state.begin == window->samples.size()) {
            // Empty horizon: drop accumulated rounding error
            state.sum = 0.0;
            state.met.clear();
        }
    }
}

auto IncrementalWindowEngine::prune(KeyWindow* window) const -> void {
    // Retained samples always sit ahead of every horizon's first member
    const EpochNanos cutoff = window->newest - retention_ns_;
    size_t expired = 0;
    while (expired < window->horizons[LONGEST].begin && window->samples[expired].timestamp <= cutoff) {
        ++expired;
    }
    if (expired == 0) {
        return;
    }
    window->samples.erase(window->samples.begin(), window->samples.begin() + static_cast<std::ptrdiff_t>(expired));
    for (auto& state : window->horizons) {
        state.begin -= expired;
    }
}

auto IncrementalWindowEngine::insert(KeyWindow* window, const Sample& sample) const -> bool {
    if (window->newest != std::numeric_limits<EpochNanos>::min() &&
        sample.timestamp <= window->newest - retention_ns_) {
        return false;  // older than the retention span
    }

    // Upper bound keeps arrival order among equal timestamps
    auto pos_it = std::upper_bound(window->samples.begin(), window->samples.end(), sample.timestamp,
        [](EpochNanos ts, const Sample& s) { return ts < s.timestamp; });
    window->samples.insert(pos_it, sample);

    for (size_t h = 0; h < WINDOW_HORIZONS.size(); ++h) {
        auto& state = window->horizons[h];
        if (sample.timestamp > horizonCutoff(WINDOW_HORIZONS[h], window->watermark)) {
            state.sum += sample.value;
            state.met.add(sample.met);
        } else {
            // Landed at or before begin, ahead of the horizon's first member
            ++state.begin;
        }
    }
    if (sample.timestamp > window->newest) {
        window->newest = sample.timestamp;
        prune(window);
    }
    return true;
}

auto IncrementalWindowEngine::resultsAtWatermark(const KeyWindow& window) -> std::vector<WindowResult> {
    std::vector<WindowResult> results;
    const size_t size = window.samples.size();
    for (size_t h = 0; h < WINDOW_HORIZONS.size(); ++h) {
        const auto& state = window.horizons[h];
        if (state.begin >= size) continue;

        WindowResult r;
        r.station_id = window.station_id;
        r.pollutant = window.pollutant;
        r.horizon = WINDOW_HORIZONS[h];
        r.count = static_cast<uint32_t>(size - state.begin);
        r.average = roundTo(state.sum / static_cast<double>(r.count), 4);
        r.window_start = window.samples[state.begin].timestamp;
        r.window_end = window.samples.back().timestamp;
        r.as_of = window.watermark;
        r.met = state.met.snapshot();
        results.push_back(std::move(r));
    }
    return results;
}

auto IncrementalWindowEngine::resultsByScan(const KeyWindow& window, EpochNanos as_of) -> std::vector<WindowResult> {
    std::vector<WindowResult> results;
    for (auto horizon : WINDOW_HORIZONS) {
        const EpochNanos cutoff = horizonCutoff(horizon, as_of);
        double sum = 0.0;
        uint32_t count = 0;
        MetAccumulator met;
        WindowResult r;
        for (const auto& s : window.samples) {
            if (s.timestamp <= cutoff) continue;
            if (s.timestamp > as_of) break;
            if (count == 0) r.window_start = s.timestamp;
            r.window_end = s.timestamp;
            sum += s.value;
            met.add(s.met);
            ++count;
        }
        if (count == 0) continue;

        r.station_id = window.station_id;
        r.pollutant = window.pollutant;
        r.horizon = horizon;
        r.count = count;
        r.average = roundTo(sum / static_cast<double>(count), 4);
        r.as_of = as_of;
        r.met = met.snapshot();
        results.push_back(std::move(r));
    }
    return results;
}

// ============================================================================
// Public interface
// ============================================================================

auto IncrementalWindowEngine::update(const Reading& reading) -> void {
    if (!reading.timestamp || reading.station_id.empty()) {
        LOG_WARN("IncrementalWindowEngine: ignoring reading without station or timestamp");
        return;
    }
    const EpochNanos ts = *reading.timestamp;

    for (auto p : ALL_POLLUTANTS) {
        const auto& value = reading.pollutant(p);
        if (!value) continue;

        KeyWindow* window = findOrCreate(reading.station_id, p);
        std::vector<WindowResult> results;
        {
            std::lock_guard<std::mutex> lock(window->mutex);
            advance(window, ts);
            if (!insert(window, Sample{ts, *value, reading.met})) {
                LOG_DEBUG("Late reading dropped: station=%s pollutant=%s is older than the retention span",
                          reading.station_id.c_str(), pollutantKey(p));
                continue;
            }
            if (on_change_) {
                results = resultsAtWatermark(*window);
            }
        }
        if (on_change_ && !results.empty()) {
            on_change_(reading.station_id, p, results);
        }
    }
}

auto IncrementalWindowEngine::currentAverages(const std::string& station_id, Pollutant pollutant,
                                              EpochNanos as_of) -> std::vector<WindowResult> {
    KeyWindow* window = find(station_id, pollutant);
    if (!window) {
        return {};
    }
    std::lock_guard<std::mutex> lock(window->mutex);
    if (as_of >= window->watermark) {
        advance(window, as_of);
        return resultsAtWatermark(*window);
    }
    LOG_DEBUG("Window query behind watermark for station=%s pollutant=%s; scanning buffer",
              station_id.c_str(), pollutantKey(pollutant));
    return resultsByScan(*window, as_of);
}

auto IncrementalWindowEngine::bufferedSamples(const std::string& station_id, Pollutant pollutant) const -> size_t {
    KeyWindow* window = find(station_id, pollutant);
    if (!window) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(window->mutex);
    return window->samples.size();
}

auto IncrementalWindowEngine::keyCount() const -> size_t {
    std::lock_guard<std::mutex> lock(keys_mutex_);
    return keys_.size();
}

} // namespace GreenWatch::Windows
