#pragma once

#include "window_engine.h"
#include "common/macros.h"

#include <array>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace GreenWatch::Windows {

/// Reactive window engine for a continuous event stream.
/// Keeps one time-ordered buffer per (station, pollutant) with running sums per horizon;
/// each key is guarded by its own mutex. The eviction watermark of a key is the newest
/// timestamp it has been updated or queried at. Samples are retained for the retention span
/// behind the key's newest reading, the same span the reading history keeps.
class IncrementalWindowEngine final : public IWindowEngine {
public:
    /// Invoked after an update changed a key's windows; results are evaluated at the key's watermark
    using ResultCallback = std::function<void(const std::string& station_id, Pollutant pollutant,
                                              const std::vector<WindowResult>& results)>;

    static constexpr EpochNanos DEFAULT_RETENTION_NS = Common::hoursToNanos(48);

    /// Retention shorter than the longest horizon is raised to it
    explicit IncrementalWindowEngine(ResultCallback on_change = {},
                                     EpochNanos retention_ns = DEFAULT_RETENTION_NS);
    ~IncrementalWindowEngine() override = default;

    DELETE_COPY_AND_MOVE(IncrementalWindowEngine);

    auto update(const Reading& reading) -> void override;

    /// Queries at or after the watermark are answered from the running sums; earlier queries
    /// scan the retained buffer.
    [[nodiscard]] auto currentAverages(const std::string& station_id, Pollutant pollutant,
                                       EpochNanos as_of) -> std::vector<WindowResult> override;

    [[nodiscard]] auto bufferedSamples(const std::string& station_id, Pollutant pollutant) const -> size_t;
    [[nodiscard]] auto keyCount() const -> size_t;

private:
    struct Sample {
        EpochNanos timestamp;
        double value;
        MetContext met;
    };

    struct HorizonState {
        size_t begin{0};   // first sample inside the horizon
        double sum{0.0};
        MetAccumulator met;
    };

    struct KeyWindow {
        std::mutex mutex;
        std::string station_id;
        Pollutant pollutant{Pollutant::PM25};
        std::deque<Sample> samples;   // ordered by timestamp, spans the retention
        std::array<HorizonState, WINDOW_HORIZONS.size()> horizons{};
        EpochNanos watermark{std::numeric_limits<EpochNanos>::min()};
        EpochNanos newest{std::numeric_limits<EpochNanos>::min()};   // newest sample timestamp
    };

    static auto makeKey(const std::string& station_id, Pollutant pollutant) -> std::string;

    auto findOrCreate(const std::string& station_id, Pollutant pollutant) -> KeyWindow*;
    auto find(const std::string& station_id, Pollutant pollutant) const -> KeyWindow*;

    // The helpers below require the key's mutex
    static auto advance(KeyWindow* window, EpochNanos as_of) -> void;
    auto insert(KeyWindow* window, const Sample& sample) const -> bool;
    auto prune(KeyWindow* window) const -> void;
    static auto resultsAtWatermark(const KeyWindow& window) -> std::vector<WindowResult>;
    static auto resultsByScan(const KeyWindow& window, EpochNanos as_of) -> std::vector<WindowResult>;

    ResultCallback on_change_;
    const EpochNanos retention_ns_;
    mutable std::mutex keys_mutex_;   // guards the map structure only
    std::unordered_map<std::string, std::unique_ptr<KeyWindow>> keys_;
};

} // namespace GreenWatch::Windows
