#pragma once

#include "window_engine.h"
#include "reading_history.h"

namespace GreenWatch::Windows {

/// Point-in-time window engine for periodic polling: every query rescans the durable
/// reading history, so it holds no window state of its own.
class RecomputeWindowEngine final : public IWindowEngine {
public:
    explicit RecomputeWindowEngine(IReadingHistory& history) : history_(history) {}

    /// Appends to the underlying history
    auto update(const Reading& reading) -> void override;

    [[nodiscard]] auto currentAverages(const std::string& station_id, Pollutant pollutant,
                                       EpochNanos as_of) -> std::vector<WindowResult> override;

private:
    IReadingHistory& history_;
};

} // namespace GreenWatch::Windows
