#pragma once

#include "config/config.h"
#include "greenwatch/classification/compliance_event.h"
#include "greenwatch/rules/rule_engine.h"
#include "greenwatch/windows/window_engine.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace GreenWatch::Classification {

/// Window results of one station, grouped by pollutant
using WindowsByPollutant = std::map<Pollutant, std::vector<Windows::WindowResult>>;

/**
 * Maps window averages to compliance tiers.
 *
 *   24h exceedance -> VIOLATION (PENDING_OFFICER_REVIEW)
 *    8h exceedance -> FLAG
 *    1h exceedance -> MONITOR
 *
 * Horizons are checked 24h, 8h, 1h and may all fire for the same pollutant.
 * The observed value is the window average divided by the station's zone factor.
 * Stateless apart from references to immutable tables.
 */
class TierClassifier {
public:
    /// Prior violations in [as_of - 48h, as_of - 1h) mark a consecutive-day breach
    static constexpr EpochNanos CONSECUTIVE_LOOKBACK_NS = 48 * Common::NANOS_PER_HOUR;
    static constexpr EpochNanos CONSECUTIVE_GAP_NS = Common::NANOS_PER_HOUR;

    TierClassifier(const Rules::RuleEngine& rules, const ZoneTable& zones) noexcept
        : rules_(rules), zones_(zones) {}

    [[nodiscard]] auto classify(const std::string& station_id, Pollutant pollutant,
                                const std::vector<Windows::WindowResult>& windows,
                                std::string_view zone, const IConsecutiveBreachProbe& probe,
                                EpochNanos as_of) const -> std::vector<ClassificationEvent>;

    [[nodiscard]] auto classifyAllPollutants(const std::string& station_id,
                                             const WindowsByPollutant& windows,
                                             std::string_view zone, const IConsecutiveBreachProbe& probe,
                                             EpochNanos as_of) const -> ClassificationResult;

private:
    auto logEvent(const ClassificationEvent& event) const -> void;

    const Rules::RuleEngine& rules_;
    const ZoneTable& zones_;
};

} // namespace GreenWatch::Classification
