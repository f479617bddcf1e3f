#include "tier_classifier.h"
#include "common/logging.h"
#include "common/macros.h"

namespace GreenWatch::Classification {

namespace {

constexpr AveragingPeriod CHECK_ORDER[] = {
    AveragingPeriod::TWENTY_FOUR_HOUR,
    AveragingPeriod::EIGHT_HOUR,
    AveragingPeriod::ONE_HOUR
};

constexpr auto tierForHorizon(AveragingPeriod horizon) noexcept -> Tier {
    switch (horizon) {
        case AveragingPeriod::TWENTY_FOUR_HOUR: return Tier::VIOLATION;
        case AveragingPeriod::EIGHT_HOUR:       return Tier::FLAG;
        default:                                return Tier::MONITOR;
    }
}

} // namespace

auto TierClassifier::classify(const std::string& station_id, Pollutant pollutant,
                              const std::vector<Windows::WindowResult>& windows,
                              std::string_view zone, const IConsecutiveBreachProbe& probe,
                              EpochNanos as_of) const -> std::vector<ClassificationEvent> {
    std::vector<ClassificationEvent> events;
    const double factor = zones_.factorFor(zone);

    for (AveragingPeriod horizon : CHECK_ORDER) {
        const Windows::WindowResult* window = nullptr;
        for (const auto& w : windows) {
            if (w.horizon == horizon && w.count > 0) {
                window = &w;
                break;
            }
        }
        if (!window) continue;

        const double adjusted = window->average / factor;
        auto lookup = rules_.evaluate(pollutant, horizon, adjusted);
        if (lookup.status == Rules::RuleStatus::NOT_CONFIGURED) continue;
        if (UNLIKELY(lookup.status == Rules::RuleStatus::CONFIGURATION_ERROR)) {
            LOG_ERROR("Cannot classify station=%s pollutant=%s: no regulatory limits loaded",
                      station_id.c_str(), pollutantKey(pollutant));
            return events;
        }
        if (lookup.result.within_limit) continue;

        ClassificationEvent event;
        event.created_at = as_of;
        event.station_id = station_id;
        event.pollutant = pollutant;
        event.tier = tierForHorizon(horizon);
        event.status = initialStatus(event.tier);
        event.rule_result = std::move(lookup.result);
        event.window_horizon = horizon;
        event.window_start = window->window_start;
        event.window_end = window->window_end;
        event.met_context = window->met;

        if (event.tier == Tier::VIOLATION) {
            event.is_consecutive_day_breach = probe.hadViolation(
                station_id, pollutant, as_of - CONSECUTIVE_LOOKBACK_NS, as_of - CONSECUTIVE_GAP_NS);
        }

        logEvent(event);
        events.push_back(std::move(event));
    }
    return events;
}

auto TierClassifier::classifyAllPollutants(const std::string& station_id,
                                           const WindowsByPollutant& windows,
                                           std::string_view zone, const IConsecutiveBreachProbe& probe,
                                           EpochNanos as_of) const -> ClassificationResult {
    ClassificationResult result;
    result.station_id = station_id;
    result.timestamp = as_of;
    for (const auto& [pollutant, pollutant_windows] : windows) {
        auto events = classify(station_id, pollutant, pollutant_windows, zone, probe, as_of);
        for (auto& e : events) {
            result.events.push_back(std::move(e));
        }
    }
    return result;
}

auto TierClassifier::logEvent(const ClassificationEvent& event) const -> void {
    const auto& r = event.rule_result;
    switch (event.tier) {
        case Tier::VIOLATION:
            LOG_WARN("TIER 3 VIOLATION: station=%s %s %s avg=%.2f limit=%g exceedance=%.2f%%%s",
                     event.station_id.c_str(), pollutantDisplayName(event.pollutant), r.periodLabel(),
                     r.observed_value, r.limit_value, r.exceedance_percent,
                     event.is_consecutive_day_breach ? " (consecutive day)" : "");
            break;
        case Tier::FLAG:
            LOG_INFO("TIER 2 FLAG: station=%s %s %s avg=%.2f limit=%g exceedance=%.2f%%",
                     event.station_id.c_str(), pollutantDisplayName(event.pollutant), r.periodLabel(),
                     r.observed_value, r.limit_value, r.exceedance_percent);
            break;
        case Tier::MONITOR:
            LOG_INFO("TIER 1 MONITOR: station=%s %s %s avg=%.2f limit=%g",
                     event.station_id.c_str(), pollutantDisplayName(event.pollutant), r.periodLabel(),
                     r.observed_value, r.limit_value);
            break;
    }
}

} // namespace GreenWatch::Classification
