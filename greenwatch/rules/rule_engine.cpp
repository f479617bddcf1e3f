#include "rule_engine.h"
#include "common/logging.h"
#include "common/macros.h"

#include <algorithm>
#include <cstdio>

namespace GreenWatch::Rules {

auto RuleEngine::limit(Pollutant pollutant, AveragingPeriod period) const noexcept -> std::optional<double> {
    if (const auto* entry = table_.find(pollutant, period)) {
        return entry->limit;
    }
    return std::nullopt;
}

auto RuleEngine::evaluate(Pollutant pollutant, AveragingPeriod period, double observed) const -> RuleLookup {
    RuleLookup lookup;
    if (UNLIKELY(table_.empty())) {
        LOG_ERROR("RuleEngine: no regulatory limit table loaded");
        lookup.status = RuleStatus::CONFIGURATION_ERROR;
        return lookup;
    }

    const auto* entry = table_.find(pollutant, period);
    if (!entry) {
        lookup.status = RuleStatus::NOT_CONFIGURED;
        return lookup;
    }

    auto& r = lookup.result;
    r.pollutant = pollutant;
    r.period = period;
    r.observed_value = observed;
    r.limit_value = entry->limit;
    r.within_limit = observed <= entry->limit;
    r.exceedance_value = roundTo(std::max(0.0, observed - entry->limit), 4);
    r.exceedance_percent = r.within_limit ? 0.0 : roundTo(std::max(0.0, (observed / entry->limit - 1.0) * 100.0), 2);

    char name[160];
    std::snprintf(name, sizeof(name), "%s %s %s limit (%g %s)", table_.name.c_str(),
                  pollutantDisplayName(pollutant), periodLabel(period), entry->limit, entry->unit.c_str());
    r.rule_name = name;
    r.legal_reference = entry->legal_reference;
    r.rule_version = table_.version;

    lookup.status = RuleStatus::OK;
    return lookup;
}

} // namespace GreenWatch::Rules
