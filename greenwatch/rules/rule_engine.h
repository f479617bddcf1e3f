#pragma once

#include "config/config.h"
#include "greenwatch/types.h"

#include <optional>
#include <string>

namespace GreenWatch::Rules {

struct RuleResult {
    Pollutant pollutant{Pollutant::PM25};
    AveragingPeriod period{AveragingPeriod::TWENTY_FOUR_HOUR};
    double observed_value{0.0};
    double limit_value{0.0};
    bool within_limit{true};
    double exceedance_value{0.0};
    double exceedance_percent{0.0};
    std::string rule_name;
    std::string legal_reference;
    std::string rule_version;

    [[nodiscard]] auto periodLabel() const noexcept -> const char* { return GreenWatch::periodLabel(period); }
};

enum class RuleStatus : uint8_t {
    OK = 0,
    NOT_CONFIGURED = 1,        // no limit for this pollutant/period; expected, not an error
    CONFIGURATION_ERROR = 2    // no limit table loaded at all; fatal
};

constexpr auto ruleStatusName(RuleStatus status) noexcept -> const char* {
    switch (status) {
        case RuleStatus::OK:                  return "OK";
        case RuleStatus::NOT_CONFIGURED:      return "NOT_CONFIGURED";
        case RuleStatus::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
    }
    return "UNKNOWN";
}

/// Outcome of a rule evaluation; result is meaningful only when status == OK
struct RuleLookup {
    RuleStatus status{RuleStatus::NOT_CONFIGURED};
    RuleResult result;

    [[nodiscard]] auto ok() const noexcept -> bool { return status == RuleStatus::OK; }
};

/// Maps (pollutant, averaging period) to a regulatory limit. Holds a reference to the
/// immutable limit table; safe for concurrent use without locking.
class RuleEngine {
public:
    explicit RuleEngine(const RegulatoryLimitTable& table) noexcept : table_(table) {}

    /// False when the table is empty; callers must treat that as fatal at startup
    [[nodiscard]] auto isLoaded() const noexcept -> bool { return !table_.empty(); }

    [[nodiscard]] auto limit(Pollutant pollutant, AveragingPeriod period) const noexcept -> std::optional<double>;

    /// observed == limit is compliant
    [[nodiscard]] auto evaluate(Pollutant pollutant, AveragingPeriod period, double observed) const -> RuleLookup;

    [[nodiscard]] auto version() const noexcept -> const std::string& { return table_.version; }

private:
    const RegulatoryLimitTable& table_;
};

} // namespace GreenWatch::Rules
