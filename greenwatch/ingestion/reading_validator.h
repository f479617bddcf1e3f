#pragma once

#include "greenwatch/types.h"

#include <string>
#include <vector>

namespace GreenWatch::Ingestion {

struct ValidationResult {
    bool is_valid{true};
    std::vector<std::string> reasons;
};

/// Inclusive physical plausibility range for one field
struct PhysicalBound {
    double min;
    double max;
};

/// Structural and physical plausibility checks applied before a reading enters aggregation.
/// Stateless; every violation found is reported, not just the first.
class ReadingValidator {
public:
    static constexpr EpochNanos MAX_AGE_NS = Common::hoursToNanos(2);
    static constexpr EpochNanos MAX_FUTURE_SKEW_NS = Common::secondsToNanos(300);

    [[nodiscard]] static auto pollutantBound(Pollutant p) noexcept -> PhysicalBound;
    [[nodiscard]] static auto metBound(MetField f) noexcept -> PhysicalBound;

    /// Checks reading against the bound table and the freshness window around now.
    /// Failures are logged at WARN.
    [[nodiscard]] static auto validate(const Reading& reading, EpochNanos now) -> ValidationResult;

private:
    static auto checkField(const char* name, double value, PhysicalBound bound,
                           std::vector<std::string>* reasons) -> void;
};

} // namespace GreenWatch::Ingestion
