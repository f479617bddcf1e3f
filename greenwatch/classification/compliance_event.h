#pragma once

#include "greenwatch/rules/rule_engine.h"
#include "greenwatch/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GreenWatch::Classification {

enum class Tier : uint8_t {
    MONITOR = 1,
    FLAG = 2,
    VIOLATION = 3
};

enum class EventStatus : uint8_t {
    MONITOR = 0,
    FLAG = 1,
    PENDING_OFFICER_REVIEW = 2,
    ESCALATED = 3,
    DISMISSED = 4,
    RESOLVED = 5
};

/// Which execution context produced a classification
enum class EventOrigin : uint8_t {
    POLLING = 0,
    STREAMING = 1
};

constexpr auto tierName(Tier tier) noexcept -> const char* {
    switch (tier) {
        case Tier::MONITOR:   return "MONITOR";
        case Tier::FLAG:      return "FLAG";
        case Tier::VIOLATION: return "VIOLATION";
    }
    return "UNKNOWN";
}

constexpr auto statusName(EventStatus status) noexcept -> const char* {
    switch (status) {
        case EventStatus::MONITOR:                return "MONITOR";
        case EventStatus::FLAG:                   return "FLAG";
        case EventStatus::PENDING_OFFICER_REVIEW: return "PENDING_OFFICER_REVIEW";
        case EventStatus::ESCALATED:              return "ESCALATED";
        case EventStatus::DISMISSED:              return "DISMISSED";
        case EventStatus::RESOLVED:               return "RESOLVED";
    }
    return "UNKNOWN";
}

constexpr auto originName(EventOrigin origin) noexcept -> const char* {
    return origin == EventOrigin::POLLING ? "POLLING" : "STREAMING";
}

/// Initial status a freshly classified event carries
constexpr auto initialStatus(Tier tier) noexcept -> EventStatus {
    switch (tier) {
        case Tier::VIOLATION: return EventStatus::PENDING_OFFICER_REVIEW;
        case Tier::FLAG:      return EventStatus::FLAG;
        case Tier::MONITOR:   return EventStatus::MONITOR;
    }
    return EventStatus::MONITOR;
}

/// Closed events no longer suppress new ones for the same breach
constexpr auto isClosed(EventStatus status) noexcept -> bool {
    return status == EventStatus::DISMISSED || status == EventStatus::RESOLVED;
}

struct ClassificationEvent {
    // Assigned when the persistence layer accepts the event
    std::string event_id;
    EpochNanos created_at{0};
    EventOrigin origin{EventOrigin::POLLING};

    std::string station_id;
    Pollutant pollutant{Pollutant::PM25};
    Tier tier{Tier::MONITOR};
    EventStatus status{EventStatus::MONITOR};
    Rules::RuleResult rule_result;
    AveragingPeriod window_horizon{AveragingPeriod::ONE_HOUR};
    EpochNanos window_start{0};
    EpochNanos window_end{0};
    MetContext met_context;
    bool is_consecutive_day_breach{false};

    [[nodiscard]] auto windowHours() const noexcept -> int { return periodHours(window_horizon); }
};

struct ClassificationResult {
    std::string station_id;
    EpochNanos timestamp{0};
    std::vector<ClassificationEvent> events;

    [[nodiscard]] auto hasViolation() const noexcept -> bool {
        for (const auto& e : events) {
            if (e.tier == Tier::VIOLATION) return true;
        }
        return false;
    }

    [[nodiscard]] auto hasFlag() const noexcept -> bool {
        for (const auto& e : events) {
            if (e.tier == Tier::FLAG) return true;
        }
        return false;
    }
};

/// Answers whether a station/pollutant already had a 24h VIOLATION recorded in a time range
class IConsecutiveBreachProbe {
public:
    virtual ~IConsecutiveBreachProbe() = default;

    /// Range is [from_inclusive, to_exclusive) over event creation time
    [[nodiscard]] virtual auto hadViolation(const std::string& station_id, Pollutant pollutant,
                                            EpochNanos from_inclusive, EpochNanos to_exclusive) const -> bool = 0;
};

// ============================================================================
// Officer actions
// ============================================================================

enum class OfficerActionType : uint8_t {
    ESCALATE = 0,
    DISMISS = 1,
    FLAG_FOR_MONITORING = 2
};

constexpr auto actionName(OfficerActionType action) noexcept -> const char* {
    switch (action) {
        case OfficerActionType::ESCALATE:            return "ESCALATE";
        case OfficerActionType::DISMISS:             return "DISMISS";
        case OfficerActionType::FLAG_FOR_MONITORING: return "FLAG_FOR_MONITORING";
    }
    return "UNKNOWN";
}

[[nodiscard]] inline auto parseActionType(std::string_view name) noexcept -> std::optional<OfficerActionType> {
    if (name == "ESCALATE") return OfficerActionType::ESCALATE;
    if (name == "DISMISS") return OfficerActionType::DISMISS;
    if (name == "FLAG_FOR_MONITORING") return OfficerActionType::FLAG_FOR_MONITORING;
    return std::nullopt;
}

constexpr auto statusAfterAction(OfficerActionType action) noexcept -> EventStatus {
    switch (action) {
        case OfficerActionType::ESCALATE:            return EventStatus::ESCALATED;
        case OfficerActionType::DISMISS:             return EventStatus::DISMISSED;
        case OfficerActionType::FLAG_FOR_MONITORING: return EventStatus::FLAG;
    }
    return EventStatus::FLAG;
}

struct OfficerAction {
    std::string action_id;
    std::string event_id;
    OfficerActionType action{OfficerActionType::ESCALATE};
    std::string officer_id;
    std::string reason;
    std::string notes;
    EpochNanos created_at{0};
};

} // namespace GreenWatch::Classification
