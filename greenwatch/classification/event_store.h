#pragma once

#include "greenwatch/classification/compliance_event.h"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace GreenWatch::Classification {

enum class InsertOutcome : uint8_t {
    STORED = 0,
    DUPLICATE = 1,
    REJECTED = 2
};

constexpr auto insertOutcomeName(InsertOutcome outcome) noexcept -> const char* {
    switch (outcome) {
        case InsertOutcome::STORED:    return "STORED";
        case InsertOutcome::DUPLICATE: return "DUPLICATE";
        case InsertOutcome::REJECTED:  return "REJECTED";
    }
    return "UNKNOWN";
}

/**
 * Persistence for compliance events and officer actions.
 *
 * insertIfNew() de-duplicates against open events (not DISMISSED/RESOLVED) of the same
 * station, pollutant and tier whose window overlaps the new one and ends no earlier than
 * dedup_horizon before it. The check and the insert are atomic.
 */
class IComplianceEventStore : public IConsecutiveBreachProbe {
public:
    ~IComplianceEventStore() override = default;

    /// Event must carry a non-empty event_id
    [[nodiscard]] virtual auto insertIfNew(const ClassificationEvent& event) -> InsertOutcome = 0;

    [[nodiscard]] virtual auto find(const std::string& event_id) const -> std::optional<ClassificationEvent> = 0;

    /// Records the action and moves the event to the status it implies. False if the event is unknown.
    [[nodiscard]] virtual auto applyOfficerAction(const OfficerAction& action) -> bool = 0;

    [[nodiscard]] virtual auto actionsFor(const std::string& event_id) const -> std::vector<OfficerAction> = 0;

    /// Events of a station in insertion order; every station when station_id is empty
    [[nodiscard]] virtual auto events(const std::string& station_id = {}) const -> std::vector<ClassificationEvent> = 0;
};

class InMemoryEventStore final : public IComplianceEventStore {
public:
    explicit InMemoryEventStore(EpochNanos dedup_horizon = 2 * Common::NANOS_PER_HOUR) noexcept
        : dedup_horizon_(dedup_horizon) {}

    [[nodiscard]] auto insertIfNew(const ClassificationEvent& event) -> InsertOutcome override;
    [[nodiscard]] auto find(const std::string& event_id) const -> std::optional<ClassificationEvent> override;
    [[nodiscard]] auto applyOfficerAction(const OfficerAction& action) -> bool override;
    [[nodiscard]] auto actionsFor(const std::string& event_id) const -> std::vector<OfficerAction> override;
    [[nodiscard]] auto events(const std::string& station_id = {}) const -> std::vector<ClassificationEvent> override;

    [[nodiscard]] auto hadViolation(const std::string& station_id, Pollutant pollutant,
                                    EpochNanos from_inclusive, EpochNanos to_exclusive) const -> bool override;

    [[nodiscard]] auto size() const -> size_t;

private:
    [[nodiscard]] auto isDuplicate(const ClassificationEvent& candidate) const noexcept -> bool;

    const EpochNanos dedup_horizon_;

    mutable std::shared_mutex mutex_;
    std::vector<ClassificationEvent> events_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<OfficerAction> actions_;
};

} // namespace GreenWatch::Classification
