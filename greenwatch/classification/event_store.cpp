#include "event_store.h"
#include "common/logging.h"

#include <mutex>

namespace GreenWatch::Classification {

auto InMemoryEventStore::isDuplicate(const ClassificationEvent& candidate) const noexcept -> bool {
    for (const auto& existing : events_) {
        if (existing.station_id != candidate.station_id ||
            existing.pollutant != candidate.pollutant ||
            existing.tier != candidate.tier ||
            isClosed(existing.status)) {
            continue;
        }
        const bool overlaps = existing.window_start <= candidate.window_end &&
                              candidate.window_start <= existing.window_end;
        if (overlaps && existing.window_end >= candidate.window_end - dedup_horizon_) {
            return true;
        }
    }
    return false;
}

auto InMemoryEventStore::insertIfNew(const ClassificationEvent& event) -> InsertOutcome {
    if (event.event_id.empty()) {
        LOG_ERROR("Refusing compliance event without id: station=%s pollutant=%s",
                  event.station_id.c_str(), pollutantKey(event.pollutant));
        return InsertOutcome::REJECTED;
    }

    std::unique_lock lock(mutex_);
    if (index_.count(event.event_id) != 0) {
        LOG_ERROR("Compliance event id collision: %s", event.event_id.c_str());
        return InsertOutcome::REJECTED;
    }
    if (isDuplicate(event)) {
        LOG_DEBUG("Suppressed duplicate %s event: station=%s pollutant=%s window=%s",
                  tierName(event.tier), event.station_id.c_str(), pollutantKey(event.pollutant),
                  periodLabel(event.window_horizon));
        return InsertOutcome::DUPLICATE;
    }

    index_.emplace(event.event_id, events_.size());
    events_.push_back(event);
    return InsertOutcome::STORED;
}

auto InMemoryEventStore::find(const std::string& event_id) const -> std::optional<ClassificationEvent> {
    std::shared_lock lock(mutex_);
    auto it = index_.find(event_id);
    if (it == index_.end()) return std::nullopt;
    return events_[it->second];
}

auto InMemoryEventStore::applyOfficerAction(const OfficerAction& action) -> bool {
    std::unique_lock lock(mutex_);
    auto it = index_.find(action.event_id);
    if (it == index_.end()) {
        LOG_WARN("Officer action %s for unknown event %s", actionName(action.action), action.event_id.c_str());
        return false;
    }
    auto& event = events_[it->second];
    const EventStatus previous = event.status;
    event.status = statusAfterAction(action.action);
    actions_.push_back(action);
    LOG_INFO("Officer %s applied %s to event %s: %s -> %s", action.officer_id.c_str(),
             actionName(action.action), action.event_id.c_str(), statusName(previous),
             statusName(event.status));
    return true;
}

auto InMemoryEventStore::actionsFor(const std::string& event_id) const -> std::vector<OfficerAction> {
    std::shared_lock lock(mutex_);
    std::vector<OfficerAction> out;
    for (const auto& a : actions_) {
        if (a.event_id == event_id) out.push_back(a);
    }
    return out;
}

auto InMemoryEventStore::events(const std::string& station_id) const -> std::vector<ClassificationEvent> {
    std::shared_lock lock(mutex_);
    if (station_id.empty()) return events_;
    std::vector<ClassificationEvent> out;
    for (const auto& e : events_) {
        if (e.station_id == station_id) out.push_back(e);
    }
    return out;
}

auto InMemoryEventStore::hadViolation(const std::string& station_id, Pollutant pollutant,
                                      EpochNanos from_inclusive, EpochNanos to_exclusive) const -> bool {
    std::shared_lock lock(mutex_);
    for (const auto& e : events_) {
        if (e.tier == Tier::VIOLATION && e.station_id == station_id && e.pollutant == pollutant &&
            e.created_at >= from_inclusive && e.created_at < to_exclusive) {
            return true;
        }
    }
    return false;
}

auto InMemoryEventStore::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return events_.size();
}

} // namespace GreenWatch::Classification
