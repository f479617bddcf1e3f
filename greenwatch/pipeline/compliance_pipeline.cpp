#include "compliance_pipeline.h"
#include "common/logging.h"
#include "common/time_utils.h"
#include "greenwatch/ledger/crypto_utils.h"
#include "greenwatch/pipeline/ledger_payloads.h"

#include <functional>

namespace GreenWatch::Pipeline {

using namespace Classification;

CompliancePipeline::CompliancePipeline(const GreenWatchConfig& config, const TierClassifier& classifier,
                                       IComplianceEventStore& events, Ledger::LedgerWriter& ledger) noexcept
    : config_(config), classifier_(classifier), events_(events), ledger_(ledger) {}

auto CompliancePipeline::stripeFor(const std::string& key) noexcept -> Stripe& {
    return stripes_[std::hash<std::string>{}(key) % STRIPE_COUNT];
}

auto CompliancePipeline::persist(ClassificationEvent& event) -> bool {
    event.event_id = Ledger::generateUuidV4();

    const auto outcome = events_.insertIfNew(event);
    if (outcome == InsertOutcome::DUPLICATE) {
        events_deduplicated_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    if (outcome != InsertOutcome::STORED) {
        LOG_ERROR("Compliance event for station=%s pollutant=%s was rejected by the store",
                  event.station_id.c_str(), pollutantKey(event.pollutant));
        return false;
    }

    rapidjson::Document doc;
    auto payload = complianceEventPayload(event, doc.GetAllocator());
    try {
        ledger_.append(Ledger::EventType::COMPLIANCE_EVENT, event.event_id, payload);
    } catch (const Ledger::LedgerWriteError& e) {
        failed_.store(true, std::memory_order_release);
        LOG_FATAL("Audit ledger write failed for compliance event %s: %s", event.event_id.c_str(), e.what());
        throw;
    }

    events_stored_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Compliance event stored: id=%s station=%s pollutant=%s tier=%s origin=%s",
             event.event_id.c_str(), event.station_id.c_str(), pollutantKey(event.pollutant),
             tierName(event.tier), originName(event.origin));
    return true;
}

auto CompliancePipeline::onWindowResults(EventOrigin origin, const std::string& station_id, Pollutant pollutant,
                                         const std::vector<Windows::WindowResult>& windows, EpochNanos as_of)
    -> std::vector<ClassificationEvent> {
    std::vector<ClassificationEvent> stored;
    results_received_.fetch_add(1, std::memory_order_relaxed);
    if (UNLIKELY(failed_.load(std::memory_order_acquire))) {
        return stored;
    }

    std::string key = station_id;
    key.push_back('|');
    key.append(pollutantKey(pollutant));

    auto& stripe = stripeFor(key);
    std::lock_guard<std::mutex> lock(stripe.mutex);

    auto polled = stripe.polled_as_of.find(key);
    if (origin == EventOrigin::STREAMING) {
        if (polled != stripe.polled_as_of.end() && polled->second >= as_of) {
            streaming_superseded_.fetch_add(1, std::memory_order_relaxed);
            LOG_DEBUG("Streaming result for %s superseded by polling", key.c_str());
            return stored;
        }
    } else if (polled == stripe.polled_as_of.end()) {
        stripe.polled_as_of.emplace(key, as_of);
    } else if (as_of > polled->second) {
        polled->second = as_of;
    }

    const auto* station = config_.findStation(station_id);
    const std::string_view zone = station ? std::string_view(station->zone) : std::string_view();

    auto events = classifier_.classify(station_id, pollutant, windows, zone, events_, as_of);
    for (auto& event : events) {
        event.origin = origin;
        if (persist(event)) {
            stored.push_back(event);
        }
    }
    return stored;
}

auto CompliancePipeline::applyOfficerAction(const std::string& event_id, OfficerActionType action,
                                            const std::string& officer_id, const std::string& reason,
                                            const std::string& notes) -> std::optional<OfficerAction> {
    OfficerAction record;
    record.action_id = Ledger::generateUuidV4();
    record.event_id = event_id;
    record.action = action;
    record.officer_id = officer_id;
    record.reason = reason;
    record.notes = notes;
    record.created_at = Common::getWallClockNanos();

    if (!events_.applyOfficerAction(record)) {
        return std::nullopt;
    }

    rapidjson::Document doc;
    auto payload = officerActionPayload(record, statusAfterAction(action), doc.GetAllocator());
    try {
        ledger_.append(Ledger::EventType::OFFICER_ACTION, record.action_id, payload);
    } catch (const Ledger::LedgerWriteError& e) {
        failed_.store(true, std::memory_order_release);
        LOG_FATAL("Audit ledger write failed for officer action %s: %s", record.action_id.c_str(), e.what());
        throw;
    }

    officer_actions_.fetch_add(1, std::memory_order_relaxed);
    return record;
}

auto CompliancePipeline::getStats() const noexcept -> Stats {
    Stats stats;
    stats.results_received = results_received_.load(std::memory_order_relaxed);
    stats.streaming_superseded = streaming_superseded_.load(std::memory_order_relaxed);
    stats.events_stored = events_stored_.load(std::memory_order_relaxed);
    stats.events_deduplicated = events_deduplicated_.load(std::memory_order_relaxed);
    stats.officer_actions = officer_actions_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace GreenWatch::Pipeline
