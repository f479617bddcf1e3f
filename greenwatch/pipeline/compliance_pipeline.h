#pragma once

#include "common/macros.h"
#include "config/config.h"
#include "greenwatch/classification/event_store.h"
#include "greenwatch/classification/tier_classifier.h"
#include "greenwatch/ledger/ledger_writer.h"
#include "greenwatch/windows/window_engine.h"

#include <array>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace GreenWatch::Pipeline {

/**
 * Single entry point from window results to persisted compliance events.
 *
 * Both execution contexts call onWindowResults(). Calls for the same (station, pollutant)
 * are serialized by a striped mutex. The polling context is authoritative: a streaming
 * result is discarded when polling already classified the key at the same or a later as_of.
 *
 * Every stored event is appended to the audit ledger as COMPLIANCE_EVENT and every officer
 * action as OFFICER_ACTION. A LedgerWriteError marks the pipeline failed and is rethrown.
 */
class CompliancePipeline {
public:
    struct Stats {
        uint64_t results_received{0};
        uint64_t streaming_superseded{0};
        uint64_t events_stored{0};
        uint64_t events_deduplicated{0};
        uint64_t officer_actions{0};
    };

    CompliancePipeline(const GreenWatchConfig& config, const Classification::TierClassifier& classifier,
                       Classification::IComplianceEventStore& events, Ledger::LedgerWriter& ledger) noexcept;
    DELETE_COPY_AND_MOVE(CompliancePipeline);

    /// Classifies, de-duplicates and persists. Returns the events that were stored.
    /// Throws Ledger::LedgerWriteError when the audit trail cannot be written.
    auto onWindowResults(Classification::EventOrigin origin, const std::string& station_id, Pollutant pollutant,
                         const std::vector<Windows::WindowResult>& windows, EpochNanos as_of)
        -> std::vector<Classification::ClassificationEvent>;

    /// Applies an officer decision to a stored event. Absent when the event does not exist.
    /// Throws Ledger::LedgerWriteError when the audit trail cannot be written.
    auto applyOfficerAction(const std::string& event_id, Classification::OfficerActionType action,
                            const std::string& officer_id, const std::string& reason = {},
                            const std::string& notes = {}) -> std::optional<Classification::OfficerAction>;

    /// True once a ledger write has failed; the process must stop
    [[nodiscard]] auto hasFailed() const noexcept -> bool { return failed_.load(std::memory_order_acquire); }

    [[nodiscard]] auto getStats() const noexcept -> Stats;

private:
    static constexpr size_t STRIPE_COUNT = 64;

    struct Stripe {
        std::mutex mutex;
        // Latest as_of classified by the polling context, per key
        std::unordered_map<std::string, EpochNanos> polled_as_of;
    };

    auto stripeFor(const std::string& key) noexcept -> Stripe&;
    auto persist(Classification::ClassificationEvent& event) -> bool;

    const GreenWatchConfig& config_;
    const Classification::TierClassifier& classifier_;
    Classification::IComplianceEventStore& events_;
    Ledger::LedgerWriter& ledger_;

    std::array<Stripe, STRIPE_COUNT> stripes_;
    std::atomic<bool> failed_{false};

    std::atomic<uint64_t> results_received_{0};
    std::atomic<uint64_t> streaming_superseded_{0};
    std::atomic<uint64_t> events_stored_{0};
    std::atomic<uint64_t> events_deduplicated_{0};
    std::atomic<uint64_t> officer_actions_{0};
};

} // namespace GreenWatch::Pipeline
