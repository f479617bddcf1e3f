#pragma once

#include "common/macros.h"
#include "config/config.h"
#include "greenwatch/ingestion/connector.h"
#include "greenwatch/pipeline/compliance_pipeline.h"
#include "greenwatch/windows/reading_history.h"
#include "greenwatch/windows/recompute_window_engine.h"

#include <atomic>
#include <thread>

namespace GreenWatch::Pipeline {

class StreamingContext;

/**
 * Periodic execution context.
 *
 * Each cycle, for every configured station: fetch, enrich with weather, validate,
 * cross-check against neighbours, record in the reading history, recompute the windows
 * point-in-time and hand them to the compliance pipeline. Accepted readings are then
 * forwarded to the streaming context when one is attached.
 *
 * The shutdown flag is checked between stations and between cycles; an in-flight
 * station is always completed.
 */
class PollingContext {
public:
    struct CycleStats {
        uint32_t stations_polled{0};
        uint32_t readings_fetched{0};
        uint32_t readings_rejected{0};
        uint32_t pollutants_quarantined{0};
        uint32_t readings_accepted{0};
        uint32_t events_stored{0};
    };

    PollingContext(const GreenWatchConfig& config, Ingestion::IReadingConnector& connector,
                   Ingestion::IWeatherConnector* weather, Windows::IReadingHistory& history,
                   CompliancePipeline& pipeline, StreamingContext* streaming = nullptr);
    ~PollingContext();
    DELETE_COPY_AND_MOVE(PollingContext);

    auto start() -> bool;
    auto stop() -> void;

    /// One pass over every station, validated against `now`.
    /// Throws Ledger::LedgerWriteError when the audit trail cannot be written.
    auto runCycle(EpochNanos now) -> CycleStats;

    [[nodiscard]] auto isRunning() const noexcept -> bool { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] auto cyclesCompleted() const noexcept -> uint64_t { return cycles_.load(std::memory_order_relaxed); }

private:
    auto run() -> void;
    auto cycle(EpochNanos now, bool honour_shutdown) -> CycleStats;
    auto processStation(const StationConfig& station, EpochNanos now, CycleStats* stats) -> void;

    const GreenWatchConfig& config_;
    Ingestion::IReadingConnector& connector_;
    Ingestion::IWeatherConnector* weather_;
    Windows::IReadingHistory& history_;
    Windows::RecomputeWindowEngine engine_;
    CompliancePipeline& pipeline_;
    StreamingContext* streaming_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::thread worker_;
};

} // namespace GreenWatch::Pipeline
