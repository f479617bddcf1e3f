#include "polling_context.h"
#include "common/logging.h"
#include "common/thread_utils.h"
#include "common/time_utils.h"
#include "greenwatch/ingestion/reading_validator.h"
#include "greenwatch/pipeline/neighbor_screening.h"
#include "greenwatch/pipeline/streaming_context.h"

#include <chrono>

namespace GreenWatch::Pipeline {

PollingContext::PollingContext(const GreenWatchConfig& config, Ingestion::IReadingConnector& connector,
                               Ingestion::IWeatherConnector* weather, Windows::IReadingHistory& history,
                               CompliancePipeline& pipeline, StreamingContext* streaming)
    : config_(config),
      connector_(connector),
      weather_(weather),
      history_(history),
      engine_(history),
      pipeline_(pipeline),
      streaming_(streaming) {}

PollingContext::~PollingContext() {
    stop();
}

auto PollingContext::start() -> bool {
    if (running_.load(std::memory_order_acquire)) {
        LOG_WARN("Polling context already running");
        return true;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(true, std::memory_order_release);
    worker_ = Common::createAndStartThread(config_.pipeline.polling_core, "gw-polling", [this]() { run(); });
    LOG_INFO("Polling context started: %zu stations every %us", config_.stations.size(),
             config_.pipeline.poll_interval_seconds);
    return true;
}

auto PollingContext::stop() -> void {
    running_.store(false, std::memory_order_release);
    if (!worker_.joinable()) {
        return;
    }
    worker_.join();
    LOG_INFO("Polling context stopped after %lu cycles", static_cast<unsigned long>(cycles_.load()));
}

auto PollingContext::processStation(const StationConfig& station, EpochNanos now, CycleStats* stats) -> void {
    ++stats->stations_polled;

    auto fetched = connector_.fetchReading(station);
    if (!fetched) {
        return;
    }
    ++stats->readings_fetched;
    Reading reading = std::move(*fetched);

    if (weather_ && config_.ingestion.weather_enabled && station.latitude && station.longitude) {
        if (auto weather = weather_->fetchWeather(*station.latitude, *station.longitude)) {
            weather->fillMissing(&reading.met);
        }
    }

    const auto validation = Ingestion::ReadingValidator::validate(reading, now);
    if (!validation.is_valid) {
        ++stats->readings_rejected;
        return;
    }

    auto screened = screenAgainstNeighbors(reading, station, history_);
    stats->pollutants_quarantined += screened.quarantined;
    Reading accepted = std::move(screened.accepted);
    if (!accepted.hasAnyPollutant()) {
        LOG_WARN("Every pollutant of station %s quarantined; reading dropped", station.station_id.c_str());
        return;
    }
    ++stats->readings_accepted;

    engine_.update(accepted);
    const EpochNanos as_of = *accepted.timestamp;
    for (auto p : ALL_POLLUTANTS) {
        if (!accepted.pollutant(p)) continue;
        const auto windows = engine_.currentAverages(station.station_id, p, as_of);
        const auto stored = pipeline_.onWindowResults(Classification::EventOrigin::POLLING, station.station_id,
                                                      p, windows, as_of);
        stats->events_stored += static_cast<uint32_t>(stored.size());
    }

    if (streaming_ && streaming_->isRunning()) {
        (void)streaming_->submit(std::move(accepted));
    }
}

auto PollingContext::runCycle(EpochNanos now) -> CycleStats {
    return cycle(now, false);
}

auto PollingContext::cycle(EpochNanos now, bool honour_shutdown) -> CycleStats {
    CycleStats stats;
    for (const auto& station : config_.stations) {
        processStation(station, now, &stats);
        if (honour_shutdown && !running_.load(std::memory_order_acquire)) {
            break;
        }
    }
    cycles_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO("Polling cycle complete: stations=%u fetched=%u rejected=%u quarantined=%u accepted=%u events=%u",
             stats.stations_polled, stats.readings_fetched, stats.readings_rejected,
             stats.pollutants_quarantined, stats.readings_accepted, stats.events_stored);
    return stats;
}

auto PollingContext::run() -> void {
    LOG_INFO("Polling worker started");
    const auto interval = std::chrono::seconds(config_.pipeline.poll_interval_seconds);

    while (running_.load(std::memory_order_acquire)) {
        const auto cycle_start = std::chrono::steady_clock::now();
        try {
            cycle(Common::getWallClockNanos(), true);
        } catch (const Ledger::LedgerWriteError& e) {
            LOG_FATAL("Polling worker stopping after ledger failure: %s", e.what());
            running_.store(false, std::memory_order_release);
            break;
        }

        // Sleep in short slices so shutdown is prompt
        while (running_.load(std::memory_order_acquire) &&
               std::chrono::steady_clock::now() - cycle_start < interval) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
    LOG_INFO("Polling worker stopped");
}

} // namespace GreenWatch::Pipeline
