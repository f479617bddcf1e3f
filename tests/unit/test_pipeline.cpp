#include <gtest/gtest.h>
#include "common/logging.h"
#include "common/time_utils.h"
#include "config/config.h"
#include "greenwatch/classification/event_store.h"
#include "greenwatch/classification/tier_classifier.h"
#include "greenwatch/ingestion/connector.h"
#include "greenwatch/ingestion/reading_validator.h"
#include "greenwatch/ledger/ledger_store.h"
#include "greenwatch/ledger/ledger_verifier.h"
#include "greenwatch/ledger/ledger_writer.h"
#include "greenwatch/pipeline/compliance_pipeline.h"
#include "greenwatch/pipeline/polling_context.h"
#include "greenwatch/pipeline/push_feed_client.h"
#include "greenwatch/pipeline/streaming_context.h"
#include "greenwatch/rules/rule_engine.h"
#include "greenwatch/windows/reading_history.h"

#include <rapidjson/document.h>

#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace GreenWatch;
using namespace GreenWatch::Classification;
using namespace GreenWatch::Pipeline;
using Common::hoursToNanos;

namespace {

/// Connector serving one canned reading per station; stations without one fail the fetch
class FakeReadingConnector final : public Ingestion::IReadingConnector {
public:
    auto fetchReading(const StationConfig& station) -> std::optional<Reading> override {
        ++fetches;
        auto it = readings.find(station.station_id);
        if (it == readings.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, Reading> readings;
    int fetches{0};
};

class FakeWeatherConnector final : public Ingestion::IWeatherConnector {
public:
    auto fetchWeather(double latitude, double longitude) -> std::optional<Ingestion::WeatherContext> override {
        Ingestion::WeatherContext w;
        w.latitude = latitude;
        w.longitude = longitude;
        w.temperature = 12.5;
        w.wind_speed = 1.5;
        w.humidity = 88.0;
        return w;
    }
};

/// Ledger store that refuses every write
class RejectingLedgerStore final : public Ledger::ILedgerStore {
public:
    auto tail() const -> std::optional<Ledger::LedgerTail> override { return std::nullopt; }
    auto insert(const Ledger::LedgerEntry&) -> bool override { return false; }
    auto readAll(std::vector<Ledger::LedgerEntry>*) const -> bool override { return false; }
};

auto reading(const std::string& station, EpochNanos ts, std::initializer_list<std::pair<Pollutant, double>> values)
    -> Reading {
    Reading r;
    r.station_id = station;
    r.timestamp = ts;
    for (const auto& [p, v] : values) {
        r.setPollutant(p, v);
    }
    return r;
}

} // namespace

// =============================================================================
// PIPELINE TEST BASE
// =============================================================================

class PipelineTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

        test_log_dir_ = "logs/test_pipeline_" + std::to_string(timestamp);
        std::filesystem::create_directories(test_log_dir_);

        std::string log_file = test_log_dir_ + "/pipeline_test.log";
        Common::initLogging(log_file.c_str());

        LOG_INFO("=== Starting Pipeline Test ===");

        ASSERT_TRUE(ConfigLoader::loadLimits("config/naaqs_limits.toml", &config_.limits));
        config_.zones.factors["residential"] = 1.0;
        config_.zones.factors["roadside"] = 0.9;
        config_.pipeline.stream_queue_size = 64;

        StationConfig dl001;
        dl001.station_id = "DL001";
        dl001.zone = "residential";
        dl001.latitude = 28.6469;
        dl001.longitude = 77.3164;
        dl001.neighbors = {"DL002"};
        StationConfig dl002;
        dl002.station_id = "DL002";
        dl002.zone = "roadside";
        dl002.neighbors = {"DL001"};
        config_.stations = {dl001, dl002};

        now_ = Common::getWallClockNanos();

        rules_ = std::make_unique<Rules::RuleEngine>(config_.limits);
        classifier_ = std::make_unique<TierClassifier>(*rules_, config_.zones);
        writer_ = std::make_unique<Ledger::LedgerWriter>(ledger_store_);
        pipeline_ = std::make_unique<CompliancePipeline>(config_, *classifier_, events_, *writer_);
    }

    void TearDown() override {
        LOG_INFO("=== Pipeline Test Completed ===");
        Common::shutdownLogging();
    }

    auto ledgerEntries() const -> std::vector<Ledger::LedgerEntry> {
        std::vector<Ledger::LedgerEntry> entries;
        EXPECT_TRUE(ledger_store_.readAll(&entries));
        return entries;
    }

    auto chainIsValid() const -> bool {
        return Ledger::LedgerVerifier(ledger_store_).verifyChain().is_valid;
    }

    std::string test_log_dir_;
    EpochNanos now_{0};
    GreenWatchConfig config_;
    InMemoryEventStore events_;
    Ledger::InMemoryLedgerStore ledger_store_;
    Windows::InMemoryReadingHistory history_;
    FakeReadingConnector connector_;
    std::unique_ptr<Rules::RuleEngine> rules_;
    std::unique_ptr<TierClassifier> classifier_;
    std::unique_ptr<Ledger::LedgerWriter> writer_;
    std::unique_ptr<CompliancePipeline> pipeline_;
};

// =============================================================================
// 1. POLLING CYCLE
// =============================================================================

TEST_F(PipelineTestBase, PollingViolationIsStoredAndLedgeredContract) {
    // === GIVEN ===
    connector_.readings["DL001"] = reading("DL001", now_, {{Pollutant::PM25, 75.0}});
    PollingContext polling(config_, connector_, nullptr, history_, *pipeline_);

    // === WHEN ===
    auto stats = polling.runCycle(now_);

    // === THEN ===
    EXPECT_EQ(stats.stations_polled, 2u);
    EXPECT_EQ(stats.readings_fetched, 1u);
    EXPECT_EQ(stats.readings_rejected, 0u);
    EXPECT_EQ(stats.readings_accepted, 1u);
    EXPECT_EQ(stats.events_stored, 1u);
    EXPECT_EQ(polling.cyclesCompleted(), 1u);

    auto stored = events_.events("DL001");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].tier, Tier::VIOLATION);
    EXPECT_EQ(stored[0].status, EventStatus::PENDING_OFFICER_REVIEW);
    EXPECT_EQ(stored[0].origin, EventOrigin::POLLING);
    EXPECT_FALSE(stored[0].event_id.empty());

    auto entries = ledgerEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].event_type, Ledger::EventType::COMPLIANCE_EVENT);
    EXPECT_EQ(entries[0].event_id, stored[0].event_id);
    EXPECT_EQ(entries[0].sequence_number, 1u);

    rapidjson::Document doc;
    doc.Parse(entries[0].event_data.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["tier"].GetString(), "VIOLATION");
    EXPECT_STREQ(doc["origin"].GetString(), "POLLING");
    EXPECT_STREQ(doc["station_id"].GetString(), "DL001");
    EXPECT_DOUBLE_EQ(doc["observed_value"].GetDouble(), 75.0);
    EXPECT_EQ(doc["window_hours"].GetInt(), 24);

    EXPECT_TRUE(chainIsValid());
}

TEST_F(PipelineTestBase, RepeatedBreachIsDeduplicatedAcrossCyclesContract) {
    // === GIVEN ===
    connector_.readings["DL001"] = reading("DL001", now_, {{Pollutant::PM25, 75.0}});
    PollingContext polling(config_, connector_, nullptr, history_, *pipeline_);
    auto first = polling.runCycle(now_);
    ASSERT_EQ(first.events_stored, 1u);

    // === WHEN ===
    const EpochNanos later = now_ + 5 * Common::NANOS_PER_MINUTE;
    connector_.readings["DL001"] = reading("DL001", later, {{Pollutant::PM25, 80.0}});
    auto second = polling.runCycle(later);

    // === THEN ===
    EXPECT_EQ(second.readings_accepted, 1u);
    EXPECT_EQ(second.events_stored, 0u);
    EXPECT_EQ(events_.size(), 1u);
    EXPECT_EQ(pipeline_->getStats().events_deduplicated, 1u);
    EXPECT_EQ(ledgerEntries().size(), 1u);
}

TEST_F(PipelineTestBase, InvalidReadingsAreRejectedContract) {
    connector_.readings["DL001"] = reading("DL001", now_, {{Pollutant::PM25, 1500.0}});
    connector_.readings["DL002"] = reading("DL002", now_ - hoursToNanos(3), {{Pollutant::PM25, 40.0}});
    PollingContext polling(config_, connector_, nullptr, history_, *pipeline_);

    auto stats = polling.runCycle(now_);

    EXPECT_EQ(stats.readings_fetched, 2u);
    EXPECT_EQ(stats.readings_rejected, 2u);
    EXPECT_EQ(stats.readings_accepted, 0u);
    EXPECT_EQ(events_.size(), 0u);
    EXPECT_EQ(history_.size("DL001"), 0u);
    EXPECT_TRUE(ledgerEntries().empty());
}

TEST_F(PipelineTestBase, OutlierAgainstNeighborIsQuarantinedContract) {
    // === GIVEN ===
    // DL002 reports a clean reading first; DL001 later reports 7.5x that value
    PollingContext polling(config_, connector_, nullptr, history_, *pipeline_);
    connector_.readings["DL002"] = reading("DL002", now_ - 10 * Common::NANOS_PER_MINUTE, {{Pollutant::PM25, 10.0}});
    auto warmup = polling.runCycle(now_);
    ASSERT_EQ(warmup.readings_accepted, 1u);

    connector_.readings.clear();
    connector_.readings["DL001"] = reading("DL001", now_, {{Pollutant::PM25, 75.0}, {Pollutant::NO2, 40.0}});

    // === WHEN ===
    auto stats = polling.runCycle(now_);

    // === THEN ===
    EXPECT_EQ(stats.pollutants_quarantined, 1u);
    EXPECT_EQ(stats.readings_accepted, 1u);
    EXPECT_EQ(stats.events_stored, 0u) << "Quarantined PM2.5 must not reach classification";

    auto stored = history_.latestReading("DL001", now_ - hoursToNanos(1), now_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->pollutant(Pollutant::PM25).has_value());
    ASSERT_TRUE(stored->pollutant(Pollutant::NO2).has_value());
    EXPECT_DOUBLE_EQ(*stored->pollutant(Pollutant::NO2), 40.0);
}

TEST_F(PipelineTestBase, FullyQuarantinedReadingIsDroppedContract) {
    PollingContext polling(config_, connector_, nullptr, history_, *pipeline_);
    connector_.readings["DL002"] = reading("DL002", now_, {{Pollutant::PM25, 10.0}});
    (void)polling.runCycle(now_);

    connector_.readings.clear();
    connector_.readings["DL001"] = reading("DL001", now_, {{Pollutant::PM25, 75.0}});
    auto stats = polling.runCycle(now_);

    EXPECT_EQ(stats.pollutants_quarantined, 1u);
    EXPECT_EQ(stats.readings_accepted, 0u);
    EXPECT_EQ(history_.size("DL001"), 0u);
}

TEST_F(PipelineTestBase, WeatherFillsMissingMeteorologyContract) {
    // === GIVEN ===
    config_.ingestion.weather_enabled = true;
    FakeWeatherConnector weather;
    Reading r = reading("DL001", now_, {{Pollutant::PM25, 75.0}});
    r.met.set(MetField::TEMPERATURE, 20.0);
    connector_.readings["DL001"] = r;
    PollingContext polling(config_, connector_, &weather, history_, *pipeline_);

    // === WHEN ===
    (void)polling.runCycle(now_);

    // === THEN ===
    auto stored = history_.latestReading("DL001", now_, now_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_DOUBLE_EQ(*stored->met.get(MetField::TEMPERATURE), 20.0) << "Station measurement wins";
    EXPECT_DOUBLE_EQ(*stored->met.get(MetField::WIND_SPEED), 1.5);
    EXPECT_DOUBLE_EQ(*stored->met.get(MetField::HUMIDITY), 88.0);

    auto events = events_.events("DL001");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_DOUBLE_EQ(*events[0].met_context.get(MetField::WIND_SPEED), 1.5);
}

TEST_F(PipelineTestBase, StationWithoutCoordinatesSkipsWeatherContract) {
    config_.ingestion.weather_enabled = true;
    FakeWeatherConnector weather;
    connector_.readings["DL002"] = reading("DL002", now_, {{Pollutant::PM25, 30.0}});
    PollingContext polling(config_, connector_, &weather, history_, *pipeline_);

    (void)polling.runCycle(now_);

    auto stored = history_.latestReading("DL002", now_, now_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->met.get(MetField::WIND_SPEED).has_value());
}

// =============================================================================
// 2. RESULT ARBITRATION
// =============================================================================

TEST_F(PipelineTestBase, PollingSupersedesStreamingForSameInstantContract) {
    // === GIVEN ===
    Windows::WindowResult w;
    w.station_id = "DL001";
    w.pollutant = Pollutant::PM25;
    w.horizon = AveragingPeriod::TWENTY_FOUR_HOUR;
    w.average = 75.0;
    w.count = 3;
    w.as_of = now_;
    w.window_end = now_;
    w.window_start = now_ - hoursToNanos(23);

    auto polled = pipeline_->onWindowResults(EventOrigin::POLLING, "DL001", Pollutant::PM25, {w}, now_);
    ASSERT_EQ(polled.size(), 1u);

    // === WHEN ===
    auto streamed = pipeline_->onWindowResults(EventOrigin::STREAMING, "DL001", Pollutant::PM25, {w}, now_);
    auto older = pipeline_->onWindowResults(EventOrigin::STREAMING, "DL001", Pollutant::PM25, {w},
                                            now_ - Common::NANOS_PER_MINUTE);

    // === THEN ===
    EXPECT_TRUE(streamed.empty());
    EXPECT_TRUE(older.empty());
    auto stats = pipeline_->getStats();
    EXPECT_EQ(stats.results_received, 3u);
    EXPECT_EQ(stats.streaming_superseded, 2u);
    EXPECT_EQ(stats.events_stored, 1u);
    EXPECT_EQ(stats.events_deduplicated, 0u);
}

TEST_F(PipelineTestBase, NewerStreamingResultIsClassifiedContract) {
    Windows::WindowResult w;
    w.station_id = "DL001";
    w.pollutant = Pollutant::PM25;
    w.horizon = AveragingPeriod::TWENTY_FOUR_HOUR;
    w.average = 75.0;
    w.count = 3;
    w.as_of = now_;
    w.window_end = now_;
    w.window_start = now_ - hoursToNanos(23);
    (void)pipeline_->onWindowResults(EventOrigin::POLLING, "DL001", Pollutant::PM25, {w}, now_);

    const EpochNanos later = now_ + Common::NANOS_PER_MINUTE;
    w.as_of = later;
    w.window_end = later;
    auto streamed = pipeline_->onWindowResults(EventOrigin::STREAMING, "DL001", Pollutant::PM25, {w}, later);

    EXPECT_TRUE(streamed.empty()) << "Same breach is already recorded";
    auto stats = pipeline_->getStats();
    EXPECT_EQ(stats.streaming_superseded, 0u);
    EXPECT_EQ(stats.events_deduplicated, 1u);
}

// =============================================================================
// 3. OFFICER ACTIONS
// =============================================================================

TEST_F(PipelineTestBase, OfficerActionIsLedgeredContract) {
    // === GIVEN ===
    connector_.readings["DL001"] = reading("DL001", now_, {{Pollutant::PM25, 75.0}});
    PollingContext polling(config_, connector_, nullptr, history_, *pipeline_);
    (void)polling.runCycle(now_);
    auto stored = events_.events("DL001");
    ASSERT_EQ(stored.size(), 1u);

    // === WHEN ===
    auto action = pipeline_->applyOfficerAction(stored[0].event_id, OfficerActionType::ESCALATE,
                                                "officer-7", "Sustained breach", "Inspect site");

    // === THEN ===
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->event_id, stored[0].event_id);
    EXPECT_EQ(action->officer_id, "officer-7");
    EXPECT_FALSE(action->action_id.empty());

    auto updated = events_.find(stored[0].event_id);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->status, EventStatus::ESCALATED);

    auto entries = ledgerEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].event_type, Ledger::EventType::OFFICER_ACTION);
    EXPECT_EQ(entries[1].event_id, action->action_id);
    EXPECT_EQ(entries[1].prev_hash, entries[0].entry_hash);

    rapidjson::Document doc;
    doc.Parse(entries[1].event_data.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_STREQ(doc["action_type"].GetString(), "ESCALATE");
    EXPECT_STREQ(doc["new_status"].GetString(), "ESCALATED");
    EXPECT_STREQ(doc["compliance_event_id"].GetString(), stored[0].event_id.c_str());

    EXPECT_TRUE(chainIsValid());
    EXPECT_EQ(pipeline_->getStats().officer_actions, 1u);
}

TEST_F(PipelineTestBase, OfficerActionOnUnknownEventIsRefusedContract) {
    auto action = pipeline_->applyOfficerAction("no-such-event", OfficerActionType::DISMISS, "officer-7");

    EXPECT_FALSE(action.has_value());
    EXPECT_TRUE(ledgerEntries().empty());
    EXPECT_EQ(pipeline_->getStats().officer_actions, 0u);
}

// =============================================================================
// 4. LEDGER FAILURE
// =============================================================================

TEST_F(PipelineTestBase, LedgerFailureHaltsPipelineContract) {
    // === GIVEN ===
    RejectingLedgerStore rejecting;
    Ledger::LedgerWriter writer(rejecting);
    CompliancePipeline pipeline(config_, *classifier_, events_, writer);

    Windows::WindowResult w;
    w.station_id = "DL001";
    w.pollutant = Pollutant::PM25;
    w.horizon = AveragingPeriod::TWENTY_FOUR_HOUR;
    w.average = 75.0;
    w.count = 1;
    w.as_of = now_;
    w.window_end = now_;
    w.window_start = now_;

    // === WHEN / THEN ===
    EXPECT_THROW((void)pipeline.onWindowResults(EventOrigin::POLLING, "DL001", Pollutant::PM25, {w}, now_),
                 Ledger::LedgerWriteError);
    EXPECT_TRUE(pipeline.hasFailed());

    w.station_id = "DL002";
    auto after = pipeline.onWindowResults(EventOrigin::POLLING, "DL002", Pollutant::PM25, {w}, now_);
    EXPECT_TRUE(after.empty()) << "A failed pipeline accepts no further results";
    EXPECT_EQ(pipeline.getStats().events_stored, 0u);
}

// =============================================================================
// 5. STREAMING CONTEXT
// =============================================================================

TEST_F(PipelineTestBase, StreamingReadingProducesEventContract) {
    // === GIVEN ===
    StreamingContext streaming(config_, *pipeline_);
    ASSERT_TRUE(streaming.submit(reading("DL001", now_, {{Pollutant::PM25, 75.0}})));

    // === WHEN ===
    const size_t processed = streaming.processPending();

    // === THEN ===
    EXPECT_EQ(processed, 1u);
    EXPECT_EQ(streaming.processedCount(), 1u);
    EXPECT_EQ(streaming.droppedCount(), 0u);

    auto stored = events_.events("DL001");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].origin, EventOrigin::STREAMING);
    EXPECT_EQ(stored[0].tier, Tier::VIOLATION);
    EXPECT_TRUE(chainIsValid());
}

TEST_F(PipelineTestBase, StreamingQueueOverflowDropsReadingsContract) {
    config_.pipeline.stream_queue_size = 4;
    StreamingContext streaming(config_, *pipeline_);

    size_t accepted = 0;
    for (int i = 0; i < 10; ++i) {
        if (streaming.submit(reading("DL001", now_ + i, {{Pollutant::NO2, 20.0}}))) ++accepted;
    }

    EXPECT_EQ(accepted, 4u);
    EXPECT_EQ(streaming.droppedCount(), 6u);
    EXPECT_EQ(streaming.processPending(), 4u);
}

TEST_F(PipelineTestBase, StreamingWorkerDrainsQueueContract) {
    StreamingContext streaming(config_, *pipeline_);
    ASSERT_TRUE(streaming.start());
    EXPECT_TRUE(streaming.isRunning());

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(streaming.submit(reading("DL002", now_ + i * Common::NANOS_PER_SECOND, {{Pollutant::NO2, 20.0}})));
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (streaming.processedCount() < 5 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    streaming.stop();

    EXPECT_EQ(streaming.processedCount(), 5u);
    EXPECT_FALSE(streaming.isRunning());
}

TEST_F(PipelineTestBase, PollingForwardsToRunningStreamingContract) {
    // === GIVEN ===
    StreamingContext streaming(config_, *pipeline_);
    connector_.readings["DL002"] = reading("DL002", now_, {{Pollutant::NO2, 20.0}});
    PollingContext polling(config_, connector_, nullptr, history_, *pipeline_, &streaming);

    // Stopped streaming context receives nothing
    (void)polling.runCycle(now_);
    EXPECT_EQ(streaming.processPending(), 0u);

    // === WHEN ===
    ASSERT_TRUE(streaming.start());
    (void)polling.runCycle(now_);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (streaming.processedCount() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    streaming.stop();

    // === THEN ===
    EXPECT_EQ(streaming.processedCount(), 1u);
    EXPECT_EQ(pipeline_->getStats().streaming_superseded, 1u) << "Polling already covered this instant";
}

// =============================================================================
// 6. PUSH FEED
// =============================================================================

TEST_F(PipelineTestBase, PushMessageParsingContract) {
    // === INPUT SPECIFICATION ===
    // Full message, message without station, and non-JSON text
    const char* full =
        R"({"station_id":"DL001","timestamp":"2024-11-05T10:00:00Z",)"
        R"("pollutants":{"pm25":82.0,"no2":"high"},"met":{"temperature":18.5}})";
    const char* no_station = R"({"timestamp":"2024-11-05T10:00:00Z","pollutants":{"pm25":82.0}})";
    const char* garbage = "not json";

    Reading r;
    ASSERT_TRUE(PushFeedClient::parseMessage(full, std::strlen(full), &r));
    EXPECT_EQ(r.station_id, "DL001");
    ASSERT_TRUE(r.timestamp.has_value());
    EXPECT_EQ(*r.timestamp, 1730800800LL * Common::NANOS_PER_SECOND);
    EXPECT_DOUBLE_EQ(*r.pollutant(Pollutant::PM25), 82.0);
    ASSERT_TRUE(r.pollutant(Pollutant::NO2).has_value()) << "Non-numeric values stay visible to validation";
    EXPECT_TRUE(std::isnan(*r.pollutant(Pollutant::NO2)));
    EXPECT_DOUBLE_EQ(*r.met.get(MetField::TEMPERATURE), 18.5);

    const auto validation = Ingestion::ReadingValidator::validate(r, *r.timestamp);
    EXPECT_FALSE(validation.is_valid);
    bool reported = false;
    for (const auto& reason : validation.reasons) {
        if (reason.rfind("no2=", 0) == 0 && reason.find("is not a valid number") != std::string::npos) {
            reported = true;
        }
    }
    EXPECT_TRUE(reported) << "Validator must name the non-numeric field";

    Reading ignored;
    EXPECT_FALSE(PushFeedClient::parseMessage(no_station, std::strlen(no_station), &ignored));
    EXPECT_FALSE(PushFeedClient::parseMessage(garbage, std::strlen(garbage), &ignored));
}

TEST_F(PipelineTestBase, PushMessageHandlingContract) {
    // === GIVEN ===
    StreamingContext streaming(config_, *pipeline_);
    PushFeedClient client(config_, history_, streaming);
    char ts_buffer[40];
    Common::FastDateTime::formatIso8601(now_, ts_buffer, sizeof(ts_buffer));
    const std::string ts = ts_buffer;

    const std::string known = R"({"station_id":"DL001","timestamp":")" + ts + R"(","pollutants":{"pm25":82.0}})";
    const std::string unknown = R"({"station_id":"XX999","timestamp":")" + ts + R"(","pollutants":{"pm25":82.0}})";
    const std::string invalid = R"({"station_id":"DL002","timestamp":")" + ts + R"(","pollutants":{"pm25":5000.0}})";
    const std::string textual = R"({"station_id":"DL002","timestamp":")" + ts +
                                R"(","pollutants":{"pm25":30.0,"no2":"high"}})";

    // === WHEN ===
    const bool known_ok = client.handleMessage(known.data(), known.size());
    const bool unknown_ok = client.handleMessage(unknown.data(), unknown.size());
    const bool invalid_ok = client.handleMessage(invalid.data(), invalid.size());
    const bool textual_ok = client.handleMessage(textual.data(), textual.size());
    const bool garbage_ok = client.handleMessage("{", 1);

    // === THEN ===
    EXPECT_TRUE(known_ok);
    EXPECT_FALSE(unknown_ok);
    EXPECT_FALSE(invalid_ok);
    EXPECT_FALSE(textual_ok) << "A non-numeric value invalidates the reading";
    EXPECT_FALSE(garbage_ok);
    EXPECT_EQ(client.messagesReceived(), 5u);
    EXPECT_EQ(client.messagesDropped(), 4u);
    EXPECT_EQ(client.pollutantsQuarantined(), 0u);
    EXPECT_EQ(streaming.processPending(), 1u);
    EXPECT_EQ(events_.events("DL001").size(), 1u);
}

TEST_F(PipelineTestBase, PushedOutlierIsQuarantinedContract) {
    // === GIVEN ===
    // DL002 recently reported 50; DL001 pushes 900 for PM2.5 and a plausible NO2
    ASSERT_TRUE(history_.append(reading("DL002", now_ - 10 * Common::NANOS_PER_MINUTE, {{Pollutant::PM25, 50.0}})));
    StreamingContext streaming(config_, *pipeline_);
    PushFeedClient client(config_, history_, streaming);
    char ts_buffer[40];
    Common::FastDateTime::formatIso8601(now_, ts_buffer, sizeof(ts_buffer));
    const std::string ts = ts_buffer;

    const std::string mixed = R"({"station_id":"DL001","timestamp":")" + ts +
                              R"(","pollutants":{"pm25":900.0,"no2":40.0}})";
    const std::string outlier_only = R"({"station_id":"DL001","timestamp":")" + ts +
                                     R"(","pollutants":{"pm25":900.0}})";

    // === WHEN ===
    const bool mixed_ok = client.handleMessage(mixed.data(), mixed.size());
    const bool outlier_ok = client.handleMessage(outlier_only.data(), outlier_only.size());
    const size_t processed = streaming.processPending();

    // === THEN ===
    EXPECT_TRUE(mixed_ok) << "NO2 survives screening";
    EXPECT_FALSE(outlier_ok) << "Nothing is left once PM2.5 is quarantined";
    EXPECT_EQ(client.pollutantsQuarantined(), 2u);
    EXPECT_EQ(client.messagesDropped(), 1u);
    EXPECT_EQ(processed, 1u);

    EXPECT_TRUE(events_.events("DL001").empty()) << "Quarantined PM2.5 must not be classified";
    EXPECT_TRUE(streaming.engine().currentAverages("DL001", Pollutant::PM25, now_).empty());
    auto no2 = streaming.engine().currentAverages("DL001", Pollutant::NO2, now_);
    ASSERT_FALSE(no2.empty());
    EXPECT_DOUBLE_EQ(no2[0].average, 40.0);
    EXPECT_TRUE(ledgerEntries().empty());
}
