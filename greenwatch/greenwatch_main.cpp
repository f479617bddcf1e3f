// ============================================================================
// greenwatch_main.cpp - Environmental Compliance Monitoring Service
// ============================================================================

#include "common/logging.h"
#include "common/time_utils.h"

#include "config/config.h"
#include "greenwatch/classification/event_store.h"
#include "greenwatch/classification/tier_classifier.h"
#include "greenwatch/ingestion/http_client.h"
#include "greenwatch/ingestion/waqi_connector.h"
#include "greenwatch/ingestion/weather_connector.h"
#include "greenwatch/ledger/ledger_store.h"
#include "greenwatch/ledger/ledger_verifier.h"
#include "greenwatch/ledger/ledger_writer.h"
#include "greenwatch/pipeline/compliance_pipeline.h"
#include "greenwatch/pipeline/polling_context.h"
#include "greenwatch/pipeline/push_feed_client.h"
#include "greenwatch/pipeline/streaming_context.h"
#include "greenwatch/rules/rule_engine.h"
#include "greenwatch/windows/reading_history.h"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {

constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_LEDGER_INVALID = 2;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown.store(true);
    }
}

void displayBanner() {
    printf("\n");
    printf("=======================================================\n");
    printf("     GREENWATCH - Environmental Compliance Monitor     \n");
    printf("=======================================================\n");
    printf("Build:   %s %s\n", __DATE__, __TIME__);
    printf("=======================================================\n\n");
}

void printUsage(const char* prog) {
    printf("Usage: %s [--config <path>] [--verify-ledger]\n", prog);
    printf("  --config <path>    configuration file (default config/greenwatch.toml)\n");
    printf("  --verify-ledger    verify the audit ledger hash chain and exit\n");
}

void printVerification(const GreenWatch::Ledger::ChainVerification& result) {
    printf("\n[AUDIT LEDGER]\n");
    printf("---------------------\n");
    printf("Entries:     %lu\n", static_cast<unsigned long>(result.total_entries));
    printf("Valid:       %s\n", result.is_valid ? "yes" : "NO");
    if (!result.is_valid) {
        printf("Failure:     %s\n", GreenWatch::Ledger::chainFailureName(result.failure));
        if (result.broken_at_sequence) {
            printf("Broken at:   seq %lu\n", static_cast<unsigned long>(*result.broken_at_sequence));
        }
        if (result.error_message) {
            printf("Cause:       %s\n", result.error_message->c_str());
        }
    }
    printf("---------------------\n\n");
}

} // namespace

int main(int argc, char* argv[]) {
    const char* config_file = "config/greenwatch.toml";
    bool verify_only = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verify-ledger") == 0) {
            verify_only = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            printUsage(argv[0]);
            return EXIT_CONFIG_ERROR;
        }
    }

    displayBanner();

    // Configuration first; it names the log directory
    GreenWatch::GreenWatchConfig config;
    if (!GreenWatch::ConfigLoader::load(config_file, &config)) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_file);
        return EXIT_CONFIG_ERROR;
    }

    char stamp[32];
    Common::FastDateTime::formatFileStamp(stamp, sizeof(stamp));
    char log_file[512];
    snprintf(log_file, sizeof(log_file), "%s/greenwatch_%s.log", config.paths.logs_dir.c_str(), stamp);

    Common::initLogging(log_file);
    Common::Logger::setMinLevel(config.logging.level);

    LOG_INFO("========================================");
    LOG_INFO("GREENWATCH STARTING");
    LOG_INFO("========================================");
    LOG_INFO("Version: %s (%s)", config.system.version.c_str(), config.system.environment.c_str());
    LOG_INFO("Build: %s %s", __DATE__, __TIME__);
    LOG_INFO("PID: %d", getpid());
    GreenWatch::ConfigLoader::printConfig(config);

    // Audit ledger
    GreenWatch::Ledger::FileLedgerStore ledger_store(config.ledger.path);
    if (!ledger_store.open()) {
        fprintf(stderr, "Failed to open audit ledger %s\n", config.ledger.path.c_str());
        Common::shutdownLogging();
        return EXIT_CONFIG_ERROR;
    }

    const auto verification = GreenWatch::Ledger::LedgerVerifier(ledger_store).verifyChain();
    printVerification(verification);
    if (verify_only) {
        Common::shutdownLogging();
        return verification.is_valid ? 0 : EXIT_LEDGER_INVALID;
    }
    if (!verification.is_valid) {
        LOG_ERROR("Audit ledger failed verification at startup; continuing, chain is not repaired");
    }

    const GreenWatch::Rules::RuleEngine rules(config.limits);
    if (!rules.isLoaded()) {
        LOG_FATAL("No regulatory limits loaded");
        fprintf(stderr, "No regulatory limits loaded\n");
        Common::shutdownLogging();
        return EXIT_CONFIG_ERROR;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    LOG_INFO("Signal handlers installed");

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exit_code = 0;
    {
        GreenWatch::Ingestion::CurlHttpClient http(config.ingestion.timeout_seconds);
        GreenWatch::Ingestion::WaqiConnector waqi(http, config.ingestion.waqi_endpoint,
                                                  config.ingestion.waqi_token, config.ingestion.fetch_retries);
        GreenWatch::Ingestion::WeatherConnector weather(http, config.ingestion.weather_endpoint,
                                                        config.ingestion.weather_api_key,
                                                        config.ingestion.fetch_retries);

        GreenWatch::Windows::InMemoryReadingHistory history;
        GreenWatch::Classification::InMemoryEventStore events(
            Common::hoursToNanos(config.pipeline.dedup_horizon_hours));
        GreenWatch::Ledger::LedgerWriter ledger(ledger_store);
        const GreenWatch::Classification::TierClassifier classifier(rules, config.zones);
        GreenWatch::Pipeline::CompliancePipeline pipeline(config, classifier, events, ledger);

        std::unique_ptr<GreenWatch::Pipeline::StreamingContext> streaming;
        std::unique_ptr<GreenWatch::Pipeline::PushFeedClient> push_feed;
        if (config.streaming.enabled) {
            streaming = std::make_unique<GreenWatch::Pipeline::StreamingContext>(config, pipeline);
            streaming->start();
            if (config.streaming.push_feed_enabled) {
                push_feed = std::make_unique<GreenWatch::Pipeline::PushFeedClient>(config, history, *streaming);
                if (!push_feed->init() || !push_feed->start()) {
                    LOG_ERROR("Push feed unavailable; continuing with polling only");
                    push_feed.reset();
                }
            }
        }

        GreenWatch::Pipeline::PollingContext polling(config, waqi,
                                                     config.ingestion.weather_enabled ? &weather : nullptr,
                                                     history, pipeline, streaming.get());
        polling.start();

        printf("[SYSTEM] Monitoring %zu stations, polling every %us\n", config.stations.size(),
               config.pipeline.poll_interval_seconds);
        printf("[SYSTEM] Press Ctrl+C to shutdown\n\n");

        auto last_status = std::chrono::steady_clock::now();
        while (!g_shutdown.load() && !pipeline.hasFailed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

            const auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::seconds(60)) {
                const auto stats = pipeline.getStats();
                const auto log_stats = Common::Logger::getStats();
                LOG_INFO("Status: results=%lu stored=%lu deduplicated=%lu superseded=%lu actions=%lu log_dropped=%lu",
                         static_cast<unsigned long>(stats.results_received),
                         static_cast<unsigned long>(stats.events_stored),
                         static_cast<unsigned long>(stats.events_deduplicated),
                         static_cast<unsigned long>(stats.streaming_superseded),
                         static_cast<unsigned long>(stats.officer_actions),
                         static_cast<unsigned long>(log_stats.messages_dropped));
                last_status = now;
            }
        }

        if (pipeline.hasFailed()) {
            LOG_FATAL("Audit ledger write failed; stopping");
            fprintf(stderr, "[FATAL] Audit ledger write failed; see %s\n", log_file);
            exit_code = EXIT_CONFIG_ERROR;
        }

        printf("\n[SYSTEM] Shutting down...\n");
        polling.stop();
        if (push_feed) push_feed->stop();
        if (streaming) streaming->stop();
        ledger_store.close();
    }

    curl_global_cleanup();

    LOG_INFO("========================================");
    LOG_INFO("GREENWATCH STOPPED");
    LOG_INFO("========================================");
    Common::shutdownLogging();

    printf("[SYSTEM] Shutdown complete\n");
    printf("Log file: %s\n\n", log_file);
    return exit_code;
}
