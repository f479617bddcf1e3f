#include "streaming_context.h"
#include "common/logging.h"
#include "common/thread_utils.h"

#include <chrono>

namespace GreenWatch::Pipeline {

StreamingContext::StreamingContext(const GreenWatchConfig& config, CompliancePipeline& pipeline)
    : config_(config),
      pipeline_(pipeline),
      queue_(config.pipeline.stream_queue_size),
      engine_([this](const std::string& station_id, Pollutant pollutant,
                     const std::vector<Windows::WindowResult>& results) {
          onWindowChange(station_id, pollutant, results);
      }) {}

StreamingContext::~StreamingContext() {
    stop();
}

auto StreamingContext::start() -> bool {
    if (running_.load(std::memory_order_acquire)) {
        LOG_WARN("Streaming context already running");
        return true;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(true, std::memory_order_release);
    worker_ = Common::createAndStartThread(config_.pipeline.streaming_core, "gw-streaming", [this]() { run(); });
    LOG_INFO("Streaming context started: queue capacity=%zu", queue_.capacity());
    return true;
}

auto StreamingContext::stop() -> void {
    running_.store(false, std::memory_order_release);
    if (!worker_.joinable()) {
        return;
    }
    worker_.join();
    LOG_INFO("Streaming context stopped: processed=%lu, dropped=%lu",
             static_cast<unsigned long>(processed_.load()), static_cast<unsigned long>(dropped_.load()));
}

auto StreamingContext::submit(Reading reading) -> bool {
    if (!queue_.enqueue(std::move(reading))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Streaming queue full; reading dropped");
        return false;
    }
    return true;
}

auto StreamingContext::onWindowChange(const std::string& station_id, Pollutant pollutant,
                                      const std::vector<Windows::WindowResult>& results) -> void {
    if (results.empty()) return;
    pipeline_.onWindowResults(Classification::EventOrigin::STREAMING, station_id, pollutant, results,
                              results.front().as_of);
}

auto StreamingContext::processPending() -> size_t {
    size_t n = 0;
    Reading reading;
    while (queue_.dequeue(reading)) {
        engine_.update(reading);
        processed_.fetch_add(1, std::memory_order_relaxed);
        ++n;
    }
    return n;
}

auto StreamingContext::run() -> void {
    LOG_INFO("Streaming worker started");
    while (running_.load(std::memory_order_acquire)) {
        try {
            if (processPending() == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        } catch (const Ledger::LedgerWriteError& e) {
            LOG_FATAL("Streaming worker stopping after ledger failure: %s", e.what());
            running_.store(false, std::memory_order_release);
        }
    }
    LOG_INFO("Streaming worker stopped");
}

} // namespace GreenWatch::Pipeline
