#pragma once

#include "common/lf_queue.h"
#include "common/macros.h"
#include "config/config.h"
#include "greenwatch/pipeline/compliance_pipeline.h"
#include "greenwatch/windows/incremental_window_engine.h"

#include <atomic>
#include <thread>

namespace GreenWatch::Pipeline {

/**
 * Reactive execution context.
 *
 * Readings arrive on a lock-free MPMC queue (from the polling context and the push feed).
 * A single worker thread drains it into an IncrementalWindowEngine whose change callback
 * forwards every key's updated windows to the compliance pipeline.
 * Readings on the queue must already be validated.
 */
class StreamingContext {
public:
    StreamingContext(const GreenWatchConfig& config, CompliancePipeline& pipeline);
    ~StreamingContext();
    DELETE_COPY_AND_MOVE(StreamingContext);

    auto start() -> bool;
    auto stop() -> void;

    /// Non-blocking; false (and the reading is dropped) when the queue is full
    [[nodiscard]] auto submit(Reading reading) -> bool;

    /// Drains the queue on the calling thread; for use while the worker is not running
    auto processPending() -> size_t;

    [[nodiscard]] auto isRunning() const noexcept -> bool { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] auto engine() noexcept -> Windows::IncrementalWindowEngine& { return engine_; }
    [[nodiscard]] auto processedCount() const noexcept -> uint64_t { return processed_.load(std::memory_order_relaxed); }
    [[nodiscard]] auto droppedCount() const noexcept -> uint64_t { return dropped_.load(std::memory_order_relaxed); }

private:
    auto run() -> void;
    auto onWindowChange(const std::string& station_id, Pollutant pollutant,
                        const std::vector<Windows::WindowResult>& results) -> void;

    const GreenWatchConfig& config_;
    CompliancePipeline& pipeline_;
    Common::MPMCLFQueue<Reading> queue_;
    Windows::IncrementalWindowEngine engine_;

    std::atomic<bool> running_{false};
    std::thread worker_;

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace GreenWatch::Pipeline
