#pragma once

#include "common/macros.h"
#include "config/config.h"
#include "greenwatch/windows/reading_history.h"

#include <libwebsockets.h>

#include <atomic>
#include <string>
#include <thread>

namespace GreenWatch::Pipeline {

class StreamingContext;

/**
 * WebSocket client for a push telemetry feed.
 *
 * Each text message is one reading:
 *   {"station_id":"DL001","timestamp":"2024-11-05T10:00:00Z",
 *    "pollutants":{"pm25":82.0,...},"met":{"temperature":18.5,...}}
 *
 * Messages for configured stations that pass validation are cross-checked against the
 * neighbours' latest readings in the history; what survives quarantine is submitted to the
 * streaming context. A non-numeric value marks the message invalid.
 * The connection is re-established every reconnect_interval_ms while running.
 */
class PushFeedClient {
public:
    PushFeedClient(const GreenWatchConfig& config, const Windows::IReadingHistory& history,
                   StreamingContext& streaming);
    ~PushFeedClient();
    DELETE_COPY_AND_MOVE(PushFeedClient);

    [[nodiscard]] auto init() -> bool;
    auto start() -> bool;
    auto stop() -> void;

    /// Decodes one feed message. False for malformed messages.
    /// Values that are present but not numbers decode as NaN so validation rejects them.
    [[nodiscard]] static auto parseMessage(const char* data, size_t len, Reading* out) -> bool;

    /// Validates and forwards one decoded message; false when it was dropped
    auto handleMessage(const char* data, size_t len) -> bool;

    [[nodiscard]] auto messagesReceived() const noexcept -> uint64_t { return messages_received_.load(); }
    [[nodiscard]] auto messagesDropped() const noexcept -> uint64_t { return messages_dropped_.load(); }
    [[nodiscard]] auto pollutantsQuarantined() const noexcept -> uint64_t { return pollutants_quarantined_.load(); }

    static auto wsCallback(struct lws* wsi, enum lws_callback_reasons reason,
                           void* user, void* in, size_t len) -> int;

private:
    auto wsThreadFunc() -> void;
    auto connect() -> void;

    static constexpr size_t MAX_MESSAGE_BYTES = 64 * 1024;

    const GreenWatchConfig& config_;
    const Windows::IReadingHistory& history_;
    StreamingContext& streaming_;

    struct lws_context* ws_context_{nullptr};
    std::atomic<struct lws*> ws_connection_{nullptr};
    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread ws_thread_;

    // Reassembly of fragmented frames; touched only on the service thread
    std::string rx_buffer_;

    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> messages_dropped_{0};
    std::atomic<uint64_t> pollutants_quarantined_{0};
    std::atomic<uint64_t> reconnect_count_{0};
};

} // namespace GreenWatch::Pipeline
