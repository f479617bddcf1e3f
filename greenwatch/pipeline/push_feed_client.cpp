#include "push_feed_client.h"
#include "common/logging.h"
#include "common/thread_utils.h"
#include "common/time_utils.h"
#include "greenwatch/ingestion/reading_validator.h"
#include "greenwatch/pipeline/neighbor_screening.h"
#include "greenwatch/pipeline/streaming_context.h"

#include <rapidjson/document.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <limits>
#include <optional>

namespace GreenWatch::Pipeline {

// ============================================================================
// WebSocket Protocol Configuration
// ============================================================================

static struct lws_protocols protocols[] = {
    {
        "greenwatch-feed",
        PushFeedClient::wsCallback,
        0,
        65536,  // rx buffer size
        0, nullptr, 0
    },
    { nullptr, nullptr, 0, 0, 0, nullptr, 0 }  // terminator
};

PushFeedClient::PushFeedClient(const GreenWatchConfig& config, const Windows::IReadingHistory& history,
                               StreamingContext& streaming)
    : config_(config), history_(history), streaming_(streaming) {}

PushFeedClient::~PushFeedClient() {
    stop();
    if (ws_context_) {
        lws_context_destroy(ws_context_);
        ws_context_ = nullptr;
    }
}

// ============================================================================
// Message decoding
// ============================================================================

namespace {

/// null is absent; any other non-number is carried as NaN for the validator to report
auto numericValue(const rapidjson::Value& v) -> std::optional<double> {
    if (v.IsNull()) return std::nullopt;
    if (v.IsNumber()) return v.GetDouble();
    return std::numeric_limits<double>::quiet_NaN();
}

} // namespace

auto PushFeedClient::parseMessage(const char* data, size_t len, Reading* out) -> bool {
    rapidjson::Document doc;
    doc.Parse(data, len);
    if (doc.HasParseError() || !doc.IsObject()) return false;

    if (!doc.HasMember("station_id") || !doc["station_id"].IsString()) return false;

    Reading reading;
    reading.station_id = doc["station_id"].GetString();

    if (doc.HasMember("timestamp") && doc["timestamp"].IsString()) {
        EpochNanos ts = 0;
        if (!Common::parseIso8601(doc["timestamp"].GetString(), &ts)) return false;
        reading.timestamp = ts;
    }

    if (doc.HasMember("pollutants") && doc["pollutants"].IsObject()) {
        const auto& pollutants = doc["pollutants"];
        for (auto p : ALL_POLLUTANTS) {
            const char* key = pollutantKey(p);
            if (pollutants.HasMember(key)) {
                if (auto v = numericValue(pollutants[key])) reading.setPollutant(p, *v);
            }
        }
    }

    if (doc.HasMember("met") && doc["met"].IsObject()) {
        const auto& met = doc["met"];
        for (auto f : ALL_MET_FIELDS) {
            const char* key = metFieldKey(f);
            if (met.HasMember(key)) {
                if (auto v = numericValue(met[key])) reading.met.set(f, *v);
            }
        }
    }

    reading.source.station_name = reading.station_id;
    *out = std::move(reading);
    return true;
}

auto PushFeedClient::handleMessage(const char* data, size_t len) -> bool {
    messages_received_.fetch_add(1, std::memory_order_relaxed);

    Reading reading;
    if (!parseMessage(data, len, &reading)) {
        messages_dropped_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Push feed: malformed message (%zu bytes) dropped", len);
        return false;
    }
    const auto* station = config_.findStation(reading.station_id);
    if (!station) {
        messages_dropped_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Push feed: reading for unknown station %s dropped", reading.station_id.c_str());
        return false;
    }
    if (!Ingestion::ReadingValidator::validate(reading, Common::getWallClockNanos()).is_valid) {
        messages_dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    auto screened = screenAgainstNeighbors(reading, *station, history_);
    pollutants_quarantined_.fetch_add(screened.quarantined, std::memory_order_relaxed);
    reading = std::move(screened.accepted);
    if (!reading.hasAnyPollutant()) {
        messages_dropped_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN("Push feed: every pollutant of station %s quarantined; reading dropped",
                 reading.station_id.c_str());
        return false;
    }
    if (!streaming_.submit(std::move(reading))) {
        messages_dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

auto PushFeedClient::init() -> bool {
    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));

    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = this;

    ws_context_ = lws_create_context(&info);
    if (!ws_context_) {
        LOG_ERROR("Failed to create WebSocket context");
        return false;
    }

    LOG_INFO("Push feed client initialized: url=%s", config_.streaming.push_feed_url.c_str());
    return true;
}

auto PushFeedClient::start() -> bool {
    if (running_.load(std::memory_order_acquire)) {
        LOG_WARN("Push feed client already running");
        return true;
    }
    if (!ws_context_) {
        LOG_ERROR("Push feed client started before init()");
        return false;
    }
    running_.store(true, std::memory_order_release);
    ws_thread_ = Common::createAndStartThread(-1, "gw-push-feed", [this]() { wsThreadFunc(); });
    return true;
}

auto PushFeedClient::stop() -> void {
    running_.store(false, std::memory_order_release);
    if (ws_context_) {
        lws_cancel_service(ws_context_);
    }
    if (ws_thread_.joinable()) {
        ws_thread_.join();
        LOG_INFO("Push feed client stopped: received=%lu, dropped=%lu, reconnects=%lu",
                 static_cast<unsigned long>(messages_received_.load()),
                 static_cast<unsigned long>(messages_dropped_.load()),
                 static_cast<unsigned long>(reconnect_count_.load()));
    }
}

auto PushFeedClient::connect() -> void {
    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));

    const char* url = config_.streaming.push_feed_url.c_str();
    const bool use_ssl = std::strncmp(url, "wss://", 6) == 0;
    const char* rest = url + (use_ssl ? 6 : (std::strncmp(url, "ws://", 5) == 0 ? 5 : 0));

    char address[256] = {0};
    char path[256] = "/";
    int port = use_ssl ? 443 : 80;

    if (sscanf(rest, "%255[^:/]:%d%255s", address, &port, path) < 2) {
        sscanf(rest, "%255[^/]%255s", address, path);
    }

    ccinfo.context = ws_context_;
    ccinfo.address = address;
    ccinfo.port = port;
    ccinfo.path = path;
    ccinfo.host = address;
    ccinfo.origin = address;
    ccinfo.protocol = protocols[0].name;
    ccinfo.ssl_connection = use_ssl ? LCCSCF_USE_SSL : 0;
    ccinfo.userdata = this;

    auto* conn = lws_client_connect_via_info(&ccinfo);
    if (!conn) {
        LOG_ERROR("Failed to connect to push feed %s:%d%s", address, port, path);
        return;
    }
    ws_connection_.store(conn, std::memory_order_release);
    LOG_INFO("Push feed connection initiated: %s:%d%s", address, port, path);
}

auto PushFeedClient::wsThreadFunc() -> void {
    LOG_INFO("Push feed thread started");

    // Past time so the first connection is attempted immediately
    auto last_attempt = std::chrono::steady_clock::now() -
                        std::chrono::milliseconds(config_.streaming.reconnect_interval_ms * 2);

    while (running_.load(std::memory_order_acquire)) {
        if (!connected_.load(std::memory_order_acquire) && !ws_connection_.load(std::memory_order_acquire)) {
            const auto now = std::chrono::steady_clock::now();
            const auto elapsed_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - last_attempt).count();
            if (static_cast<uint32_t>(elapsed_ms) >= config_.streaming.reconnect_interval_ms) {
                connect();
                last_attempt = now;
            }
        }
        lws_service(ws_context_, 50);
    }

    LOG_INFO("Push feed thread stopped");
}

// ============================================================================
// Callback
// ============================================================================

auto PushFeedClient::wsCallback(struct lws* wsi, enum lws_callback_reasons reason,
                                void* /* user */, void* in, size_t len) -> int {
    auto* client = static_cast<PushFeedClient*>(lws_context_user(lws_get_context(wsi)));
    if (!client) return 0;

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        LOG_INFO("Push feed connected");
        client->connected_.store(true, std::memory_order_release);
        client->rx_buffer_.clear();
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE:
        if (in && len > 0) {
            if (client->rx_buffer_.size() + len > MAX_MESSAGE_BYTES) {
                LOG_WARN("Push feed message exceeds %zu bytes; discarded", MAX_MESSAGE_BYTES);
                client->rx_buffer_.clear();
                client->messages_dropped_.fetch_add(1, std::memory_order_relaxed);
                break;
            }
            client->rx_buffer_.append(static_cast<const char*>(in), len);
            if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
                client->handleMessage(client->rx_buffer_.data(), client->rx_buffer_.size());
                client->rx_buffer_.clear();
            }
        }
        break;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        LOG_ERROR("Push feed connection error: %s - will reconnect", in ? static_cast<const char*>(in) : "unknown");
        client->connected_.store(false, std::memory_order_release);
        client->ws_connection_.store(nullptr, std::memory_order_release);
        client->reconnect_count_.fetch_add(1, std::memory_order_relaxed);
        return -1;

    case LWS_CALLBACK_CLIENT_CLOSED:
        LOG_INFO("Push feed disconnected - will reconnect");
        client->connected_.store(false, std::memory_order_release);
        client->ws_connection_.store(nullptr, std::memory_order_release);
        client->reconnect_count_.fetch_add(1, std::memory_order_relaxed);
        return -1;

    default:
        break;
    }

    return 0;
}

} // namespace GreenWatch::Pipeline
