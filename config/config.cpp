#include "config.h"
#include "common/logging.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <set>

namespace GreenWatch {

namespace {

// Config errors surface before logging is up, so they also go to stderr
template<typename... Args>
void configError(const char* format, Args... args) noexcept {
    LOG_ERROR(format, args...);
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
    std::fprintf(stderr, "[config] ");
    std::fprintf(stderr, format, args...);
#pragma GCC diagnostic pop
    std::fprintf(stderr, "\n");
}

auto trim(std::string* s) noexcept -> void {
    const char* ws = " \t\r\n";
    auto first = s->find_first_not_of(ws);
    if (first == std::string::npos) {
        s->clear();
        return;
    }
    auto last = s->find_last_not_of(ws);
    *s = s->substr(first, last - first + 1);
}

/// Reads "[section]" headers; returns false for non-header lines
auto parseSectionHeader(const char* line, std::string* section) noexcept -> bool {
    std::string text(line);
    trim(&text);
    if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
        return false;
    }
    *section = text.substr(1, text.size() - 2);
    trim(section);
    return true;
}

auto isPowerOf2(uint64_t n) noexcept -> bool {
    return n && !(n & (n - 1));
}

/// Quoted text following the opening quote at raw[0]
auto unquote(const std::string& raw, std::string* out) noexcept -> bool {
    if (raw.size() < 2 || raw.front() != '"') return false;
    auto end = raw.find('"', 1);
    if (end == std::string::npos) return false;
    *out = raw.substr(1, end - 1);
    return true;
}

} // namespace

// ============================================================================
// Value extraction
// ============================================================================

auto ConfigLoader::splitKeyValue(const char* line, std::string* key, std::string* raw) noexcept -> bool {
    const char* equals = std::strchr(line, '=');
    if (!equals) {
        return false;
    }
    key->assign(line, static_cast<size_t>(equals - line));
    trim(key);

    raw->assign(equals + 1);
    // Strip a trailing comment that is not inside a quoted string
    bool in_quotes = false;
    for (size_t i = 0; i < raw->size(); ++i) {
        char c = (*raw)[i];
        if (c == '"') in_quotes = !in_quotes;
        if (c == '#' && !in_quotes) {
            raw->resize(i);
            break;
        }
    }
    trim(raw);
    return !key->empty();
}

auto ConfigLoader::extractStringValue(const char* line, const char* key, std::string* value) noexcept -> bool {
    std::string k, raw;
    if (!splitKeyValue(line, &k, &raw) || k != key) {
        return false;
    }
    return unquote(raw, value);
}

auto ConfigLoader::extractIntValue(const char* line, const char* key, int64_t* value) noexcept -> bool {
    std::string k, raw;
    if (!splitKeyValue(line, &k, &raw) || k != key || raw.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0' || errno == ERANGE) {
        return false;
    }
    *value = parsed;
    return true;
}

auto ConfigLoader::extractUintValue(const char* line, const char* key, uint64_t* value) noexcept -> bool {
    int64_t parsed = 0;
    if (!extractIntValue(line, key, &parsed) || parsed < 0) {
        return false;
    }
    *value = static_cast<uint64_t>(parsed);
    return true;
}

auto ConfigLoader::extractDoubleValue(const char* line, const char* key, double* value) noexcept -> bool {
    std::string k, raw;
    if (!splitKeyValue(line, &k, &raw) || k != key || raw.empty()) {
        return false;
    }
    char* end = nullptr;
    double parsed = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str() || *end != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    *value = parsed;
    return true;
}

auto ConfigLoader::extractBoolValue(const char* line, const char* key, bool* value) noexcept -> bool {
    std::string k, raw;
    if (!splitKeyValue(line, &k, &raw) || k != key) {
        return false;
    }
    if (raw == "true") {
        *value = true;
        return true;
    }
    if (raw == "false") {
        *value = false;
        return true;
    }
    return false;
}

auto ConfigLoader::extractStringList(const char* line, const char* key, std::vector<std::string>* values) noexcept -> bool {
    std::string k, raw;
    if (!splitKeyValue(line, &k, &raw) || k != key) {
        return false;
    }
    if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
        return false;
    }
    values->clear();
    size_t pos = 1;
    while (true) {
        auto open = raw.find('"', pos);
        if (open == std::string::npos) break;
        auto close = raw.find('"', open + 1);
        if (close == std::string::npos) return false;
        values->push_back(raw.substr(open + 1, close - open - 1));
        pos = close + 1;
    }
    return true;
}

// ============================================================================
// Main config file
// ============================================================================

auto ConfigLoader::load(const char* config_file, GreenWatchConfig* out) noexcept -> bool {
    GreenWatchConfig config;

    if (!parseMainFile(config_file, &config)) {
        configError("Failed to parse config file: %s", config_file);
        return false;
    }

    if (!loadLimits(config.paths.limits_file.c_str(), &config.limits)) {
        configError("Regulatory limit table unavailable (%s); refusing to start",
                    config.paths.limits_file.c_str());
        return false;
    }

    loadEnvFile(config.paths.env_file.c_str());
    if (const char* token = std::getenv("WAQI_TOKEN")) {
        config.ingestion.waqi_token = token;
    }
    if (const char* key = std::getenv("OPENWEATHER_API_KEY")) {
        config.ingestion.weather_api_key = key;
    }

    if (!validateConfig(&config)) {
        configError("Configuration validation failed for %s", config_file);
        return false;
    }

    *out = std::move(config);
    LOG_INFO("Configuration loaded from %s: %zu stations, %zu zones, %zu limits",
             config_file, out->stations.size(), out->zones.factors.size(), out->limits.limits.size());
    return true;
}

auto ConfigLoader::parseMainFile(const char* filepath, GreenWatchConfig* config) noexcept -> bool {
    FILE* file = std::fopen(filepath, "r");
    if (!file) {
        configError("Cannot open config file: %s", filepath);
        return false;
    }

    char line[1024];
    std::string section;
    StationConfig* station = nullptr;
    bool ok = true;
    int line_no = 0;

    while (std::fgets(line, sizeof(line), file)) {
        ++line_no;
        if (line[0] == '#' || line[0] == '\n' || line[0] == '\r') {
            continue;
        }

        if (parseSectionHeader(line, &section)) {
            station = nullptr;
            if (section.rfind("station.", 0) == 0) {
                StationConfig s;
                s.station_id = section.substr(std::strlen("station."));
                config->stations.push_back(std::move(s));
                station = &config->stations.back();
            }
            continue;
        }

        uint64_t u = 0;
        int64_t i = 0;
        double d = 0.0;

        if (section == "system") {
            extractStringValue(line, "name", &config->system.name);
            extractStringValue(line, "version", &config->system.version);
            extractStringValue(line, "environment", &config->system.environment);
        }
        else if (section == "paths") {
            extractStringValue(line, "logs_dir", &config->paths.logs_dir);
            extractStringValue(line, "data_dir", &config->paths.data_dir);
            extractStringValue(line, "limits_file", &config->paths.limits_file);
            extractStringValue(line, "env_file", &config->paths.env_file);
        }
        else if (section == "logging") {
            std::string level;
            if (extractStringValue(line, "level", &level) &&
                !Common::Logger::parseLevel(level.c_str(), &config->logging.level)) {
                configError("line %d: unknown log level '%s'", line_no, level.c_str());
                ok = false;
            }
        }
        else if (section == "pipeline") {
            if (extractUintValue(line, "poll_interval_seconds", &u)) config->pipeline.poll_interval_seconds = static_cast<uint32_t>(u);
            if (extractUintValue(line, "stream_queue_size", &u)) config->pipeline.stream_queue_size = static_cast<uint32_t>(u);
            if (extractUintValue(line, "dedup_horizon_hours", &u)) config->pipeline.dedup_horizon_hours = static_cast<uint32_t>(u);
            if (extractIntValue(line, "polling_core", &i)) config->pipeline.polling_core = static_cast<int>(i);
            if (extractIntValue(line, "streaming_core", &i)) config->pipeline.streaming_core = static_cast<int>(i);
        }
        else if (section == "ingestion") {
            extractStringValue(line, "waqi_endpoint", &config->ingestion.waqi_endpoint);
            extractStringValue(line, "weather_endpoint", &config->ingestion.weather_endpoint);
            if (extractUintValue(line, "timeout_seconds", &u)) config->ingestion.timeout_seconds = static_cast<uint32_t>(u);
            if (extractUintValue(line, "fetch_retries", &u)) config->ingestion.fetch_retries = static_cast<uint32_t>(u);
            extractBoolValue(line, "weather_enabled", &config->ingestion.weather_enabled);
        }
        else if (section == "streaming") {
            extractBoolValue(line, "enabled", &config->streaming.enabled);
            extractBoolValue(line, "push_feed_enabled", &config->streaming.push_feed_enabled);
            extractStringValue(line, "push_feed_url", &config->streaming.push_feed_url);
            if (extractUintValue(line, "reconnect_interval_ms", &u)) config->streaming.reconnect_interval_ms = static_cast<uint32_t>(u);
        }
        else if (section == "ledger") {
            extractStringValue(line, "path", &config->ledger.path);
        }
        else if (section == "zones") {
            std::string key, raw;
            if (splitKeyValue(line, &key, &raw)) {
                if (extractDoubleValue(line, key.c_str(), &d)) {
                    config->zones.factors[key] = d;
                } else {
                    configError("line %d: zone '%s' needs a numeric factor", line_no, key.c_str());
                    ok = false;
                }
            }
        }
        else if (station) {
            extractStringValue(line, "name", &station->name);
            extractStringValue(line, "waqi_id", &station->waqi_id);
            extractStringValue(line, "zone", &station->zone);
            if (extractDoubleValue(line, "latitude", &d)) station->latitude = d;
            if (extractDoubleValue(line, "longitude", &d)) station->longitude = d;
            extractStringList(line, "neighbors", &station->neighbors);
        }
    }

    std::fclose(file);
    return ok;
}

// ============================================================================
// Regulatory limits file
// ============================================================================

auto ConfigLoader::loadLimits(const char* limits_file, RegulatoryLimitTable* out) noexcept -> bool {
    FILE* file = std::fopen(limits_file, "r");
    if (!file) {
        configError("Cannot open regulatory limits file: %s", limits_file);
        return false;
    }

    RegulatoryLimitTable table;
    char line[1024];
    std::string section;
    std::optional<Pollutant> pollutant;
    // Unit and citation may appear after the limit values within a section
    std::vector<std::pair<Pollutant, AveragingPeriod>> section_keys;
    std::string section_unit;
    std::string section_reference;
    bool ok = true;
    int line_no = 0;

    auto closeSection = [&]() {
        for (const auto& key : section_keys) {
            auto& spec = table.limits[key];
            spec.unit = section_unit.empty()
                ? (key.first == Pollutant::CO ? "mg/m\xC2\xB3" : "\xC2\xB5g/m\xC2\xB3")
                : section_unit;
            spec.legal_reference = section_reference;
        }
        section_keys.clear();
        section_unit.clear();
        section_reference.clear();
    };

    while (std::fgets(line, sizeof(line), file)) {
        ++line_no;
        if (line[0] == '#' || line[0] == '\n' || line[0] == '\r') {
            continue;
        }

        if (parseSectionHeader(line, &section)) {
            closeSection();
            pollutant.reset();
            if (section.rfind("limits.", 0) == 0) {
                pollutant = parsePollutant(section.substr(std::strlen("limits.")));
                if (!pollutant) {
                    configError("%s:%d: unknown pollutant section [%s]", limits_file, line_no, section.c_str());
                    ok = false;
                }
            }
            continue;
        }

        if (section == "rules") {
            extractStringValue(line, "name", &table.name);
            extractStringValue(line, "version", &table.version);
            extractStringValue(line, "legal_reference", &table.legal_reference);
        }
        else if (pollutant) {
            if (extractStringValue(line, "unit", &section_unit)) continue;
            if (extractStringValue(line, "legal_reference", &section_reference)) continue;

            std::string key, raw;
            if (!splitKeyValue(line, &key, &raw)) continue;
            auto period = parsePeriodLabel(key);
            double limit = 0.0;
            if (!period) {
                configError("%s:%d: unknown averaging period '%s'", limits_file, line_no, key.c_str());
                ok = false;
            } else if (!extractDoubleValue(line, key.c_str(), &limit) || limit <= 0.0) {
                configError("%s:%d: limit for %s %s must be a positive number",
                            limits_file, line_no, pollutantKey(*pollutant), key.c_str());
                ok = false;
            } else {
                table.limits[{*pollutant, *period}].limit = limit;
                section_keys.emplace_back(*pollutant, *period);
            }
        }
    }
    closeSection();
    std::fclose(file);

    if (!ok) {
        return false;
    }
    if (table.empty()) {
        configError("Regulatory limits file %s defines no limits", limits_file);
        return false;
    }

    for (auto& [key, spec] : table.limits) {
        if (spec.legal_reference.empty()) {
            spec.legal_reference = table.legal_reference;
        }
    }
    if (table.version.empty()) {
        table.version = table.legal_reference;
    }

    *out = std::move(table);
    LOG_INFO("Loaded %zu regulatory limits (%s) from %s", out->limits.size(), out->version.c_str(), limits_file);
    return true;
}

// ============================================================================
// Environment
// ============================================================================

auto ConfigLoader::loadEnvFile(const char* env_file) noexcept -> void {
    FILE* file = std::fopen(env_file, "r");
    if (!file) {
        LOG_INFO("No env file at %s; using process environment", env_file);
        return;
    }

    char line[1024];
    while (std::fgets(line, sizeof(line), file)) {
        if (line[0] == '#' || line[0] == '\n') continue;

        size_t len = std::strlen(line);
        if (len > 0 && line[len - 1] == '\n') {
            line[len - 1] = '\0';
        }

        char* equals = std::strchr(line, '=');
        if (equals) {
            *equals = '\0';
            // Values already present in the environment win
            setenv(line, equals + 1, 0);
            LOG_INFO("Loaded env var: %s", line);
        }
    }
    std::fclose(file);
}

// ============================================================================
// Validation
// ============================================================================

auto ConfigLoader::validateConfig(GreenWatchConfig* config) noexcept -> bool {
    if (config->paths.logs_dir.empty()) {
        configError("logs_dir not configured");
        return false;
    }
    if (config->paths.data_dir.empty()) {
        configError("data_dir not configured");
        return false;
    }
    if (config->pipeline.poll_interval_seconds == 0) {
        configError("poll_interval_seconds must be positive");
        return false;
    }
    if (!isPowerOf2(config->pipeline.stream_queue_size)) {
        configError("stream_queue_size must be power of 2");
        return false;
    }
    if (config->pipeline.dedup_horizon_hours == 0) {
        configError("dedup_horizon_hours must be positive");
        return false;
    }
    if (config->streaming.push_feed_enabled && config->streaming.push_feed_url.empty()) {
        configError("push_feed_enabled requires push_feed_url");
        return false;
    }

    for (const auto& [zone, factor] : config->zones.factors) {
        if (!(factor > 0.0)) {
            configError("Zone %s has non-positive adjustment factor %.3f", zone.c_str(), factor);
            return false;
        }
    }

    std::set<std::string> ids;
    for (const auto& station : config->stations) {
        if (station.station_id.empty()) {
            configError("Station section without an id");
            return false;
        }
        if (!ids.insert(station.station_id).second) {
            configError("Duplicate station %s", station.station_id.c_str());
            return false;
        }
        if (station.waqi_id.empty()) {
            LOG_WARN("Station %s has no waqi_id and will not be polled", station.station_id.c_str());
        }
        if (config->zones.factors.find(station.zone) == config->zones.factors.end()) {
            LOG_WARN("Station %s zone '%s' not configured; factor %.1f applies",
                     station.station_id.c_str(), station.zone.c_str(), ZoneTable::DEFAULT_FACTOR);
        }
    }
    for (const auto& station : config->stations) {
        for (const auto& neighbor : station.neighbors) {
            if (!ids.count(neighbor) || neighbor == station.station_id) {
                configError("Station %s lists invalid neighbor %s", station.station_id.c_str(), neighbor.c_str());
                return false;
            }
        }
    }

    for (const auto* dir : {&config->paths.logs_dir, &config->paths.data_dir}) {
        std::error_code ec;
        std::filesystem::create_directories(*dir, ec);
        if (ec) {
            LOG_WARN("Could not create directory %s: %s", dir->c_str(), ec.message().c_str());
        }
    }

    return true;
}

auto ConfigLoader::printConfig(const GreenWatchConfig& config) noexcept -> void {
    LOG_INFO("=== GreenWatch Configuration ===");
    LOG_INFO("System: %s v%s (%s)", config.system.name.c_str(), config.system.version.c_str(),
             config.system.environment.c_str());
    LOG_INFO("Paths:");
    LOG_INFO("  Logs: %s", config.paths.logs_dir.c_str());
    LOG_INFO("  Data: %s", config.paths.data_dir.c_str());
    LOG_INFO("  Limits: %s", config.paths.limits_file.c_str());
    LOG_INFO("Pipeline:");
    LOG_INFO("  Poll interval: %us", config.pipeline.poll_interval_seconds);
    LOG_INFO("  Stream queue: %u", config.pipeline.stream_queue_size);
    LOG_INFO("  Dedup horizon: %uh", config.pipeline.dedup_horizon_hours);
    LOG_INFO("Ingestion:");
    LOG_INFO("  WAQI: %s (token %s)", config.ingestion.waqi_endpoint.c_str(),
             config.ingestion.waqi_token.empty() ? "missing" : "set");
    LOG_INFO("  Weather: %s", config.ingestion.weather_enabled ? "Enabled" : "Disabled");
    LOG_INFO("Streaming: %s, push feed %s", config.streaming.enabled ? "Enabled" : "Disabled",
             config.streaming.push_feed_enabled ? config.streaming.push_feed_url.c_str() : "disabled");
    LOG_INFO("Ledger: %s", config.ledger.path.c_str());
    LOG_INFO("Rules: %s (%zu limits)", config.limits.version.c_str(), config.limits.limits.size());
    for (const auto& [zone, factor] : config.zones.factors) {
        LOG_INFO("  Zone %s factor %.3f", zone.c_str(), factor);
    }
    for (const auto& station : config.stations) {
        LOG_INFO("  Station %s (%s) zone=%s neighbors=%zu", station.station_id.c_str(),
                 station.name.c_str(), station.zone.c_str(), station.neighbors.size());
    }
    LOG_INFO("================================");
}

} // namespace GreenWatch
