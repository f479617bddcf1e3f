#include "reading_history.h"
#include "common/logging.h"

#include <mutex>

namespace GreenWatch::Windows {

InMemoryReadingHistory::InMemoryReadingHistory(EpochNanos retention_ns)
    : retention_ns_(retention_ns),
      mutex_(),
      by_station_() {}

auto InMemoryReadingHistory::append(const Reading& reading) -> bool {
    if (!reading.timestamp || reading.station_id.empty()) {
        LOG_ERROR("ReadingHistory: refusing reading without station or timestamp");
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& series = by_station_[reading.station_id];
    series.emplace(*reading.timestamp, reading);

    const EpochNanos horizon = series.rbegin()->first - retention_ns_;
    series.erase(series.begin(), series.upper_bound(horizon));
    return true;
}

auto InMemoryReadingHistory::readingsBetween(const std::string& station_id, EpochNanos from_exclusive,
                                             EpochNanos to_inclusive) const -> std::vector<Reading> {
    std::vector<Reading> out;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_station_.find(station_id);
    if (it == by_station_.end()) {
        return out;
    }
    const auto& series = it->second;
    for (auto r = series.upper_bound(from_exclusive); r != series.end() && r->first <= to_inclusive; ++r) {
        out.push_back(r->second);
    }
    return out;
}

auto InMemoryReadingHistory::latestReading(const std::string& station_id, EpochNanos not_before,
                                           EpochNanos not_after) const -> std::optional<Reading> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_station_.find(station_id);
    if (it == by_station_.end()) {
        return std::nullopt;
    }
    const auto& series = it->second;
    auto r = series.upper_bound(not_after);
    if (r == series.begin()) {
        return std::nullopt;
    }
    --r;
    if (r->first < not_before) {
        return std::nullopt;
    }
    return r->second;
}

auto InMemoryReadingHistory::size(const std::string& station_id) const -> size_t {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_station_.find(station_id);
    return it == by_station_.end() ? 0 : it->second.size();
}

} // namespace GreenWatch::Windows
