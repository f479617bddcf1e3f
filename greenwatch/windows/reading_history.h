#pragma once

#include "greenwatch/types.h"
#include "common/macros.h"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace GreenWatch::Windows {

/// Durable, append-only log of accepted readings. Both window strategies derive from it.
class IReadingHistory {
public:
    virtual ~IReadingHistory() = default;

    /// False when the store rejected the write
    [[nodiscard]] virtual auto append(const Reading& reading) -> bool = 0;

    /// Readings of station with from_exclusive < timestamp <= to_inclusive, oldest first
    [[nodiscard]] virtual auto readingsBetween(const std::string& station_id, EpochNanos from_exclusive,
                                               EpochNanos to_inclusive) const -> std::vector<Reading> = 0;

    /// Newest reading of station with timestamp in [not_before, not_after]
    [[nodiscard]] virtual auto latestReading(const std::string& station_id, EpochNanos not_before,
                                             EpochNanos not_after) const -> std::optional<Reading> = 0;
};

/// Process-local history keyed by station; readings older than the retention span
/// (relative to the station's newest reading) are pruned on append.
class InMemoryReadingHistory final : public IReadingHistory {
public:
    static constexpr EpochNanos DEFAULT_RETENTION_NS = Common::hoursToNanos(48);

    explicit InMemoryReadingHistory(EpochNanos retention_ns = DEFAULT_RETENTION_NS);

    DELETE_COPY_AND_MOVE(InMemoryReadingHistory);

    [[nodiscard]] auto append(const Reading& reading) -> bool override;
    [[nodiscard]] auto readingsBetween(const std::string& station_id, EpochNanos from_exclusive,
                                       EpochNanos to_inclusive) const -> std::vector<Reading> override;
    [[nodiscard]] auto latestReading(const std::string& station_id, EpochNanos not_before,
                                     EpochNanos not_after) const -> std::optional<Reading> override;

    [[nodiscard]] auto size(const std::string& station_id) const -> size_t;

private:
    const EpochNanos retention_ns_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::multimap<EpochNanos, Reading>> by_station_;
};

} // namespace GreenWatch::Windows
