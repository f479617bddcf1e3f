#pragma once

#include "common/time_utils.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace GreenWatch::Ledger {

namespace EventType {
constexpr const char* COMPLIANCE_EVENT = "COMPLIANCE_EVENT";
constexpr const char* OFFICER_ACTION = "OFFICER_ACTION";
constexpr const char* REPORT_GENERATED = "REPORT_GENERATED";
} // namespace EventType

constexpr size_t HASH_HEX_LENGTH = 64;

/// prev_hash of the first entry
inline const std::string GENESIS_PREV_HASH(HASH_HEX_LENGTH, '0');

/// One immutable audit ledger row.
/// entry_hash = SHA-256(event_data + prev_hash), event_data being canonical JSON text.
struct LedgerEntry {
    std::string id;
    uint64_t sequence_number{0};
    std::string event_type;
    std::string event_id;
    std::string event_data;
    std::string prev_hash;
    std::string entry_hash;
    Common::EpochNanos created_at{0};
};

/// Highest sequence number in a store and its hash
struct LedgerTail {
    uint64_t sequence_number{0};
    std::string entry_hash;
};

/// Raised when an append cannot be made durable. Never retried by the writer.
class LedgerWriteError : public std::runtime_error {
public:
    explicit LedgerWriteError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace GreenWatch::Ledger
