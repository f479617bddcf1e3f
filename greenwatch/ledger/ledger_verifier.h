#pragma once

#include "greenwatch/ledger/ledger_store.h"

#include <cstdint>
#include <optional>
#include <string>

namespace GreenWatch::Ledger {

enum class ChainFailure : uint8_t {
    NONE = 0,
    SEQUENCE_GAP = 1,
    BROKEN_CHAIN = 2,     // prev_hash does not match the preceding entry_hash
    TAMPERED_ENTRY = 3    // stored payload no longer hashes to entry_hash
};

constexpr auto chainFailureName(ChainFailure failure) noexcept -> const char* {
    switch (failure) {
        case ChainFailure::NONE:           return "NONE";
        case ChainFailure::SEQUENCE_GAP:   return "SEQUENCE_GAP";
        case ChainFailure::BROKEN_CHAIN:   return "BROKEN_CHAIN";
        case ChainFailure::TAMPERED_ENTRY: return "TAMPERED_ENTRY";
    }
    return "UNKNOWN";
}

struct ChainVerification {
    bool is_valid{true};
    uint64_t total_entries{0};
    std::optional<uint64_t> broken_at_sequence;
    std::optional<std::string> error_message;
    ChainFailure failure{ChainFailure::NONE};
};

/// Walks the whole ledger in sequence order and stops at the first integrity failure.
/// Reports only; never repairs.
class LedgerVerifier {
public:
    explicit LedgerVerifier(const ILedgerStore& store) noexcept : store_(store) {}

    [[nodiscard]] auto verifyChain() const -> ChainVerification;

private:
    const ILedgerStore& store_;
};

} // namespace GreenWatch::Ledger
