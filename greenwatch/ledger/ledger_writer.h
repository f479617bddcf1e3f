#pragma once

#include "common/macros.h"
#include "greenwatch/ledger/ledger_entry.h"
#include "greenwatch/ledger/ledger_store.h"

#include <rapidjson/document.h>

#include <mutex>
#include <string>

namespace GreenWatch::Ledger {

/**
 * Appends hash-chained entries to a ledger store.
 *
 * Read-tail, hash and insert run under one process-wide lock so sequence numbers
 * are allocated strictly in order. A failed insert throws LedgerWriteError;
 * nothing is retried.
 */
class LedgerWriter {
public:
    explicit LedgerWriter(ILedgerStore& store) noexcept : store_(store) {}
    DELETE_COPY_AND_MOVE(LedgerWriter);

    /// Throws LedgerWriteError when the entry cannot be stored
    auto append(const std::string& event_type, const std::string& event_id,
                const rapidjson::Value& event_data) -> LedgerEntry;

    /// SHA-256 of canonical event data followed by prev_hash
    [[nodiscard]] static auto computeHash(const std::string& canonical_event_data,
                                          const std::string& prev_hash) noexcept -> std::string;

private:
    ILedgerStore& store_;

    // Shared by every writer in the process
    static std::mutex append_mutex_;
};

} // namespace GreenWatch::Ledger
