#include "ledger_writer.h"
#include "common/logging.h"
#include "common/time_utils.h"
#include "greenwatch/ledger/canonical_json.h"
#include "greenwatch/ledger/crypto_utils.h"

namespace GreenWatch::Ledger {

std::mutex LedgerWriter::append_mutex_;

auto LedgerWriter::computeHash(const std::string& canonical_event_data,
                               const std::string& prev_hash) noexcept -> std::string {
    std::string payload;
    payload.reserve(canonical_event_data.size() + prev_hash.size());
    payload.append(canonical_event_data);
    payload.append(prev_hash);
    return sha256Hex(payload);
}

auto LedgerWriter::append(const std::string& event_type, const std::string& event_id,
                          const rapidjson::Value& event_data) -> LedgerEntry {
    LedgerEntry entry;
    entry.id = generateUuidV4();
    entry.event_type = event_type;
    entry.event_id = event_id;
    entry.event_data = toCanonicalJson(event_data);

    std::lock_guard<std::mutex> lock(append_mutex_);

    const auto tail = store_.tail();
    if (tail) {
        entry.sequence_number = tail->sequence_number + 1;
        entry.prev_hash = tail->entry_hash;
    } else {
        entry.sequence_number = 1;
        entry.prev_hash = GENESIS_PREV_HASH;
    }

    entry.entry_hash = computeHash(entry.event_data, entry.prev_hash);
    if (UNLIKELY(entry.entry_hash.size() != HASH_HEX_LENGTH)) {
        LOG_ERROR("Failed to hash audit ledger entry seq=%lu", static_cast<unsigned long>(entry.sequence_number));
        throw LedgerWriteError("Audit ledger write failed: hash computation failed");
    }
    entry.created_at = Common::getWallClockNanos();

    if (!store_.insert(entry)) {
        LOG_ERROR("Failed to append audit ledger entry seq=%lu type=%s id=%s",
                  static_cast<unsigned long>(entry.sequence_number), event_type.c_str(), event_id.c_str());
        throw LedgerWriteError("Audit ledger write failed at seq " + std::to_string(entry.sequence_number));
    }

    LOG_INFO("Audit ledger entry appended: seq=%lu type=%s id=%s hash=%.16s...",
             static_cast<unsigned long>(entry.sequence_number), event_type.c_str(), event_id.c_str(),
             entry.entry_hash.c_str());
    return entry;
}

} // namespace GreenWatch::Ledger
