#include "ledger_verifier.h"
#include "common/logging.h"
#include "greenwatch/ledger/canonical_json.h"
#include "greenwatch/ledger/ledger_writer.h"

#include <cstdio>
#include <vector>

namespace GreenWatch::Ledger {

namespace {

auto fail(ChainVerification* result, ChainFailure failure, uint64_t sequence, const char* message) -> void {
    result->is_valid = false;
    result->failure = failure;
    result->broken_at_sequence = sequence;
    result->error_message = message;
}

} // namespace

auto LedgerVerifier::verifyChain() const -> ChainVerification {
    ChainVerification result;

    std::vector<LedgerEntry> entries;
    if (!store_.readAll(&entries)) {
        result.is_valid = false;
        result.failure = ChainFailure::BROKEN_CHAIN;
        result.error_message = "Ledger storage could not be read";
        LOG_ERROR("Chain integrity violation: %s", result.error_message->c_str());
        return result;
    }

    if (entries.empty()) {
        LOG_INFO("Audit ledger is empty; chain trivially valid");
        return result;
    }

    char message[256];
    std::string expected_prev = GENESIS_PREV_HASH;
    uint64_t expected_sequence = entries.front().sequence_number;

    for (const auto& entry : entries) {
        ++result.total_entries;
        const auto seq = static_cast<unsigned long>(entry.sequence_number);

        if (entry.sequence_number != expected_sequence) {
            snprintf(message, sizeof(message), "Sequence gap: expected %lu, got %lu",
                     static_cast<unsigned long>(expected_sequence), seq);
            fail(&result, ChainFailure::SEQUENCE_GAP, entry.sequence_number, message);
            LOG_ERROR("Chain integrity violation: %s", message);
            return result;
        }

        if (entry.prev_hash != expected_prev) {
            snprintf(message, sizeof(message), "prev_hash mismatch at seq %lu: expected %.16s..., got %.16s...",
                     seq, expected_prev.c_str(), entry.prev_hash.c_str());
            fail(&result, ChainFailure::BROKEN_CHAIN, entry.sequence_number, message);
            LOG_ERROR("Chain integrity violation: %s", message);
            return result;
        }

        std::string canonical;
        if (!canonicalize(entry.event_data, &canonical)) {
            snprintf(message, sizeof(message), "entry_hash mismatch at seq %lu: stored payload is not valid JSON", seq);
            fail(&result, ChainFailure::TAMPERED_ENTRY, entry.sequence_number, message);
            LOG_ERROR("Chain integrity violation (TAMPERED ENTRY): %s", message);
            return result;
        }

        const std::string computed = LedgerWriter::computeHash(canonical, entry.prev_hash);
        if (computed != entry.entry_hash) {
            snprintf(message, sizeof(message), "entry_hash mismatch at seq %lu: computed %.16s..., stored %.16s...",
                     seq, computed.c_str(), entry.entry_hash.c_str());
            fail(&result, ChainFailure::TAMPERED_ENTRY, entry.sequence_number, message);
            LOG_ERROR("Chain integrity violation (TAMPERED ENTRY): %s", message);
            return result;
        }

        expected_prev = entry.entry_hash;
        ++expected_sequence;
    }

    LOG_INFO("Audit ledger chain verified: %lu entries all valid", static_cast<unsigned long>(result.total_entries));
    return result;
}

} // namespace GreenWatch::Ledger
