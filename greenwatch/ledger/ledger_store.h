#pragma once

#include "common/macros.h"
#include "greenwatch/ledger/ledger_entry.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace GreenWatch::Ledger {

/// Append-only storage for ledger entries. Stores expose no update or delete.
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /// Absent for an empty store
    [[nodiscard]] virtual auto tail() const -> std::optional<LedgerTail> = 0;

    /// False when the entry could not be made durable
    [[nodiscard]] virtual auto insert(const LedgerEntry& entry) -> bool = 0;

    /// Every entry ordered by sequence number. False when storage cannot be read.
    [[nodiscard]] virtual auto readAll(std::vector<LedgerEntry>* out) const -> bool = 0;
};

class InMemoryLedgerStore final : public ILedgerStore {
public:
    InMemoryLedgerStore() = default;
    DELETE_COPY_AND_MOVE(InMemoryLedgerStore);

    [[nodiscard]] auto tail() const -> std::optional<LedgerTail> override;
    [[nodiscard]] auto insert(const LedgerEntry& entry) -> bool override;
    [[nodiscard]] auto readAll(std::vector<LedgerEntry>* out) const -> bool override;

    [[nodiscard]] auto size() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::vector<LedgerEntry> entries_;
};

/**
 * Newline-delimited JSON file, one entry per line.
 *
 * The file is opened O_APPEND and every insert is fsync'd before it returns.
 * The tail is recovered from the file on open().
 */
class FileLedgerStore final : public ILedgerStore {
public:
    explicit FileLedgerStore(std::string path);
    ~FileLedgerStore() override;
    DELETE_COPY_AND_MOVE(FileLedgerStore);

    /// Creates the file if missing. False if it cannot be opened or its last entry is unreadable.
    [[nodiscard]] auto open() -> bool;
    auto close() noexcept -> void;

    [[nodiscard]] auto tail() const -> std::optional<LedgerTail> override;
    [[nodiscard]] auto insert(const LedgerEntry& entry) -> bool override;
    [[nodiscard]] auto readAll(std::vector<LedgerEntry>* out) const -> bool override;

    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

    [[nodiscard]] static auto encodeLine(const LedgerEntry& entry) -> std::string;
    [[nodiscard]] static auto decodeLine(const std::string& line, LedgerEntry* out) -> bool;

private:
    const std::string path_;
    int fd_{-1};

    mutable std::mutex mutex_;
    std::optional<LedgerTail> tail_;
};

} // namespace GreenWatch::Ledger
