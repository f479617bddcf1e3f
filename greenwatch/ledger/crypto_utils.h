#pragma once

#include <string>
#include <string_view>

namespace GreenWatch::Ledger {

/// Lowercase hex SHA-256 of data (64 characters). Empty string if the digest fails.
[[nodiscard]] auto sha256Hex(std::string_view data) noexcept -> std::string;

/// Random RFC 4122 version 4 UUID, e.g. "3f2b8c1e-9d4a-4e7b-a1c2-5e6f7a8b9c0d"
[[nodiscard]] auto generateUuidV4() -> std::string;

} // namespace GreenWatch::Ledger
