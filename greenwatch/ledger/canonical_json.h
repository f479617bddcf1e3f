#pragma once

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <string_view>

namespace GreenWatch::Ledger {

/// Compact JSON with object members ordered by key bytes at every depth.
/// The same logical document always yields the same text.
auto writeCanonical(const rapidjson::Value& value, rapidjson::Writer<rapidjson::StringBuffer>& writer) -> void;

[[nodiscard]] auto toCanonicalJson(const rapidjson::Value& value) -> std::string;

/// Re-parses json and writes its canonical form to out. False if json is not valid JSON.
[[nodiscard]] auto canonicalize(std::string_view json, std::string* out) -> bool;

} // namespace GreenWatch::Ledger
