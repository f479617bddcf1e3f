#include "canonical_json.h"

#include <algorithm>
#include <cstring>
#include <vector>

namespace GreenWatch::Ledger {

namespace {

auto keyLess(const rapidjson::Value::ConstMemberIterator& a,
             const rapidjson::Value::ConstMemberIterator& b) noexcept -> bool {
    const auto a_len = a->name.GetStringLength();
    const auto b_len = b->name.GetStringLength();
    const int cmp = std::memcmp(a->name.GetString(), b->name.GetString(), std::min(a_len, b_len));
    return cmp != 0 ? cmp < 0 : a_len < b_len;
}

} // namespace

auto writeCanonical(const rapidjson::Value& value, rapidjson::Writer<rapidjson::StringBuffer>& writer) -> void {
    if (value.IsObject()) {
        std::vector<rapidjson::Value::ConstMemberIterator> members;
        members.reserve(value.MemberCount());
        for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
            members.push_back(it);
        }
        std::sort(members.begin(), members.end(), keyLess);

        writer.StartObject();
        for (const auto& m : members) {
            writer.Key(m->name.GetString(), m->name.GetStringLength());
            writeCanonical(m->value, writer);
        }
        writer.EndObject();
        return;
    }

    if (value.IsArray()) {
        writer.StartArray();
        for (const auto& element : value.GetArray()) {
            writeCanonical(element, writer);
        }
        writer.EndArray();
        return;
    }

    // Scalars are written as rapidjson writes them
    value.Accept(writer);
}

auto toCanonicalJson(const rapidjson::Value& value) -> std::string {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writeCanonical(value, writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

auto canonicalize(std::string_view json, std::string* out) -> bool {
    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseFullPrecisionFlag>(json.data(), json.size());
    if (doc.HasParseError()) {
        return false;
    }
    *out = toCanonicalJson(doc);
    return true;
}

} // namespace GreenWatch::Ledger
