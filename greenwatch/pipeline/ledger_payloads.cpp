#include "ledger_payloads.h"
#include "common/time_utils.h"

#include <cmath>
#include <string>

namespace GreenWatch::Pipeline {

namespace {

using Alloc = rapidjson::Document::AllocatorType;

auto str(const std::string& s, Alloc& alloc) -> rapidjson::Value {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

auto str(const char* s, Alloc& alloc) -> rapidjson::Value {
    return rapidjson::Value(s, alloc);
}

auto isoTime(EpochNanos ts, Alloc& alloc) -> rapidjson::Value {
    char buf[48];
    Common::FastDateTime::formatIso8601(ts, buf, sizeof(buf));
    return rapidjson::Value(buf, alloc);
}

/// JSON has no encoding for non-finite numbers
auto num(double v) -> rapidjson::Value {
    rapidjson::Value out;
    if (std::isfinite(v)) out.SetDouble(v);
    return out;
}

} // namespace

auto complianceEventPayload(const Classification::ClassificationEvent& event, Alloc& alloc) -> rapidjson::Value {
    const auto& rule = event.rule_result;

    rapidjson::Value met(rapidjson::kObjectType);
    for (auto f : ALL_MET_FIELDS) {
        if (const auto& v = event.met_context.get(f)) {
            met.AddMember(str(metFieldKey(f), alloc), num(*v), alloc);
        }
    }

    rapidjson::Value out(rapidjson::kObjectType);
    out.AddMember("compliance_event_id", str(event.event_id, alloc), alloc);
    out.AddMember("station_id", str(event.station_id, alloc), alloc);
    out.AddMember("pollutant", str(pollutantKey(event.pollutant), alloc), alloc);
    out.AddMember("tier", str(Classification::tierName(event.tier), alloc), alloc);
    out.AddMember("status", str(Classification::statusName(event.status), alloc), alloc);
    out.AddMember("origin", str(Classification::originName(event.origin), alloc), alloc);
    out.AddMember("averaging_period", str(rule.periodLabel(), alloc), alloc);
    out.AddMember("observed_value", num(rule.observed_value), alloc);
    out.AddMember("limit_value", num(rule.limit_value), alloc);
    out.AddMember("exceedance_value", num(rule.exceedance_value), alloc);
    out.AddMember("exceedance_percent", num(rule.exceedance_percent), alloc);
    out.AddMember("rule_name", str(rule.rule_name, alloc), alloc);
    out.AddMember("legal_reference", str(rule.legal_reference, alloc), alloc);
    out.AddMember("rule_version", str(rule.rule_version, alloc), alloc);
    out.AddMember("window_hours", event.windowHours(), alloc);
    out.AddMember("window_start", isoTime(event.window_start, alloc), alloc);
    out.AddMember("window_end", isoTime(event.window_end, alloc), alloc);
    out.AddMember("met_context", met, alloc);
    out.AddMember("is_consecutive_day_breach", event.is_consecutive_day_breach, alloc);
    out.AddMember("created_at", isoTime(event.created_at, alloc), alloc);
    return out;
}

auto officerActionPayload(const Classification::OfficerAction& action, Classification::EventStatus new_status,
                          Alloc& alloc) -> rapidjson::Value {
    rapidjson::Value out(rapidjson::kObjectType);
    out.AddMember("action_id", str(action.action_id, alloc), alloc);
    out.AddMember("compliance_event_id", str(action.event_id, alloc), alloc);
    out.AddMember("action_type", str(Classification::actionName(action.action), alloc), alloc);
    out.AddMember("officer_id", str(action.officer_id, alloc), alloc);
    out.AddMember("reason", str(action.reason, alloc), alloc);
    out.AddMember("notes", str(action.notes, alloc), alloc);
    out.AddMember("new_status", str(Classification::statusName(new_status), alloc), alloc);
    out.AddMember("created_at", isoTime(action.created_at, alloc), alloc);
    return out;
}

} // namespace GreenWatch::Pipeline
