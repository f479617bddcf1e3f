#pragma once

#include "greenwatch/classification/compliance_event.h"

#include <rapidjson/document.h>

namespace GreenWatch::Pipeline {

/// Ledger event_data for a persisted compliance event
[[nodiscard]] auto complianceEventPayload(const Classification::ClassificationEvent& event,
                                          rapidjson::Document::AllocatorType& alloc) -> rapidjson::Value;

/// Ledger event_data for an officer action and the status it produced
[[nodiscard]] auto officerActionPayload(const Classification::OfficerAction& action,
                                        Classification::EventStatus new_status,
                                        rapidjson::Document::AllocatorType& alloc) -> rapidjson::Value;

} // namespace GreenWatch::Pipeline
