#include "cogmem/event/event.hpp"
#include "cogmem/core/errors.hpp"
#include "cogmem/core/text_utils.hpp"
#include <cmath>

using json = nlohmann::json;

namespace cogmem {

// ============================================================================
// RawInput
// ============================================================================

json RawInput::to_json() const {
    json j;
    j["raw_id"] = raw_id;
    j["user_id"] = user_id;
    j["content"] = content;
    j["context"] = context;
    j["received_at"] = to_iso8601(received_at);
    j["event_count"] = event_count;
    return j;
}

RawInput RawInput::from_json(const json& j) {
    RawInput raw;
    raw.raw_id = j.value("raw_id", "");
    raw.user_id = j.value("user_id", "");
    raw.content = j.value("content", "");
    raw.context = j.value("context", "");
    raw.received_at = from_iso8601(j.at("received_at").get<std::string>());
    raw.event_count = j.value("event_count", 0);
    return raw;
}

// ============================================================================
// Event
// ============================================================================

void Event::validate() const {
    if (user_id.empty()) {
        throw ValidationError("event user_id is empty");
    }
    if (timestamp == 0) {
        throw ValidationError("event timestamp is required");
    }
    if (trim(action).empty()) {
        throw ValidationError("event action is empty");
    }
    if (trim(target).empty()) {
        throw ValidationError("event target is empty");
    }
    if (std::isnan(confidence) || confidence < 0.0 || confidence > 1.0) {
        throw ValidationError("event confidence " + std::to_string(confidence) +
                              " outside [0, 1]");
    }
    if (quantity && !(*quantity > 0.0)) {
        throw ValidationError("event quantity must be positive, got " +
                              std::to_string(*quantity));
    }
    if (unit && !quantity) {
        throw ValidationError("event unit '" + *unit + "' given without a quantity");
    }
}

json Event::to_json() const {
    json j;
    j["event_id"] = event_id;
    j["user_id"] = user_id;
    j["timestamp"] = to_iso8601(timestamp);
    j["actor"] = actor;
    j["action"] = action;
    j["target"] = target;
    j["quantity"] = quantity ? json(*quantity) : json(nullptr);
    j["unit"] = unit ? json(*unit) : json(nullptr);
    j["confidence"] = confidence;
    j["source_reference"] = source_reference;
    j["extractor"] = extractor;
    return j;
}

Event Event::from_json(const json& j) {
    Event event;
    event.event_id = j.value("event_id", "");
    event.user_id = j.value("user_id", "");
    event.timestamp = from_iso8601(j.at("timestamp").get<std::string>());
    event.actor = j.value("actor", "user");
    event.action = j.value("action", "");
    event.target = j.value("target", "");
    if (j.contains("quantity") && !j["quantity"].is_null()) {
        event.quantity = j["quantity"].get<double>();
    }
    if (j.contains("unit") && !j["unit"].is_null()) {
        event.unit = j["unit"].get<std::string>();
    }
    event.confidence = j.value("confidence", 0.0);
    event.source_reference = j.value("source_reference", "");
    event.extractor = j.value("extractor", "");
    return event;
}

bool Event::operator==(const Event& other) const {
    return event_id == other.event_id &&
           user_id == other.user_id &&
           timestamp == other.timestamp &&
           actor == other.actor &&
           action == other.action &&
           target == other.target &&
           quantity == other.quantity &&
           unit == other.unit &&
           confidence == other.confidence &&
           source_reference == other.source_reference &&
           extractor == other.extractor;
}

// ============================================================================
// Data tiers
// ============================================================================

DataTier tier_of(const Event& event, Timestamp now) {
    double age_days = days_between(event.timestamp, now);
    if (age_days < 90.0) return DataTier::Hot;
    if (age_days < 730.0) return DataTier::Warm;
    return DataTier::Cold;
}

std::string data_tier_to_string(DataTier tier) {
    switch (tier) {
        case DataTier::Hot: return "hot";
        case DataTier::Warm: return "warm";
        case DataTier::Cold: return "cold";
        default: return "hot";
    }
}

} // namespace cogmem
