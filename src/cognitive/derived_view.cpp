#include "cogmem/cognitive/derived_view.hpp"
#include "cogmem/core/errors.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace cogmem {

DerivedView DerivedView::create(
    const std::string& user_id,
    const std::string& hypothesis,
    const std::string& view_type,
    const std::string& subject,
    const std::string& action,
    std::vector<std::string> derived_from,
    double confidence,
    Timestamp now,
    int ttl_days
) {
    if (user_id.empty()) {
        throw ValidationError("view user_id is empty");
    }
    if (trim(hypothesis).empty()) {
        throw ValidationError("view hypothesis is empty");
    }
    if (derived_from.empty()) {
        throw ValidationError("view '" + hypothesis + "' has no supporting evidence");
    }
    if (std::isnan(confidence) || confidence < 0.0 || confidence > 1.0) {
        throw ValidationError("view confidence " + std::to_string(confidence) +
                              " outside [0, 1]");
    }

    // Deduplicate evidence while keeping first-seen order
    std::vector<std::string> unique_ids;
    unique_ids.reserve(derived_from.size());
    for (auto& id : derived_from) {
        if (std::find(unique_ids.begin(), unique_ids.end(), id) == unique_ids.end()) {
            unique_ids.push_back(std::move(id));
        }
    }

    DerivedView view;
    view.view_id = generate_id("view");
    view.user_id = user_id;
    view.hypothesis = hypothesis;
    view.view_type = view_type;
    view.subject = subject;
    view.action = action;
    view.derived_from = std::move(unique_ids);
    view.confidence = confidence;
    view.validation_count = static_cast<int>(view.derived_from.size());
    view.created_at = now;
    view.expires_at = now + days(ttl_days);
    view.updated_at = now;
    view.status = ViewStatus::Active;
    return view;
}

double DerivedView::counter_ratio() const {
    if (derived_from.empty()) return 0.0;
    return static_cast<double>(counter_evidence.size()) /
           static_cast<double>(derived_from.size());
}

std::string DerivedView::subject_key() const {
    return view_type + ":" + action + ":" + subject;
}

bool DerivedView::has_evidence(const std::string& event_id) const {
    return std::find(derived_from.begin(), derived_from.end(), event_id) != derived_from.end() ||
           std::find(counter_evidence.begin(), counter_evidence.end(), event_id) != counter_evidence.end();
}

json DerivedView::to_json() const {
    json j;
    j["view_id"] = view_id;
    j["user_id"] = user_id;
    j["hypothesis"] = hypothesis;
    j["view_type"] = view_type;
    j["subject"] = subject;
    j["action"] = action;
    j["context_tag"] = context_tag;
    j["derived_from"] = derived_from;
    j["counter_evidence"] = counter_evidence;
    j["confidence"] = confidence;
    j["validation_count"] = validation_count;
    j["created_at"] = to_iso8601(created_at);
    j["expires_at"] = to_iso8601(expires_at);
    j["updated_at"] = to_iso8601(updated_at);
    j["status"] = view_status_to_string(status);
    j["source"] = source;
    j["revision"] = revision;
    return j;
}

DerivedView DerivedView::from_json(const json& j) {
    DerivedView view;
    view.view_id = j.value("view_id", "");
    view.user_id = j.value("user_id", "");
    view.hypothesis = j.value("hypothesis", "");
    view.view_type = j.value("view_type", view_types::Pattern);
    view.subject = j.value("subject", "");
    view.action = j.value("action", "");
    view.context_tag = j.value("context_tag", "");
    view.derived_from = j.value("derived_from", std::vector<std::string>{});
    view.counter_evidence = j.value("counter_evidence", std::vector<std::string>{});
    view.confidence = j.value("confidence", 0.0);
    view.validation_count = j.value("validation_count", 0);
    view.created_at = from_iso8601(j.at("created_at").get<std::string>());
    view.expires_at = from_iso8601(j.at("expires_at").get<std::string>());
    view.updated_at = j.contains("updated_at")
        ? from_iso8601(j["updated_at"].get<std::string>()) : view.created_at;
    view.status = string_to_view_status(j.value("status", "active"));
    view.source = j.value("source", "detector");
    view.revision = j.value("revision", 0);
    return view;
}

} // namespace cogmem
