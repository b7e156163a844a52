#include "cogmem/cognitive/stable_concept.hpp"

using json = nlohmann::json;

namespace cogmem {

json StableConcept::to_json() const {
    json j;
    j["concept_id"] = concept_id;
    j["user_id"] = user_id;
    j["name"] = name;
    j["display_name"] = display_name;
    j["concept_type"] = concept_type;
    j["description"] = description;
    j["definition"] = definition;
    j["version"] = version;
    j["parent_concept_id"] = parent_concept_id ? json(*parent_concept_id) : json(nullptr);
    j["deprecated"] = deprecated;
    j["superseded_by"] = superseded_by ? json(*superseded_by) : json(nullptr);
    j["deprecated_at"] = deprecated_at ? json(to_iso8601(*deprecated_at)) : json(nullptr);
    j["deprecation_reason"] = deprecation_reason;
    j["derived_from_views"] = derived_from_views;
    j["promotion_confidence"] = promotion_confidence;
    j["created_at"] = to_iso8601(created_at);
    return j;
}

StableConcept StableConcept::from_json(const json& j) {
    StableConcept c;
    c.concept_id = j.value("concept_id", "");
    c.user_id = j.value("user_id", "");
    c.name = j.value("name", "");
    c.display_name = j.value("display_name", "");
    c.concept_type = j.value("concept_type", "");
    c.description = j.value("description", "");
    c.definition = j.value("definition", json::object());
    c.version = j.value("version", 1);
    if (j.contains("parent_concept_id") && !j["parent_concept_id"].is_null()) {
        c.parent_concept_id = j["parent_concept_id"].get<std::string>();
    }
    c.deprecated = j.value("deprecated", false);
    if (j.contains("superseded_by") && !j["superseded_by"].is_null()) {
        c.superseded_by = j["superseded_by"].get<std::string>();
    }
    if (j.contains("deprecated_at") && !j["deprecated_at"].is_null()) {
        c.deprecated_at = from_iso8601(j["deprecated_at"].get<std::string>());
    }
    c.deprecation_reason = j.value("deprecation_reason", "");
    c.derived_from_views = j.value("derived_from_views", std::vector<std::string>{});
    c.promotion_confidence = j.value("promotion_confidence", 0.0);
    c.created_at = from_iso8601(j.at("created_at").get<std::string>());
    return c;
}

} // namespace cogmem
