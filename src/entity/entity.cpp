#include "cogmem/entity/entity.hpp"

using json = nlohmann::json;

namespace cogmem {

json AttributeValue::to_json() const {
    return {
        {"value", value},
        {"confidence", confidence},
        {"extraction_confidence", extraction_confidence},
        {"count", count},
        {"observations", observations},
        {"first_seen", to_iso8601(first_seen)},
        {"last_seen", to_iso8601(last_seen)}
    };
}

AttributeValue AttributeValue::from_json(const json& j) {
    AttributeValue attr;
    attr.value = j.value("value", "");
    attr.confidence = j.value("confidence", 0.0);
    attr.extraction_confidence = j.value("extraction_confidence", 0.0);
    attr.count = j.value("count", 0);
    attr.observations = j.value("observations", 0);
    attr.first_seen = from_iso8601(j.at("first_seen").get<std::string>());
    attr.last_seen = from_iso8601(j.at("last_seen").get<std::string>());
    return attr;
}

json Entity::to_json() const {
    json j;
    j["entity_id"] = entity_id;
    j["user_id"] = user_id;
    j["canonical_name"] = canonical_name;
    j["entity_type"] = entity_type;
    j["type_confidence"] = type_confidence;

    json attrs = json::object();
    for (const auto& [key, attr] : attributes) {
        attrs[key] = attr.to_json();
    }
    j["attributes"] = attrs;
    j["context_profile"] = context_profile;
    j["first_seen"] = to_iso8601(first_seen);
    j["last_seen"] = to_iso8601(last_seen);
    j["mention_count"] = mention_count;
    return j;
}

Entity Entity::from_json(const json& j) {
    Entity entity;
    entity.entity_id = j.value("entity_id", "");
    entity.user_id = j.value("user_id", "");
    entity.canonical_name = j.value("canonical_name", "");
    entity.entity_type = j.value("entity_type", entity_types::Unknown);
    entity.type_confidence = j.value("type_confidence", 0.0);

    if (j.contains("attributes")) {
        for (auto it = j["attributes"].begin(); it != j["attributes"].end(); ++it) {
            entity.attributes[it.key()] = AttributeValue::from_json(it.value());
        }
    }
    if (j.contains("context_profile")) {
        entity.context_profile = j["context_profile"].get<std::map<std::string, int>>();
    }
    entity.first_seen = from_iso8601(j.at("first_seen").get<std::string>());
    entity.last_seen = from_iso8601(j.at("last_seen").get<std::string>());
    entity.mention_count = j.value("mention_count", 0);
    return entity;
}

json EntityRelationship::to_json() const {
    return {
        {"relation_id", relation_id},
        {"user_id", user_id},
        {"source_entity_id", source_entity_id},
        {"target_entity_id", target_entity_id},
        {"relation_type", relation_type},
        {"strength", strength},
        {"co_occurrence_count", co_occurrence_count},
        {"weighted_count", weighted_count},
        {"first_seen", to_iso8601(first_seen)},
        {"last_seen", to_iso8601(last_seen)}
    };
}

EntityRelationship EntityRelationship::from_json(const json& j) {
    EntityRelationship rel;
    rel.relation_id = j.value("relation_id", "");
    rel.user_id = j.value("user_id", "");
    rel.source_entity_id = j.value("source_entity_id", "");
    rel.target_entity_id = j.value("target_entity_id", "");
    rel.relation_type = j.value("relation_type", "co_occurs_with");
    rel.strength = j.value("strength", 0.0);
    rel.co_occurrence_count = j.value("co_occurrence_count", 0);
    rel.weighted_count = j.value("weighted_count", 0.0);
    rel.first_seen = from_iso8601(j.at("first_seen").get<std::string>());
    rel.last_seen = from_iso8601(j.at("last_seen").get<std::string>());
    return rel;
}

} // namespace cogmem
