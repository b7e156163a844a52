#pragma once

#include "cogmem/core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace cogmem {

// ============================================================================
// Entity Model
// ============================================================================

/// Well-known entity types. The type field stays an open string.
namespace entity_types {
    inline const std::string Food = "food";
    inline const std::string Organization = "organization";
    inline const std::string Person = "person";
    inline const std::string Place = "place";
    inline const std::string Concept = "concept";
    inline const std::string Object = "object";
    inline const std::string Unknown = "unknown";
}

/**
 * @brief Attribute value with the statistics its confidence is derived from
 */
struct AttributeValue {
    std::string value;
    double confidence = 0.0;               ///< Confidence at last_seen (before decay)
    double extraction_confidence = 0.0;    ///< Confidence of the extraction heuristic
    int count = 0;                         ///< Mentions agreeing with this value
    int observations = 0;                  ///< Mentions asserting any value for the key
    Timestamp first_seen = 0;
    Timestamp last_seen = 0;

    nlohmann::json to_json() const;
    static AttributeValue from_json(const nlohmann::json& j);
};

/**
 * @brief Disambiguated "thing" with incrementally grown attributes
 */
struct Entity {
    std::string entity_id;
    std::string user_id;
    std::string canonical_name;            ///< Unique per user
    std::string entity_type = entity_types::Unknown;
    double type_confidence = 0.0;
    std::map<std::string, AttributeValue> attributes;
    std::map<std::string, int> context_profile;  ///< Keyword -> occurrences in past contexts
    Timestamp first_seen = 0;
    Timestamp last_seen = 0;
    int mention_count = 0;

    nlohmann::json to_json() const;
    static Entity from_json(const nlohmann::json& j);
};

/**
 * @brief Co-occurrence edge between two entities of the same user
 */
struct EntityRelationship {
    std::string relation_id;
    std::string user_id;
    std::string source_entity_id;
    std::string target_entity_id;
    std::string relation_type = "co_occurs_with";
    double strength = 0.0;                 ///< 0-1, recency and frequency weighted
    int co_occurrence_count = 0;
    double weighted_count = 0.0;           ///< Decayed occurrence mass behind strength
    Timestamp first_seen = 0;
    Timestamp last_seen = 0;

    nlohmann::json to_json() const;
    static EntityRelationship from_json(const nlohmann::json& j);
};

} // namespace cogmem
