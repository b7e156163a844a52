#pragma once

#include "cogmem/core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

/**
 * @brief Versioned knowledge that survived the Promotion Gate
 *
 * Rows are never deleted. A newer version deprecates the older one and
 * points back to it through parent_concept_id.
 */
struct StableConcept {
    std::string concept_id;
    std::string user_id;
    std::string name;                      ///< Canonical name, shared by all versions
    std::string display_name;
    std::string concept_type;
    std::string description;
    nlohmann::json definition = nlohmann::json::object();
    int version = 1;
    std::optional<std::string> parent_concept_id;
    bool deprecated = false;
    std::optional<std::string> superseded_by;
    std::optional<Timestamp> deprecated_at;
    std::string deprecation_reason;
    std::vector<std::string> derived_from_views;
    double promotion_confidence = 0.0;
    Timestamp created_at = 0;

    nlohmann::json to_json() const;
    static StableConcept from_json(const nlohmann::json& j);
};

} // namespace cogmem
