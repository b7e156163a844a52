#pragma once

#include "cogmem/core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// View Status
// ============================================================================

/**
 * @brief Lifecycle state of a Derived View. Moves forward only.
 */
enum class ViewStatus {
    Active,
    Expired,
    Promoted,
    Rejected
};

inline std::string view_status_to_string(ViewStatus status) {
    switch (status) {
        case ViewStatus::Active: return "active";
        case ViewStatus::Expired: return "expired";
        case ViewStatus::Promoted: return "promoted";
        case ViewStatus::Rejected: return "rejected";
        default: return "active";
    }
}

inline ViewStatus string_to_view_status(const std::string& s) {
    if (s == "active") return ViewStatus::Active;
    if (s == "expired") return ViewStatus::Expired;
    if (s == "promoted") return ViewStatus::Promoted;
    if (s == "rejected") return ViewStatus::Rejected;
    throw std::invalid_argument("Unknown view status: " + s);
}

inline bool is_terminal(ViewStatus status) {
    return status != ViewStatus::Active;
}

/// View types. Open strings, these are the ones the engine produces.
namespace view_types {
    inline const std::string Pattern = "pattern";
    inline const std::string Preference = "preference";
    inline const std::string Habit = "habit";
    inline const std::string Belief = "belief";
}

// ============================================================================
// Derived View
// ============================================================================

/**
 * @brief A hypothesis about the user, backed by traceable evidence
 *
 * Construct through create(): a view without supporting events cannot exist.
 */
struct DerivedView {
    std::string view_id;
    std::string user_id;
    std::string hypothesis;
    std::string view_type = view_types::Pattern;
    std::string subject;                   ///< Entity/subject the hypothesis is about
    std::string action;                    ///< Verb for structured views (may be empty)
    std::string context_tag;               ///< Disambiguating context ("周末", "工作日")
    std::vector<std::string> derived_from; ///< Supporting event ids, never empty
    std::vector<std::string> counter_evidence;
    double confidence = 0.0;
    int validation_count = 0;
    Timestamp created_at = 0;
    Timestamp expires_at = 0;
    Timestamp updated_at = 0;
    ViewStatus status = ViewStatus::Active;
    std::string source = "detector";       ///< "detector" or "consumer:<id>"
    int revision = 0;                      ///< Optimistic concurrency counter

    /**
     * @brief Build a new Active view
     *
     * @throws ValidationError if derived_from is empty, confidence is outside
     *         [0, 1] or the hypothesis is blank
     */
    static DerivedView create(
        const std::string& user_id,
        const std::string& hypothesis,
        const std::string& view_type,
        const std::string& subject,
        const std::string& action,
        std::vector<std::string> derived_from,
        double confidence,
        Timestamp now,
        int ttl_days = 30
    );

    /**
     * @brief |counter_evidence| / |derived_from|
     */
    double counter_ratio() const;

    /**
     * @brief Key grouping views that make claims about the same thing
     */
    std::string subject_key() const;

    bool has_evidence(const std::string& event_id) const;

    nlohmann::json to_json() const;
    static DerivedView from_json(const nlohmann::json& j);
};

} // namespace cogmem
