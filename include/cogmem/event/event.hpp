#pragma once

#include "cogmem/core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace cogmem {

// ============================================================================
// Event Model
// ============================================================================

/**
 * @brief Raw statement as received from the user, stored before extraction
 */
struct RawInput {
    std::string raw_id;
    std::string user_id;
    std::string content;
    std::string context;
    Timestamp received_at = 0;
    int event_count = 0;                   ///< Events derived from this input

    nlohmann::json to_json() const;
    static RawInput from_json(const nlohmann::json& j);
};

/**
 * @brief Atomic, immutable fact extracted from a raw input
 *
 * Action and target are open vocabulary: any verb or noun is representable.
 */
struct Event {
    std::string event_id;
    std::string user_id;
    Timestamp timestamp = 0;
    std::string actor = "user";
    std::string action;
    std::string target;
    std::optional<double> quantity;
    std::optional<std::string> unit;       ///< Only meaningful with a quantity
    double confidence = 0.0;
    std::string source_reference;          ///< raw_id of the producing RawInput
    std::string extractor;                 ///< "rule" or "llm:<provider>"

    /**
     * @brief Check field invariants
     *
     * @throws ValidationError when any invariant is violated
     */
    void validate() const;

    nlohmann::json to_json() const;
    static Event from_json(const nlohmann::json& j);

    bool operator==(const Event& other) const;
    bool operator!=(const Event& other) const { return !(*this == other); }
};

/**
 * @brief Filter for streaming event queries. Unset fields match everything.
 */
struct EventFilter {
    std::string user_id;
    std::optional<Timestamp> from;         ///< Inclusive
    std::optional<Timestamp> to;           ///< Exclusive
    std::optional<std::string> action;
    std::optional<std::string> target;
    std::optional<double> min_confidence;
};

/**
 * @brief Storage temperature of an event by age
 */
enum class DataTier {
    Hot,    ///< < 3 months
    Warm,   ///< < 24 months
    Cold    ///< Archive candidate
};

DataTier tier_of(const Event& event, Timestamp now);
std::string data_tier_to_string(DataTier tier);

} // namespace cogmem
