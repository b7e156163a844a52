#pragma once

#include "cogmem/event/event.hpp"
#include "cogmem/extraction/inference_provider.hpp"
#include "cogmem/extraction/rule_extractor.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

/**
 * @brief Events produced for one raw input
 */
struct ExtractionOutcome {
    std::vector<Event> events;             ///< Validated, not yet stored
    std::string extractor_used = "none";   ///< "llm:<provider>", "rule" or "none"
    bool used_fallback = false;            ///< Rule extractor ran after inference failed or came back empty
    int dropped_candidates = 0;            ///< Candidates rejected during validation
    bool success = false;                  ///< At least one event extracted
    std::string error_message;             ///< Inference failure, if any
};

/**
 * @brief The extraction boundary: inference first, deterministic rules as fallback
 *
 * Every candidate is validated and clamped before it becomes an Event, no
 * matter which extractor produced it.
 */
class EventExtractor {
public:
    /**
     * @param provider Inference back end, may be null for rule-only operation
     */
    explicit EventExtractor(InferenceProvider* provider, bool verbose = false);

    ExtractionOutcome extract(
        const std::string& user_id,
        const std::string& text,
        const std::string& context,
        const std::string& raw_id,
        Timestamp now
    ) const;

    /**
     * @brief Sanitize one candidate into an Event
     *
     * Clamps confidence into [0, 1], drops a non-positive quantity (and its
     * unit) and resolves the timestamp hint against now.
     *
     * @return nullopt when action or target is blank
     */
    static std::optional<Event> to_event(
        const CandidateEvent& candidate,
        const std::string& user_id,
        const std::string& raw_id,
        Timestamp now
    );

    /**
     * @brief Resolve an ISO-8601 or relative hint; falls back to now
     */
    static Timestamp resolve_timestamp(const std::string& hint, Timestamp now);

private:
    InferenceProvider* provider_;
    RuleExtractor rules_;
    bool verbose_;

    std::vector<Event> sanitize_all(const std::vector<CandidateEvent>& candidates,
                                    const std::string& user_id,
                                    const std::string& raw_id,
                                    Timestamp now,
                                    int& dropped) const;
};

} // namespace cogmem
