#include "cogmem/extraction/event_extractor.hpp"
#include "cogmem/core/errors.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace cogmem {

EventExtractor::EventExtractor(InferenceProvider* provider, bool verbose)
    : provider_(provider), verbose_(verbose) {}

Timestamp EventExtractor::resolve_timestamp(const std::string& hint, Timestamp now) {
    std::string h = trim(hint);
    if (h.empty()) return now;

    if (h.size() >= 10 && std::isdigit(static_cast<unsigned char>(h[0]))) {
        try {
            Timestamp ts = from_iso8601(h);
            // A hint far in the future is a hallucination, not a plan
            return ts > now + kSecondsPerDay ? now : ts;
        } catch (const std::invalid_argument&) {
            // Not ISO-8601; try relative expressions below
        }
    }

    if (auto ts = TimeHintParser::resolve(h, now)) {
        return *ts;
    }
    return now;
}

std::optional<Event> EventExtractor::to_event(
    const CandidateEvent& candidate,
    const std::string& user_id,
    const std::string& raw_id,
    Timestamp now
) {
    Event event;
    event.user_id = user_id;
    event.action = collapse_whitespace(candidate.action);
    event.target = collapse_whitespace(candidate.target);
    if (event.action.empty() || event.target.empty()) {
        return std::nullopt;
    }

    double confidence = candidate.confidence;
    if (std::isnan(confidence)) confidence = 0.0;
    event.confidence = std::clamp(confidence, 0.0, 1.0);

    if (candidate.quantity && std::isfinite(*candidate.quantity) && *candidate.quantity > 0.0) {
        event.quantity = candidate.quantity;
        if (candidate.unit && !trim(*candidate.unit).empty()) {
            event.unit = trim(*candidate.unit);
        }
    }

    event.timestamp = resolve_timestamp(candidate.timestamp_hint, now);
    event.source_reference = raw_id;
    event.extractor = candidate.extractor.empty() ? "rule" : candidate.extractor;
    return event;
}

std::vector<Event> EventExtractor::sanitize_all(
    const std::vector<CandidateEvent>& candidates,
    const std::string& user_id,
    const std::string& raw_id,
    Timestamp now,
    int& dropped
) const {
    std::vector<Event> events;
    for (const auto& candidate : candidates) {
        auto event = to_event(candidate, user_id, raw_id, now);
        if (!event) {
            ++dropped;
            if (verbose_) {
                std::cerr << "Dropping candidate with blank action/target from "
                          << candidate.extractor << std::endl;
            }
            continue;
        }
        events.push_back(std::move(*event));
    }
    return events;
}

ExtractionOutcome EventExtractor::extract(
    const std::string& user_id,
    const std::string& text,
    const std::string& context,
    const std::string& raw_id,
    Timestamp now
) const {
    ExtractionOutcome outcome;

    if (provider_ && provider_->is_configured()) {
        InferenceResult result;
        try {
            result = provider_->extract_candidate_events(text, context);
        } catch (const std::exception& e) {
            result.success = false;
            result.error_message = std::string("Extraction failure: ") + e.what();
        }

        if (result.success) {
            outcome.events = sanitize_all(result.candidates, user_id, raw_id, now,
                                          outcome.dropped_candidates);
            if (!outcome.events.empty()) {
                outcome.extractor_used = "llm:" + provider_->get_provider_name();
                outcome.success = true;
                return outcome;
            }
        } else {
            outcome.error_message = result.error_message;
            if (verbose_) {
                std::cerr << "Inference failed, using rule fallback: "
                          << result.error_message << std::endl;
            }
        }
        outcome.used_fallback = true;
    }

    outcome.events = sanitize_all(rules_.extract(text, now), user_id, raw_id, now,
                                  outcome.dropped_candidates);
    outcome.extractor_used = outcome.events.empty() ? "none" : "rule";
    outcome.success = !outcome.events.empty();
    return outcome;
}

} // namespace cogmem
