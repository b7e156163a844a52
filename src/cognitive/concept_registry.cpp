#include "cogmem/cognitive/concept_registry.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace cogmem {

ConceptRegistry::ConceptRegistry(MemoryStore& store, bool verbose)
    : store_(store), verbose_(verbose) {}

std::string ConceptRegistry::canonical_name(const DerivedView& view) {
    if (!view.action.empty() && !view.subject.empty()) {
        return view.view_type + ":" + view.action + ":" + view.subject;
    }
    return view.view_type + ":" + to_lower_ascii(collapse_whitespace(view.hypothesis));
}

std::string ConceptRegistry::insert_version(StableConcept next,
                                            const std::optional<StableConcept>& current,
                                            const std::string& deprecation_reason,
                                            Timestamp now) {
    auto versions = store_.concept_history(next.user_id, next.name);
    int max_version = 0;
    for (const auto& c : versions) max_version = std::max(max_version, c.version);

    next.concept_id = generate_id("concept");
    next.version = max_version + 1;
    next.created_at = now;
    next.deprecated = false;
    next.superseded_by.reset();
    next.deprecated_at.reset();
    next.deprecation_reason.clear();
    next.parent_concept_id.reset();
    if (current) next.parent_concept_id = current->concept_id;

    store_.insert_concept(next);
    if (current) {
        store_.mark_concept_deprecated(current->concept_id, next.concept_id, now, deprecation_reason);
    }

    if (verbose_) {
        std::cout << "Concept " << next.name << " v" << next.version << " -> " << next.concept_id << std::endl;
    }
    return next.concept_id;
}

std::string ConceptRegistry::promote(const DerivedView& view, Timestamp now) {
    if (view.status != ViewStatus::Promoted && view.status != ViewStatus::Active) {
        throw std::logic_error("Cannot promote a " + view_status_to_string(view.status) + " view");
    }

    StableConcept concept_row;
    concept_row.user_id = view.user_id;
    concept_row.name = canonical_name(view);
    concept_row.display_name = view.hypothesis;
    concept_row.concept_type = view.view_type;
    concept_row.description = view.hypothesis;
    concept_row.definition = {
        {"hypothesis", view.hypothesis},
        {"view_type", view.view_type},
        {"subject", view.subject},
        {"action", view.action},
        {"context_tag", view.context_tag},
        {"confidence", view.confidence},
        {"validation_count", view.validation_count},
        {"counter_evidence_count", view.counter_evidence.size()},
        {"evidence", view.derived_from}
    };
    concept_row.derived_from_views = {view.view_id};
    concept_row.promotion_confidence = view.confidence;

    std::string concept_id;
    store_.run_in_transaction([&]() {
        auto current = store_.find_active_concept(view.user_id, concept_row.name);
        concept_id = insert_version(concept_row, current, "superseded by newer promotion", now);
    });
    return concept_id;
}

bool ConceptRegistry::deprecate(const std::string& concept_id,
                                const std::optional<std::string>& superseded_by,
                                const std::string& reason,
                                Timestamp now) {
    auto existing = store_.get_concept(concept_id);
    if (!existing) {
        throw std::invalid_argument("Unknown concept: " + concept_id);
    }
    if (existing->deprecated) {
        return false;
    }
    store_.mark_concept_deprecated(concept_id, superseded_by, now, reason);
    return true;
}

std::vector<StableConcept> ConceptRegistry::get_active_concepts(const std::string& user_id) const {
    return store_.list_concepts(user_id, true);
}

std::optional<StableConcept> ConceptRegistry::get(const std::string& concept_id) const {
    return store_.get_concept(concept_id);
}

std::vector<StableConcept> ConceptRegistry::history(const std::string& user_id, const std::string& name) const {
    return store_.concept_history(user_id, name);
}

std::string ConceptRegistry::rollback(const std::string& concept_id, Timestamp now) {
    std::string restored_id;
    store_.run_in_transaction([&]() {
        auto current = store_.get_concept(concept_id);
        if (!current) {
            throw std::invalid_argument("Unknown concept: " + concept_id);
        }
        if (current->deprecated) {
            throw std::logic_error("Concept " + concept_id + " is not the active version");
        }
        if (!current->parent_concept_id) {
            throw std::logic_error("Concept " + concept_id + " has no previous version");
        }
        auto previous = store_.get_concept(*current->parent_concept_id);
        if (!previous) {
            throw std::logic_error("Previous version " + *current->parent_concept_id + " is missing");
        }

        StableConcept restored = *previous;
        restored.definition["restored_from"] = previous->concept_id;
        restored_id = insert_version(restored, current, "rolled back", now);
    });
    return restored_id;
}

} // namespace cogmem
