#pragma once

#include "cogmem/cognitive/derived_view.hpp"
#include "cogmem/cognitive/stable_concept.hpp"
#include "cogmem/storage/memory_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Stable Concept Registry
// ============================================================================

/**
 * @brief Versioned store of promoted knowledge
 *
 * Promoting a view whose canonical name already has an active concept
 * creates version n+1 and deprecates the old one. Nothing is ever deleted,
 * so every version chain can be walked and rolled back.
 */
class ConceptRegistry {
public:
    explicit ConceptRegistry(MemoryStore& store, bool verbose = false);

    /**
     * @brief Commit a promoted view as a Stable Concept
     *
     * @return Id of the new concept version
     * @throws std::logic_error if the view is not Promoted (or Active being promoted)
     */
    std::string promote(const DerivedView& view, Timestamp now);

    /**
     * @brief Deprecate a concept without deleting it
     *
     * @return false if it was already deprecated
     * @throws std::invalid_argument for an unknown concept id
     */
    bool deprecate(const std::string& concept_id,
                   const std::optional<std::string>& superseded_by,
                   const std::string& reason,
                   Timestamp now);

    std::vector<StableConcept> get_active_concepts(const std::string& user_id) const;

    std::optional<StableConcept> get(const std::string& concept_id) const;

    /**
     * @brief Every version of a concept, oldest first
     */
    std::vector<StableConcept> history(const std::string& user_id, const std::string& name) const;

    /**
     * @brief Restore the previous version's definition as a new version
     *
     * @return Id of the restoring version
     * @throws std::logic_error if the concept is deprecated or has no parent
     */
    std::string rollback(const std::string& concept_id, Timestamp now);

    /**
     * @brief view_type:action:subject, or view_type plus normalized hypothesis
     */
    static std::string canonical_name(const DerivedView& view);

private:
    MemoryStore& store_;
    bool verbose_;

    std::string insert_version(StableConcept next,
                               const std::optional<StableConcept>& current,
                               const std::string& deprecation_reason,
                               Timestamp now);
};

} // namespace cogmem
