#pragma once

#include "cogmem/entity/context_classifier.hpp"
#include "cogmem/entity/entity.hpp"
#include "cogmem/storage/memory_store.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Resolver Configuration
// ============================================================================

struct ResolverConfig {
    double fuzzy_match_threshold = 0.85;    ///< Jaro-Winkler similarity for name candidates
    double context_score_threshold = 0.6;   ///< Minimum score to pick among several candidates
    double type_conflict_confidence = 0.7;  ///< Typing strength that splits a single candidate
    double attribute_decay_days = 90.0;     ///< Recency decay constant for attributes
    size_t context_profile_limit = 64;      ///< Keywords kept per entity profile
    std::map<std::string, std::string> aliases;  ///< Lowercased surface form -> canonical name
    bool verbose = false;
};

// ============================================================================
// Entity Resolver
// ============================================================================

/**
 * @brief Turns raw mentions into canonical, per-user entities
 *
 * Resolution order: exact and fuzzy name candidates; zero candidates create
 * a new entity typed from context; several candidates are scored against
 * their historical contexts and a weak best match creates a disjoint entity
 * ("苹果#2") instead of guessing.
 */
class EntityResolver {
public:
    explicit EntityResolver(MemoryStore& store, ResolverConfig config = {});

    /**
     * @brief Resolve a mention, creating or updating the entity
     *
     * Always increments mention_count and updates last_seen on the returned
     * entity, even when no attribute is accepted.
     *
     * @throws ValidationError for an empty mention
     */
    Entity resolve(const std::string& user_id,
                   const std::string& mention,
                   const std::string& context,
                   Timestamp timestamp);

    /**
     * @brief Trim, apply aliases and title-case ASCII names
     */
    std::string normalize_mention(const std::string& mention) const;

    /**
     * @brief Existing entities that may refer to the normalized name
     */
    std::vector<Entity> find_candidates(const std::string& user_id,
                                        const std::string& normalized_name) const;

    /**
     * @brief Context similarity between a mention and a candidate
     *
     * 0.4 * (share of context keywords already in the candidate profile)
     * + 0.6 * type agreement (1 same type, 0.5 either unknown, 0 different).
     */
    double context_score(const Entity& candidate,
                         const std::set<std::string>& keywords,
                         const TypeGuess& guess) const;

    /**
     * @brief extraction * (1 - e^(-count/2)) * (count/observations) * e^(-days/decay)
     */
    static double attribute_confidence(const AttributeValue& attr, Timestamp now, double decay_days);

    /**
     * @brief Merge one attribute observation into an entity
     *
     * A differing value replaces the current one only if its confidence is
     * strictly greater than the decayed confidence of the current value.
     *
     * @return true if the observation was accepted
     */
    static bool merge_attribute(Entity& entity,
                                const AttributeObservation& observation,
                                Timestamp now,
                                double decay_days);

    const ContextClassifier& classifier() const { return classifier_; }

private:
    MemoryStore& store_;
    ResolverConfig config_;
    ContextClassifier classifier_;

    static std::string base_name(const std::string& canonical_name);

    Entity create_entity(const std::string& user_id,
                         const std::string& canonical_name,
                         const TypeGuess& guess,
                         Timestamp timestamp) const;

    std::string next_disjoint_name(const std::vector<Entity>& candidates,
                                   const std::string& name) const;

    void observe(Entity& entity,
                 const std::set<std::string>& keywords,
                 const TypeGuess& guess,
                 const std::string& context,
                 Timestamp timestamp) const;
};

} // namespace cogmem
