#pragma once

#include "cogmem/entity/entity.hpp"
#include "cogmem/storage/memory_store.hpp"
#include <string>
#include <vector>

namespace cogmem {

/**
 * @brief Maintains weighted co-occurrence edges between entities
 *
 * Entities mentioned in the same raw input are linked pairwise. Each new
 * co-occurrence decays the previous mass before adding one:
 * weighted = prev * e^(-days/decay) + 1, strength = 1 - e^(-weighted/5).
 */
class RelationTracker {
public:
    static constexpr const char* kCoOccurs = "co_occurs_with";

    explicit RelationTracker(MemoryStore& store, double decay_days = 90.0);

    /**
     * @brief Record that the given entities appeared together
     *
     * Duplicate ids are ignored. Fewer than two distinct ids is a no-op.
     *
     * @return Number of edges created or strengthened
     */
    size_t observe(const std::string& user_id,
                   const std::vector<std::string>& entity_ids,
                   Timestamp timestamp);

    /**
     * @brief Edges touching an entity, strongest first
     */
    std::vector<EntityRelationship> relations_for(const std::string& user_id,
                                                  const std::string& entity_id) const;

    /**
     * @brief The user's top edges by strength
     */
    std::vector<EntityRelationship> strongest(const std::string& user_id, size_t limit) const;

    static double strength_from_weight(double weighted_count);

private:
    MemoryStore& store_;
    double decay_days_;
};

} // namespace cogmem
