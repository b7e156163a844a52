#include "cogmem/entity/relation_tracker.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace cogmem {

RelationTracker::RelationTracker(MemoryStore& store, double decay_days)
    : store_(store), decay_days_(decay_days) {}

double RelationTracker::strength_from_weight(double weighted_count) {
    return std::clamp(1.0 - std::exp(-weighted_count / 5.0), 0.0, 1.0);
}

size_t RelationTracker::observe(const std::string& user_id,
                                const std::vector<std::string>& entity_ids,
                                Timestamp timestamp) {
    std::set<std::string> unique(entity_ids.begin(), entity_ids.end());
    unique.erase("");
    if (unique.size() < 2) return 0;

    std::vector<std::string> ids(unique.begin(), unique.end());
    size_t touched = 0;

    store_.run_in_transaction([&]() {
        for (size_t i = 0; i < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                // ids is sorted, so (source, target) is a canonical pair
                auto existing = store_.find_relation(user_id, ids[i], ids[j], kCoOccurs);

                EntityRelationship rel;
                if (existing) {
                    rel = *existing;
                    double elapsed = std::max(0.0, days_between(rel.last_seen, timestamp));
                    rel.weighted_count = rel.weighted_count * std::exp(-elapsed / decay_days_) + 1.0;
                    rel.co_occurrence_count += 1;
                    rel.last_seen = std::max(rel.last_seen, timestamp);
                } else {
                    rel.relation_id = generate_id("rel");
                    rel.user_id = user_id;
                    rel.source_entity_id = ids[i];
                    rel.target_entity_id = ids[j];
                    rel.relation_type = kCoOccurs;
                    rel.weighted_count = 1.0;
                    rel.co_occurrence_count = 1;
                    rel.first_seen = timestamp;
                    rel.last_seen = timestamp;
                }
                rel.strength = strength_from_weight(rel.weighted_count);
                store_.upsert_relation(rel);
                ++touched;
            }
        }
    });

    return touched;
}

std::vector<EntityRelationship> RelationTracker::relations_for(const std::string& user_id,
                                                               const std::string& entity_id) const {
    std::vector<EntityRelationship> result;
    for (auto& rel : store_.list_relations(user_id)) {
        if (rel.source_entity_id == entity_id || rel.target_entity_id == entity_id) {
            result.push_back(std::move(rel));
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.strength > b.strength;
    });
    return result;
}

std::vector<EntityRelationship> RelationTracker::strongest(const std::string& user_id, size_t limit) const {
    auto all = store_.list_relations(user_id);
    std::sort(all.begin(), all.end(), [](const auto& a, const auto& b) {
        return a.strength > b.strength;
    });
    if (all.size() > limit) all.resize(limit);
    return all;
}

} // namespace cogmem
