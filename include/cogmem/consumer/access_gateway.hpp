#pragma once

#include "cogmem/cognitive/derived_view.hpp"
#include "cogmem/cognitive/stable_concept.hpp"
#include "cogmem/consumer/audit_entry.hpp"
#include "cogmem/entity/entity.hpp"
#include "cogmem/event/event.hpp"
#include "cogmem/storage/memory_store.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Consumer Access
// ============================================================================

/**
 * @brief What an external consumer may do. There is no level that writes Events.
 */
enum class AccessLevel {
    ReadOnly = 1,          ///< Statistics, views, entities
    ReadWriteDerived = 2   ///< Plus proposing Derived Views
};

std::string access_level_to_string(AccessLevel level);

/**
 * @brief Aggregate counts over a time range
 */
struct UsageStatistics {
    std::string user_id;
    Timestamp from = 0;
    Timestamp to = 0;
    size_t event_count = 0;
    size_t entity_count = 0;
    size_t view_count = 0;
    size_t active_view_count = 0;
    size_t concept_count = 0;
    std::map<std::string, int> actions;     ///< Events per action in range
    Timestamp computed_at = 0;
    bool stale = false;                     ///< Served from cache while storage was down

    nlohmann::json to_json() const;
};

/**
 * @brief The only door external consumers (plugins, agents) get
 *
 * Every call is audited, denials included. Consumers can read aggregates
 * and propose views; the event ledger and the concept registry stay closed.
 */
class AccessGateway {
public:
    /**
     * @param llm_discount Applied to the confidence of proposed views
     * @param view_ttl_days Lifetime of proposed views
     */
    explicit AccessGateway(MemoryStore& store, double llm_discount = 0.7, int view_ttl_days = 30);

    void register_consumer(const std::string& consumer_id, AccessLevel level);

    std::optional<AccessLevel> access_level(const std::string& consumer_id) const;

    /**
     * @brief Counts for [from, to). Falls back to the last cached result,
     *        flagged stale, when storage is unavailable.
     *
     * @throws PermissionDenied for unknown consumers
     * @throws StorageUnavailable when storage is down and nothing is cached
     */
    UsageStatistics query_statistics(const std::string& consumer_id,
                                     const std::string& user_id,
                                     Timestamp from,
                                     Timestamp to,
                                     Timestamp now);

    std::vector<DerivedView> list_active_views(const std::string& consumer_id,
                                               const std::string& user_id,
                                               Timestamp now);

    std::vector<Entity> query_entities(const std::string& consumer_id,
                                       const std::string& user_id,
                                       Timestamp now);

    /**
     * @brief Propose a Derived View backed by existing events of the user
     *
     * The proposal enters the normal lifecycle: it must still pass the gate.
     *
     * @return The new view id
     * @throws PermissionDenied below ReadWriteDerived
     * @throws ValidationError if evidence is empty or not the user's events
     */
    std::string propose_view(const std::string& consumer_id,
                             const std::string& user_id,
                             const std::string& hypothesis,
                             const std::string& view_type,
                             const std::vector<std::string>& evidence_event_ids,
                             double confidence,
                             Timestamp now);

    /**
     * @brief Always denied: consumers cannot write Events
     */
    void submit_event(const std::string& consumer_id, const Event& event, Timestamp now);

    /**
     * @brief Always denied: concepts only come from the Promotion Gate
     */
    void write_concept(const std::string& consumer_id, const StableConcept& concept_row, Timestamp now);

    std::vector<AuditEntry> audit_log(const std::string& user_id) const;

private:
    MemoryStore& store_;
    double llm_discount_;
    int view_ttl_days_;

    mutable std::mutex mutex_;
    std::map<std::string, AccessLevel> consumers_;
    std::map<std::string, UsageStatistics> statistics_cache_;

    void audit(const std::string& consumer_id,
               const std::string& user_id,
               const std::string& operation,
               const std::string& target,
               Timestamp now,
               bool success,
               int result_count,
               const std::string& error_message = "");

    /**
     * @throws PermissionDenied (after auditing the denial)
     */
    void require(const std::string& consumer_id,
                 const std::string& user_id,
                 AccessLevel needed,
                 const std::string& operation,
                 Timestamp now);
};

} // namespace cogmem
