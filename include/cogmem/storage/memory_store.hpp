#pragma once

#include "cogmem/cognitive/derived_view.hpp"
#include "cogmem/cognitive/stable_concept.hpp"
#include "cogmem/consumer/audit_entry.hpp"
#include "cogmem/entity/entity.hpp"
#include "cogmem/event/event.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Storage Boundary
// ============================================================================

/**
 * @brief Forward-only stream over stored events
 */
class EventCursor {
public:
    virtual ~EventCursor() = default;

    /**
     * @brief Advance to the next event
     *
     * @param out Receives the event when one is available
     * @return false once the stream is exhausted
     */
    virtual bool next(Event& out) = 0;
};

/**
 * @brief Transactional relational store behind every pipeline component
 *
 * Implementations must give read-your-writes consistency per user and raise
 * StorageUnavailable for transient failures. No operation deletes rows except
 * the archive moves, which change storage tier and leave content untouched.
 */
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    // Raw inputs
    virtual void insert_raw_input(const RawInput& raw) = 0;
    virtual void set_raw_event_count(const std::string& raw_id, int event_count) = 0;
    virtual std::vector<RawInput> list_raw_inputs(const std::string& user_id) = 0;

    // Events
    virtual void insert_event(const Event& event) = 0;
    virtual std::optional<Event> get_event(const std::string& event_id) = 0;
    virtual std::unique_ptr<EventCursor> query_events(const EventFilter& filter) = 0;
    virtual size_t count_events(const EventFilter& filter) = 0;
    virtual size_t archive_events(Timestamp older_than) = 0;
    virtual std::vector<Event> list_archived_events(const std::string& user_id) = 0;

    // Entities
    virtual std::optional<Entity> find_entity(const std::string& user_id,
                                              const std::string& canonical_name) = 0;
    virtual std::vector<Entity> list_entities(const std::string& user_id) = 0;
    virtual void insert_entity(const Entity& entity) = 0;
    virtual void update_entity(const Entity& entity) = 0;

    // Relations
    virtual std::optional<EntityRelationship> find_relation(
        const std::string& user_id,
        const std::string& source_entity_id,
        const std::string& target_entity_id,
        const std::string& relation_type) = 0;
    virtual void upsert_relation(const EntityRelationship& relation) = 0;
    virtual std::vector<EntityRelationship> list_relations(const std::string& user_id) = 0;

    // Views
    virtual void insert_view(const DerivedView& view) = 0;
    virtual std::optional<DerivedView> get_view(const std::string& view_id) = 0;
    virtual std::vector<DerivedView> list_views(const std::string& user_id,
                                                std::optional<ViewStatus> status = std::nullopt) = 0;

    /**
     * @brief Optimistic update
     *
     * Writes the view and bumps its revision only if the stored revision still
     * equals expected_revision.
     *
     * @return false when another writer got there first
     * @throws std::logic_error on an attempt to move a terminal view back to Active
     */
    virtual bool update_view(const DerivedView& view, int expected_revision) = 0;
    virtual size_t archive_views(Timestamp older_than) = 0;

    // Concepts
    virtual void insert_concept(const StableConcept& concept_row) = 0;
    virtual void mark_concept_deprecated(const std::string& concept_id,
                                         const std::optional<std::string>& superseded_by,
                                         Timestamp deprecated_at,
                                         const std::string& reason) = 0;
    virtual std::optional<StableConcept> get_concept(const std::string& concept_id) = 0;
    virtual std::optional<StableConcept> find_active_concept(const std::string& user_id,
                                                             const std::string& name) = 0;
    virtual std::vector<StableConcept> list_concepts(const std::string& user_id,
                                                     bool active_only) = 0;
    virtual std::vector<StableConcept> concept_history(const std::string& user_id,
                                                       const std::string& name) = 0;

    // Audit
    virtual void append_audit(const AuditEntry& entry) = 0;
    virtual std::vector<AuditEntry> list_audit(const std::string& user_id) = 0;

    /**
     * @brief Run fn atomically. Rolls back and rethrows if fn throws.
     */
    virtual void run_in_transaction(const std::function<void()>& fn) = 0;
};

} // namespace cogmem
