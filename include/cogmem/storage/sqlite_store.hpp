#pragma once

#include "cogmem/storage/memory_store.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace cogmem {

/**
 * @brief SQLite implementation of the storage boundary
 *
 * One connection guarded by a recursive mutex; WAL journal on file databases.
 * Pass ":memory:" for a private in-memory database. Cursors returned by
 * query_events() must not outlive the store.
 */
class SqliteStore : public MemoryStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    void insert_raw_input(const RawInput& raw) override;
    void set_raw_event_count(const std::string& raw_id, int event_count) override;
    std::vector<RawInput> list_raw_inputs(const std::string& user_id) override;

    void insert_event(const Event& event) override;
    std::optional<Event> get_event(const std::string& event_id) override;
    std::unique_ptr<EventCursor> query_events(const EventFilter& filter) override;
    size_t count_events(const EventFilter& filter) override;
    size_t archive_events(Timestamp older_than) override;
    std::vector<Event> list_archived_events(const std::string& user_id) override;

    std::optional<Entity> find_entity(const std::string& user_id,
                                      const std::string& canonical_name) override;
    std::vector<Entity> list_entities(const std::string& user_id) override;
    void insert_entity(const Entity& entity) override;
    void update_entity(const Entity& entity) override;

    std::optional<EntityRelationship> find_relation(
        const std::string& user_id,
        const std::string& source_entity_id,
        const std::string& target_entity_id,
        const std::string& relation_type) override;
    void upsert_relation(const EntityRelationship& relation) override;
    std::vector<EntityRelationship> list_relations(const std::string& user_id) override;

    void insert_view(const DerivedView& view) override;
    std::optional<DerivedView> get_view(const std::string& view_id) override;
    std::vector<DerivedView> list_views(const std::string& user_id,
                                        std::optional<ViewStatus> status = std::nullopt) override;
    bool update_view(const DerivedView& view, int expected_revision) override;
    size_t archive_views(Timestamp older_than) override;

    void insert_concept(const StableConcept& concept_row) override;
    void mark_concept_deprecated(const std::string& concept_id,
                                 const std::optional<std::string>& superseded_by,
                                 Timestamp deprecated_at,
                                 const std::string& reason) override;
    std::optional<StableConcept> get_concept(const std::string& concept_id) override;
    std::optional<StableConcept> find_active_concept(const std::string& user_id,
                                                     const std::string& name) override;
    std::vector<StableConcept> list_concepts(const std::string& user_id,
                                             bool active_only) override;
    std::vector<StableConcept> concept_history(const std::string& user_id,
                                               const std::string& name) override;

    void append_audit(const AuditEntry& entry) override;
    std::vector<AuditEntry> list_audit(const std::string& user_id) override;

    void run_in_transaction(const std::function<void()>& fn) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;
    int transaction_depth_ = 0;

    void init_schema();
    void exec(const char* sql);

    friend class SqliteEventCursor;
};

} // namespace cogmem
