#include "cogmem/storage/sqlite_store.hpp"
#include "cogmem/core/errors.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

using json = nlohmann::json;

namespace cogmem {

// ============================================================================
// SQLite helpers
// ============================================================================

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

bool is_transient(int rc) {
    int primary = rc & 0xFF;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED ||
           primary == SQLITE_IOERR || primary == SQLITE_FULL ||
           primary == SQLITE_CANTOPEN;
}

// Throws for anything other than OK/ROW/DONE
void check(int rc, sqlite3* db, const std::string& context) {
    if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;
    std::string message = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if (is_transient(rc)) {
        throw StorageUnavailable(message);
    }
    throw std::runtime_error("SQLite error in " + message);
}

void prepare(sqlite3* db, const std::string& sql, StmtGuard& guard) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &guard.stmt, nullptr);
    check(rc, db, "prepare");
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& value) {
    if (value) bind_text(stmt, idx, *value);
    else sqlite3_bind_null(stmt, idx);
}

std::string column_text(sqlite3_stmt* stmt, int idx) {
    const unsigned char* text = sqlite3_column_text(stmt, idx);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, idx)));
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int idx) {
    if (sqlite3_column_type(stmt, idx) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, idx);
}

int step(sqlite3* db, sqlite3_stmt* stmt, const std::string& context) {
    int rc = sqlite3_step(stmt);
    check(rc, db, context);
    return rc;
}

// Column order: event_id, user_id, timestamp, actor, action, target,
// quantity, unit, confidence, source_reference, extractor
const char* kEventColumns =
    "event_id, user_id, timestamp, actor, action, target, quantity, unit, "
    "confidence, source_reference, extractor";

Event read_event(sqlite3_stmt* stmt) {
    Event event;
    event.event_id = column_text(stmt, 0);
    event.user_id = column_text(stmt, 1);
    event.timestamp = sqlite3_column_int64(stmt, 2);
    event.actor = column_text(stmt, 3);
    event.action = column_text(stmt, 4);
    event.target = column_text(stmt, 5);
    if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
        event.quantity = sqlite3_column_double(stmt, 6);
    }
    event.unit = column_optional_text(stmt, 7);
    event.confidence = sqlite3_column_double(stmt, 8);
    event.source_reference = column_text(stmt, 9);
    event.extractor = column_text(stmt, 10);
    return event;
}

const char* kEntityColumns =
    "entity_id, user_id, canonical_name, entity_type, type_confidence, attributes, "
    "context_profile, first_seen, last_seen, mention_count";

Entity read_entity(sqlite3_stmt* stmt) {
    Entity entity;
    entity.entity_id = column_text(stmt, 0);
    entity.user_id = column_text(stmt, 1);
    entity.canonical_name = column_text(stmt, 2);
    entity.entity_type = column_text(stmt, 3);
    entity.type_confidence = sqlite3_column_double(stmt, 4);

    json attrs = json::parse(column_text(stmt, 5));
    for (auto it = attrs.begin(); it != attrs.end(); ++it) {
        entity.attributes[it.key()] = AttributeValue::from_json(it.value());
    }
    entity.context_profile = json::parse(column_text(stmt, 6)).get<std::map<std::string, int>>();
    entity.first_seen = sqlite3_column_int64(stmt, 7);
    entity.last_seen = sqlite3_column_int64(stmt, 8);
    entity.mention_count = sqlite3_column_int(stmt, 9);
    return entity;
}

json attributes_json(const Entity& entity) {
    json attrs = json::object();
    for (const auto& [key, attr] : entity.attributes) {
        attrs[key] = attr.to_json();
    }
    return attrs;
}

const char* kRelationColumns =
    "relation_id, user_id, source_entity_id, target_entity_id, relation_type, strength, "
    "co_occurrence_count, weighted_count, first_seen, last_seen";

EntityRelationship read_relation(sqlite3_stmt* stmt) {
    EntityRelationship rel;
    rel.relation_id = column_text(stmt, 0);
    rel.user_id = column_text(stmt, 1);
    rel.source_entity_id = column_text(stmt, 2);
    rel.target_entity_id = column_text(stmt, 3);
    rel.relation_type = column_text(stmt, 4);
    rel.strength = sqlite3_column_double(stmt, 5);
    rel.co_occurrence_count = sqlite3_column_int(stmt, 6);
    rel.weighted_count = sqlite3_column_double(stmt, 7);
    rel.first_seen = sqlite3_column_int64(stmt, 8);
    rel.last_seen = sqlite3_column_int64(stmt, 9);
    return rel;
}

const char* kViewColumns =
    "view_id, user_id, hypothesis, view_type, subject, action, context_tag, derived_from, "
    "counter_evidence, confidence, validation_count, created_at, expires_at, updated_at, "
    "status, source, revision";

DerivedView read_view(sqlite3_stmt* stmt) {
    DerivedView view;
    view.view_id = column_text(stmt, 0);
    view.user_id = column_text(stmt, 1);
    view.hypothesis = column_text(stmt, 2);
    view.view_type = column_text(stmt, 3);
    view.subject = column_text(stmt, 4);
    view.action = column_text(stmt, 5);
    view.context_tag = column_text(stmt, 6);
    view.derived_from = json::parse(column_text(stmt, 7)).get<std::vector<std::string>>();
    view.counter_evidence = json::parse(column_text(stmt, 8)).get<std::vector<std::string>>();
    view.confidence = sqlite3_column_double(stmt, 9);
    view.validation_count = sqlite3_column_int(stmt, 10);
    view.created_at = sqlite3_column_int64(stmt, 11);
    view.expires_at = sqlite3_column_int64(stmt, 12);
    view.updated_at = sqlite3_column_int64(stmt, 13);
    view.status = string_to_view_status(column_text(stmt, 14));
    view.source = column_text(stmt, 15);
    view.revision = sqlite3_column_int(stmt, 16);
    return view;
}

const char* kConceptColumns =
    "concept_id, user_id, name, display_name, concept_type, description, definition, version, "
    "parent_concept_id, deprecated, superseded_by, deprecated_at, deprecation_reason, "
    "derived_from_views, promotion_confidence, created_at";

StableConcept read_concept(sqlite3_stmt* stmt) {
    StableConcept c;
    c.concept_id = column_text(stmt, 0);
    c.user_id = column_text(stmt, 1);
    c.name = column_text(stmt, 2);
    c.display_name = column_text(stmt, 3);
    c.concept_type = column_text(stmt, 4);
    c.description = column_text(stmt, 5);
    c.definition = json::parse(column_text(stmt, 6));
    c.version = sqlite3_column_int(stmt, 7);
    c.parent_concept_id = column_optional_text(stmt, 8);
    c.deprecated = sqlite3_column_int(stmt, 9) != 0;
    c.superseded_by = column_optional_text(stmt, 10);
    if (sqlite3_column_type(stmt, 11) != SQLITE_NULL) {
        c.deprecated_at = sqlite3_column_int64(stmt, 11);
    }
    c.deprecation_reason = column_text(stmt, 12);
    c.derived_from_views = json::parse(column_text(stmt, 13)).get<std::vector<std::string>>();
    c.promotion_confidence = sqlite3_column_double(stmt, 14);
    c.created_at = sqlite3_column_int64(stmt, 15);
    return c;
}

// Appends WHERE clauses for an event filter; bind_filter() must mirror the order
std::string filter_clause(const EventFilter& filter) {
    std::string sql = " WHERE user_id = ?";
    if (filter.from) sql += " AND timestamp >= ?";
    if (filter.to) sql += " AND timestamp < ?";
    if (filter.action) sql += " AND action = ?";
    if (filter.target) sql += " AND target = ?";
    if (filter.min_confidence) sql += " AND confidence >= ?";
    return sql;
}

void bind_filter(sqlite3_stmt* stmt, const EventFilter& filter) {
    int idx = 1;
    bind_text(stmt, idx++, filter.user_id);
    if (filter.from) sqlite3_bind_int64(stmt, idx++, *filter.from);
    if (filter.to) sqlite3_bind_int64(stmt, idx++, *filter.to);
    if (filter.action) bind_text(stmt, idx++, *filter.action);
    if (filter.target) bind_text(stmt, idx++, *filter.target);
    if (filter.min_confidence) sqlite3_bind_double(stmt, idx++, *filter.min_confidence);
}

} // anonymous namespace

// ============================================================================
// Event cursor
// ============================================================================

/**
 * @brief Lazily steps a prepared SELECT; rows are never materialized up front
 */
class SqliteEventCursor : public EventCursor {
public:
    SqliteEventCursor(SqliteStore& store, const EventFilter& filter) : store_(store) {
        std::lock_guard<std::recursive_mutex> lock(store_.mutex_);
        std::string sql = std::string("SELECT ") + kEventColumns + " FROM events" +
                          filter_clause(filter) + " ORDER BY timestamp ASC, event_id ASC";
        prepare(store_.db_, sql, guard_);
        bind_filter(guard_.stmt, filter);
    }

    bool next(Event& out) override {
        if (done_) return false;
        std::lock_guard<std::recursive_mutex> lock(store_.mutex_);
        int rc = step(store_.db_, guard_.stmt, "query_events");
        if (rc != SQLITE_ROW) {
            done_ = true;
            return false;
        }
        out = read_event(guard_.stmt);
        return true;
    }

private:
    SqliteStore& store_;
    StmtGuard guard_;
    bool done_ = false;
};

// ============================================================================
// SqliteStore
// ============================================================================

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageUnavailable("failed to open database " + path_ + ": " + err);
    }

    sqlite3_busy_timeout(db_, 2000);
    if (path_ != ":memory:") {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
    }
    exec("PRAGMA foreign_keys=ON;");

    init_schema();
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        if (is_transient(rc)) {
            throw StorageUnavailable(message);
        }
        throw std::runtime_error("SQLite exec failed: " + message);
    }
}

void SqliteStore::init_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS raw_inputs ("
        "  raw_id      TEXT PRIMARY KEY,"
        "  user_id     TEXT NOT NULL,"
        "  content     TEXT NOT NULL,"
        "  context     TEXT NOT NULL,"
        "  received_at INTEGER NOT NULL,"
        "  event_count INTEGER NOT NULL DEFAULT 0"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_raw_user ON raw_inputs(user_id, received_at);"

        "CREATE TABLE IF NOT EXISTS events ("
        "  event_id         TEXT PRIMARY KEY,"
        "  user_id          TEXT NOT NULL,"
        "  timestamp        INTEGER NOT NULL,"
        "  actor            TEXT NOT NULL,"
        "  action           TEXT NOT NULL,"
        "  target           TEXT NOT NULL,"
        "  quantity         REAL,"
        "  unit             TEXT,"
        "  confidence       REAL NOT NULL CHECK (confidence >= 0 AND confidence <= 1),"
        "  source_reference TEXT NOT NULL,"
        "  extractor        TEXT NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_events_user_time ON events(user_id, timestamp);"
        "CREATE INDEX IF NOT EXISTS idx_events_action_target ON events(user_id, action, target);"
        "CREATE INDEX IF NOT EXISTS idx_events_confidence ON events(user_id, confidence);"

        "CREATE TABLE IF NOT EXISTS events_archive ("
        "  event_id         TEXT PRIMARY KEY,"
        "  user_id          TEXT NOT NULL,"
        "  timestamp        INTEGER NOT NULL,"
        "  actor            TEXT NOT NULL,"
        "  action           TEXT NOT NULL,"
        "  target           TEXT NOT NULL,"
        "  quantity         REAL,"
        "  unit             TEXT,"
        "  confidence       REAL NOT NULL,"
        "  source_reference TEXT NOT NULL,"
        "  extractor        TEXT NOT NULL,"
        "  archived_at      INTEGER NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_events_archive_user ON events_archive(user_id, timestamp);"

        "CREATE TABLE IF NOT EXISTS entities ("
        "  entity_id       TEXT PRIMARY KEY,"
        "  user_id         TEXT NOT NULL,"
        "  canonical_name  TEXT NOT NULL,"
        "  entity_type     TEXT NOT NULL,"
        "  type_confidence REAL NOT NULL,"
        "  attributes      TEXT NOT NULL,"
        "  context_profile TEXT NOT NULL,"
        "  first_seen      INTEGER NOT NULL,"
        "  last_seen       INTEGER NOT NULL,"
        "  mention_count   INTEGER NOT NULL,"
        "  UNIQUE (user_id, canonical_name)"
        ");"

        "CREATE TABLE IF NOT EXISTS entity_relations ("
        "  relation_id         TEXT PRIMARY KEY,"
        "  user_id             TEXT NOT NULL,"
        "  source_entity_id    TEXT NOT NULL,"
        "  target_entity_id    TEXT NOT NULL,"
        "  relation_type       TEXT NOT NULL,"
        "  strength            REAL NOT NULL,"
        "  co_occurrence_count INTEGER NOT NULL,"
        "  weighted_count      REAL NOT NULL,"
        "  first_seen          INTEGER NOT NULL,"
        "  last_seen           INTEGER NOT NULL,"
        "  UNIQUE (user_id, source_entity_id, target_entity_id, relation_type)"
        ");"

        "CREATE TABLE IF NOT EXISTS cognitive_views ("
        "  view_id          TEXT PRIMARY KEY,"
        "  user_id          TEXT NOT NULL,"
        "  hypothesis       TEXT NOT NULL,"
        "  view_type        TEXT NOT NULL,"
        "  subject          TEXT NOT NULL,"
        "  action           TEXT NOT NULL,"
        "  context_tag      TEXT NOT NULL,"
        "  derived_from     TEXT NOT NULL,"
        "  counter_evidence TEXT NOT NULL,"
        "  confidence       REAL NOT NULL,"
        "  validation_count INTEGER NOT NULL,"
        "  created_at       INTEGER NOT NULL,"
        "  expires_at       INTEGER NOT NULL,"
        "  updated_at       INTEGER NOT NULL,"
        "  status           TEXT NOT NULL,"
        "  source           TEXT NOT NULL,"
        "  revision         INTEGER NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_views_user_status ON cognitive_views(user_id, status);"

        "CREATE TABLE IF NOT EXISTS views_archive ("
        "  view_id     TEXT PRIMARY KEY,"
        "  user_id     TEXT NOT NULL,"
        "  archived_at INTEGER NOT NULL,"
        "  payload     TEXT NOT NULL"
        ");"

        "CREATE TABLE IF NOT EXISTS stable_concepts ("
        "  concept_id           TEXT PRIMARY KEY,"
        "  user_id              TEXT NOT NULL,"
        "  name                 TEXT NOT NULL,"
        "  display_name         TEXT NOT NULL,"
        "  concept_type         TEXT NOT NULL,"
        "  description          TEXT NOT NULL,"
        "  definition           TEXT NOT NULL,"
        "  version              INTEGER NOT NULL,"
        "  parent_concept_id    TEXT,"
        "  deprecated           INTEGER NOT NULL DEFAULT 0,"
        "  superseded_by        TEXT,"
        "  deprecated_at        INTEGER,"
        "  deprecation_reason   TEXT NOT NULL DEFAULT '',"
        "  derived_from_views   TEXT NOT NULL,"
        "  promotion_confidence REAL NOT NULL,"
        "  created_at           INTEGER NOT NULL,"
        "  UNIQUE (user_id, name, version)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_concepts_user_name ON stable_concepts(user_id, name);"

        "CREATE TABLE IF NOT EXISTS audit_log ("
        "  audit_id      TEXT PRIMARY KEY,"
        "  consumer_id   TEXT NOT NULL,"
        "  user_id       TEXT NOT NULL,"
        "  operation     TEXT NOT NULL,"
        "  target        TEXT NOT NULL,"
        "  timestamp     INTEGER NOT NULL,"
        "  success       INTEGER NOT NULL,"
        "  result_count  INTEGER NOT NULL,"
        "  error_message TEXT NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_audit_user ON audit_log(user_id, timestamp);"
    );
}

void SqliteStore::run_in_transaction(const std::function<void()>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    // Nested calls join the outer transaction
    if (transaction_depth_ > 0) {
        ++transaction_depth_;
        try {
            fn();
        } catch (const std::exception&) {
            --transaction_depth_;
            throw;
        }
        --transaction_depth_;
        return;
    }

    exec("BEGIN IMMEDIATE;");
    ++transaction_depth_;
    try {
        fn();
    } catch (const std::exception&) {
        --transaction_depth_;
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    --transaction_depth_;
    exec("COMMIT;");
}

// ============================================================================
// Raw inputs
// ============================================================================

void SqliteStore::insert_raw_input(const RawInput& raw) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_,
        "INSERT INTO raw_inputs (raw_id, user_id, content, context, received_at, event_count) "
        "VALUES (?, ?, ?, ?, ?, ?)", g);
    bind_text(g.stmt, 1, raw.raw_id);
    bind_text(g.stmt, 2, raw.user_id);
    bind_text(g.stmt, 3, raw.content);
    bind_text(g.stmt, 4, raw.context);
    sqlite3_bind_int64(g.stmt, 5, raw.received_at);
    sqlite3_bind_int(g.stmt, 6, raw.event_count);
    step(db_, g.stmt, "insert_raw_input");
}

void SqliteStore::set_raw_event_count(const std::string& raw_id, int event_count) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "UPDATE raw_inputs SET event_count = ? WHERE raw_id = ?", g);
    sqlite3_bind_int(g.stmt, 1, event_count);
    bind_text(g.stmt, 2, raw_id);
    step(db_, g.stmt, "set_raw_event_count");
}

std::vector<RawInput> SqliteStore::list_raw_inputs(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_,
        "SELECT raw_id, user_id, content, context, received_at, event_count "
        "FROM raw_inputs WHERE user_id = ? ORDER BY received_at ASC, raw_id ASC", g);
    bind_text(g.stmt, 1, user_id);

    std::vector<RawInput> result;
    while (step(db_, g.stmt, "list_raw_inputs") == SQLITE_ROW) {
        RawInput raw;
        raw.raw_id = column_text(g.stmt, 0);
        raw.user_id = column_text(g.stmt, 1);
        raw.content = column_text(g.stmt, 2);
        raw.context = column_text(g.stmt, 3);
        raw.received_at = sqlite3_column_int64(g.stmt, 4);
        raw.event_count = sqlite3_column_int(g.stmt, 5);
        result.push_back(std::move(raw));
    }
    return result;
}

// ============================================================================
// Events
// ============================================================================

void SqliteStore::insert_event(const Event& event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("INSERT INTO events (") + kEventColumns +
                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", g);
    bind_text(g.stmt, 1, event.event_id);
    bind_text(g.stmt, 2, event.user_id);
    sqlite3_bind_int64(g.stmt, 3, event.timestamp);
    bind_text(g.stmt, 4, event.actor);
    bind_text(g.stmt, 5, event.action);
    bind_text(g.stmt, 6, event.target);
    if (event.quantity) sqlite3_bind_double(g.stmt, 7, *event.quantity);
    else sqlite3_bind_null(g.stmt, 7);
    bind_optional_text(g.stmt, 8, event.unit);
    sqlite3_bind_double(g.stmt, 9, event.confidence);
    bind_text(g.stmt, 10, event.source_reference);
    bind_text(g.stmt, 11, event.extractor);
    step(db_, g.stmt, "insert_event");
}

std::optional<Event> SqliteStore::get_event(const std::string& event_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kEventColumns + " FROM events WHERE event_id = ?", g);
    bind_text(g.stmt, 1, event_id);
    if (step(db_, g.stmt, "get_event") == SQLITE_ROW) {
        return read_event(g.stmt);
    }
    return std::nullopt;
}

std::unique_ptr<EventCursor> SqliteStore::query_events(const EventFilter& filter) {
    return std::make_unique<SqliteEventCursor>(*this, filter);
}

size_t SqliteStore::count_events(const EventFilter& filter) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, "SELECT COUNT(*) FROM events" + filter_clause(filter), g);
    bind_filter(g.stmt, filter);
    step(db_, g.stmt, "count_events");
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

size_t SqliteStore::archive_events(Timestamp older_than) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t moved = 0;

    // Copy and delete inside SQLite so the batch never passes through memory
    run_in_transaction([&]() {
        StmtGuard ins;
        prepare(db_, std::string("INSERT OR REPLACE INTO events_archive (") + kEventColumns +
                     ", archived_at) SELECT " + kEventColumns + ", ? FROM events WHERE timestamp < ?", ins);
        sqlite3_bind_int64(ins.stmt, 1, now_utc());
        sqlite3_bind_int64(ins.stmt, 2, older_than);
        step(db_, ins.stmt, "archive_events:insert");

        StmtGuard del;
        prepare(db_, "DELETE FROM events WHERE timestamp < ?", del);
        sqlite3_bind_int64(del.stmt, 1, older_than);
        step(db_, del.stmt, "archive_events:delete");
        moved = static_cast<size_t>(sqlite3_changes(db_));
    });

    return moved;
}

std::vector<Event> SqliteStore::list_archived_events(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kEventColumns + " FROM events_archive WHERE user_id = ? "
                 "ORDER BY timestamp ASC, event_id ASC", g);
    bind_text(g.stmt, 1, user_id);

    std::vector<Event> result;
    while (step(db_, g.stmt, "list_archived_events") == SQLITE_ROW) {
        result.push_back(read_event(g.stmt));
    }
    return result;
}

// ============================================================================
// Entities
// ============================================================================

std::optional<Entity> SqliteStore::find_entity(const std::string& user_id,
                                               const std::string& canonical_name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kEntityColumns +
                 " FROM entities WHERE user_id = ? AND canonical_name = ?", g);
    bind_text(g.stmt, 1, user_id);
    bind_text(g.stmt, 2, canonical_name);
    if (step(db_, g.stmt, "find_entity") == SQLITE_ROW) {
        return read_entity(g.stmt);
    }
    return std::nullopt;
}

std::vector<Entity> SqliteStore::list_entities(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kEntityColumns +
                 " FROM entities WHERE user_id = ? ORDER BY first_seen ASC, canonical_name ASC", g);
    bind_text(g.stmt, 1, user_id);

    std::vector<Entity> result;
    while (step(db_, g.stmt, "list_entities") == SQLITE_ROW) {
        result.push_back(read_entity(g.stmt));
    }
    return result;
}

void SqliteStore::insert_entity(const Entity& entity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("INSERT INTO entities (") + kEntityColumns +
                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", g);
    bind_text(g.stmt, 1, entity.entity_id);
    bind_text(g.stmt, 2, entity.user_id);
    bind_text(g.stmt, 3, entity.canonical_name);
    bind_text(g.stmt, 4, entity.entity_type);
    sqlite3_bind_double(g.stmt, 5, entity.type_confidence);
    bind_text(g.stmt, 6, attributes_json(entity).dump());
    bind_text(g.stmt, 7, json(entity.context_profile).dump());
    sqlite3_bind_int64(g.stmt, 8, entity.first_seen);
    sqlite3_bind_int64(g.stmt, 9, entity.last_seen);
    sqlite3_bind_int(g.stmt, 10, entity.mention_count);
    step(db_, g.stmt, "insert_entity");
}

void SqliteStore::update_entity(const Entity& entity) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_,
        "UPDATE entities SET entity_type = ?, type_confidence = ?, attributes = ?, "
        "context_profile = ?, last_seen = ?, mention_count = ? WHERE entity_id = ?", g);
    bind_text(g.stmt, 1, entity.entity_type);
    sqlite3_bind_double(g.stmt, 2, entity.type_confidence);
    bind_text(g.stmt, 3, attributes_json(entity).dump());
    bind_text(g.stmt, 4, json(entity.context_profile).dump());
    sqlite3_bind_int64(g.stmt, 5, entity.last_seen);
    sqlite3_bind_int(g.stmt, 6, entity.mention_count);
    bind_text(g.stmt, 7, entity.entity_id);
    step(db_, g.stmt, "update_entity");
}

// ============================================================================
// Relations
// ============================================================================

std::optional<EntityRelationship> SqliteStore::find_relation(
    const std::string& user_id,
    const std::string& source_entity_id,
    const std::string& target_entity_id,
    const std::string& relation_type
) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kRelationColumns +
                 " FROM entity_relations WHERE user_id = ? AND source_entity_id = ? "
                 "AND target_entity_id = ? AND relation_type = ?", g);
    bind_text(g.stmt, 1, user_id);
    bind_text(g.stmt, 2, source_entity_id);
    bind_text(g.stmt, 3, target_entity_id);
    bind_text(g.stmt, 4, relation_type);
    if (step(db_, g.stmt, "find_relation") == SQLITE_ROW) {
        return read_relation(g.stmt);
    }
    return std::nullopt;
}

void SqliteStore::upsert_relation(const EntityRelationship& relation) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("INSERT INTO entity_relations (") + kRelationColumns +
                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                 "ON CONFLICT(relation_id) DO UPDATE SET strength = excluded.strength, "
                 "co_occurrence_count = excluded.co_occurrence_count, "
                 "weighted_count = excluded.weighted_count, last_seen = excluded.last_seen", g);
    bind_text(g.stmt, 1, relation.relation_id);
    bind_text(g.stmt, 2, relation.user_id);
    bind_text(g.stmt, 3, relation.source_entity_id);
    bind_text(g.stmt, 4, relation.target_entity_id);
    bind_text(g.stmt, 5, relation.relation_type);
    sqlite3_bind_double(g.stmt, 6, relation.strength);
    sqlite3_bind_int(g.stmt, 7, relation.co_occurrence_count);
    sqlite3_bind_double(g.stmt, 8, relation.weighted_count);
    sqlite3_bind_int64(g.stmt, 9, relation.first_seen);
    sqlite3_bind_int64(g.stmt, 10, relation.last_seen);
    step(db_, g.stmt, "upsert_relation");
}

std::vector<EntityRelationship> SqliteStore::list_relations(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kRelationColumns +
                 " FROM entity_relations WHERE user_id = ? ORDER BY strength DESC, relation_id ASC", g);
    bind_text(g.stmt, 1, user_id);

    std::vector<EntityRelationship> result;
    while (step(db_, g.stmt, "list_relations") == SQLITE_ROW) {
        result.push_back(read_relation(g.stmt));
    }
    return result;
}

// ============================================================================
// Views
// ============================================================================

void SqliteStore::insert_view(const DerivedView& view) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("INSERT INTO cognitive_views (") + kViewColumns +
                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", g);
    bind_text(g.stmt, 1, view.view_id);
    bind_text(g.stmt, 2, view.user_id);
    bind_text(g.stmt, 3, view.hypothesis);
    bind_text(g.stmt, 4, view.view_type);
    bind_text(g.stmt, 5, view.subject);
    bind_text(g.stmt, 6, view.action);
    bind_text(g.stmt, 7, view.context_tag);
    bind_text(g.stmt, 8, json(view.derived_from).dump());
    bind_text(g.stmt, 9, json(view.counter_evidence).dump());
    sqlite3_bind_double(g.stmt, 10, view.confidence);
    sqlite3_bind_int(g.stmt, 11, view.validation_count);
    sqlite3_bind_int64(g.stmt, 12, view.created_at);
    sqlite3_bind_int64(g.stmt, 13, view.expires_at);
    sqlite3_bind_int64(g.stmt, 14, view.updated_at);
    bind_text(g.stmt, 15, view_status_to_string(view.status));
    bind_text(g.stmt, 16, view.source);
    sqlite3_bind_int(g.stmt, 17, view.revision);
    step(db_, g.stmt, "insert_view");
}

std::optional<DerivedView> SqliteStore::get_view(const std::string& view_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kViewColumns +
                 " FROM cognitive_views WHERE view_id = ?", g);
    bind_text(g.stmt, 1, view_id);
    if (step(db_, g.stmt, "get_view") == SQLITE_ROW) {
        return read_view(g.stmt);
    }
    return std::nullopt;
}

std::vector<DerivedView> SqliteStore::list_views(const std::string& user_id,
                                                 std::optional<ViewStatus> status) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    std::string sql = std::string("SELECT ") + kViewColumns +
                      " FROM cognitive_views WHERE user_id = ?";
    if (status) sql += " AND status = ?";
    sql += " ORDER BY created_at ASC, view_id ASC";
    prepare(db_, sql, g);
    bind_text(g.stmt, 1, user_id);
    if (status) bind_text(g.stmt, 2, view_status_to_string(*status));

    std::vector<DerivedView> result;
    while (step(db_, g.stmt, "list_views") == SQLITE_ROW) {
        result.push_back(read_view(g.stmt));
    }
    return result;
}

bool SqliteStore::update_view(const DerivedView& view, int expected_revision) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto current = get_view(view.view_id);
    if (!current) {
        throw std::logic_error("update_view: unknown view " + view.view_id);
    }
    if (current->revision != expected_revision) {
        return false;
    }
    if (is_terminal(current->status) && view.status != current->status) {
        throw std::logic_error("update_view: view " + view.view_id + " is " +
                               view_status_to_string(current->status) +
                               " and cannot move to " + view_status_to_string(view.status));
    }

    StmtGuard g;
    prepare(db_,
        "UPDATE cognitive_views SET hypothesis = ?, context_tag = ?, derived_from = ?, "
        "counter_evidence = ?, confidence = ?, validation_count = ?, expires_at = ?, "
        "updated_at = ?, status = ?, revision = ? WHERE view_id = ? AND revision = ?", g);
    bind_text(g.stmt, 1, view.hypothesis);
    bind_text(g.stmt, 2, view.context_tag);
    bind_text(g.stmt, 3, json(view.derived_from).dump());
    bind_text(g.stmt, 4, json(view.counter_evidence).dump());
    sqlite3_bind_double(g.stmt, 5, view.confidence);
    sqlite3_bind_int(g.stmt, 6, view.validation_count);
    sqlite3_bind_int64(g.stmt, 7, view.expires_at);
    sqlite3_bind_int64(g.stmt, 8, view.updated_at);
    bind_text(g.stmt, 9, view_status_to_string(view.status));
    sqlite3_bind_int(g.stmt, 10, expected_revision + 1);
    bind_text(g.stmt, 11, view.view_id);
    sqlite3_bind_int(g.stmt, 12, expected_revision);
    step(db_, g.stmt, "update_view");

    return sqlite3_changes(db_) == 1;
}

size_t SqliteStore::archive_views(Timestamp older_than) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t moved = 0;

    run_in_transaction([&]() {
        std::vector<DerivedView> batch;
        {
            StmtGuard g;
            prepare(db_, std::string("SELECT ") + kViewColumns +
                         " FROM cognitive_views WHERE status != 'active' AND updated_at < ?", g);
            sqlite3_bind_int64(g.stmt, 1, older_than);
            while (step(db_, g.stmt, "archive_views:select") == SQLITE_ROW) {
                batch.push_back(read_view(g.stmt));
            }
        }

        Timestamp archived_at = now_utc();
        for (const auto& view : batch) {
            StmtGuard ins;
            prepare(db_,
                "INSERT OR REPLACE INTO views_archive (view_id, user_id, archived_at, payload) "
                "VALUES (?, ?, ?, ?)", ins);
            bind_text(ins.stmt, 1, view.view_id);
            bind_text(ins.stmt, 2, view.user_id);
            sqlite3_bind_int64(ins.stmt, 3, archived_at);
            bind_text(ins.stmt, 4, view.to_json().dump());
            step(db_, ins.stmt, "archive_views:insert");

            StmtGuard del;
            prepare(db_, "DELETE FROM cognitive_views WHERE view_id = ?", del);
            bind_text(del.stmt, 1, view.view_id);
            step(db_, del.stmt, "archive_views:delete");
            ++moved;
        }
    });

    return moved;
}

// ============================================================================
// Concepts
// ============================================================================

void SqliteStore::insert_concept(const StableConcept& c) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("INSERT INTO stable_concepts (") + kConceptColumns +
                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", g);
    bind_text(g.stmt, 1, c.concept_id);
    bind_text(g.stmt, 2, c.user_id);
    bind_text(g.stmt, 3, c.name);
    bind_text(g.stmt, 4, c.display_name);
    bind_text(g.stmt, 5, c.concept_type);
    bind_text(g.stmt, 6, c.description);
    bind_text(g.stmt, 7, c.definition.dump());
    sqlite3_bind_int(g.stmt, 8, c.version);
    bind_optional_text(g.stmt, 9, c.parent_concept_id);
    sqlite3_bind_int(g.stmt, 10, c.deprecated ? 1 : 0);
    bind_optional_text(g.stmt, 11, c.superseded_by);
    if (c.deprecated_at) sqlite3_bind_int64(g.stmt, 12, *c.deprecated_at);
    else sqlite3_bind_null(g.stmt, 12);
    bind_text(g.stmt, 13, c.deprecation_reason);
    bind_text(g.stmt, 14, json(c.derived_from_views).dump());
    sqlite3_bind_double(g.stmt, 15, c.promotion_confidence);
    sqlite3_bind_int64(g.stmt, 16, c.created_at);
    step(db_, g.stmt, "insert_concept");
}

void SqliteStore::mark_concept_deprecated(const std::string& concept_id,
                                          const std::optional<std::string>& superseded_by,
                                          Timestamp deprecated_at,
                                          const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_,
        "UPDATE stable_concepts SET deprecated = 1, superseded_by = ?, deprecated_at = ?, "
        "deprecation_reason = ? WHERE concept_id = ? AND deprecated = 0", g);
    bind_optional_text(g.stmt, 1, superseded_by);
    sqlite3_bind_int64(g.stmt, 2, deprecated_at);
    bind_text(g.stmt, 3, reason);
    bind_text(g.stmt, 4, concept_id);
    step(db_, g.stmt, "mark_concept_deprecated");
}

std::optional<StableConcept> SqliteStore::get_concept(const std::string& concept_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kConceptColumns +
                 " FROM stable_concepts WHERE concept_id = ?", g);
    bind_text(g.stmt, 1, concept_id);
    if (step(db_, g.stmt, "get_concept") == SQLITE_ROW) {
        return read_concept(g.stmt);
    }
    return std::nullopt;
}

std::optional<StableConcept> SqliteStore::find_active_concept(const std::string& user_id,
                                                              const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kConceptColumns +
                 " FROM stable_concepts WHERE user_id = ? AND name = ? AND deprecated = 0 "
                 "ORDER BY version DESC LIMIT 1", g);
    bind_text(g.stmt, 1, user_id);
    bind_text(g.stmt, 2, name);
    if (step(db_, g.stmt, "find_active_concept") == SQLITE_ROW) {
        return read_concept(g.stmt);
    }
    return std::nullopt;
}

std::vector<StableConcept> SqliteStore::list_concepts(const std::string& user_id,
                                                      bool active_only) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    std::string sql = std::string("SELECT ") + kConceptColumns +
                      " FROM stable_concepts WHERE user_id = ?";
    if (active_only) sql += " AND deprecated = 0";
    sql += " ORDER BY name ASC, version ASC";
    prepare(db_, sql, g);
    bind_text(g.stmt, 1, user_id);

    std::vector<StableConcept> result;
    while (step(db_, g.stmt, "list_concepts") == SQLITE_ROW) {
        result.push_back(read_concept(g.stmt));
    }
    return result;
}

std::vector<StableConcept> SqliteStore::concept_history(const std::string& user_id,
                                                        const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kConceptColumns +
                 " FROM stable_concepts WHERE user_id = ? AND name = ? ORDER BY version ASC", g);
    bind_text(g.stmt, 1, user_id);
    bind_text(g.stmt, 2, name);

    std::vector<StableConcept> result;
    while (step(db_, g.stmt, "concept_history") == SQLITE_ROW) {
        result.push_back(read_concept(g.stmt));
    }
    return result;
}

// ============================================================================
// Audit
// ============================================================================

void SqliteStore::append_audit(const AuditEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_,
        "INSERT INTO audit_log (audit_id, consumer_id, user_id, operation, target, timestamp, "
        "success, result_count, error_message) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)", g);
    bind_text(g.stmt, 1, entry.audit_id);
    bind_text(g.stmt, 2, entry.consumer_id);
    bind_text(g.stmt, 3, entry.user_id);
    bind_text(g.stmt, 4, entry.operation);
    bind_text(g.stmt, 5, entry.target);
    sqlite3_bind_int64(g.stmt, 6, entry.timestamp);
    sqlite3_bind_int(g.stmt, 7, entry.success ? 1 : 0);
    sqlite3_bind_int(g.stmt, 8, entry.result_count);
    bind_text(g.stmt, 9, entry.error_message);
    step(db_, g.stmt, "append_audit");
}

std::vector<AuditEntry> SqliteStore::list_audit(const std::string& user_id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    StmtGuard g;
    prepare(db_,
        "SELECT audit_id, consumer_id, user_id, operation, target, timestamp, success, "
        "result_count, error_message FROM audit_log WHERE user_id = ? "
        "ORDER BY timestamp ASC, rowid ASC", g);
    bind_text(g.stmt, 1, user_id);

    std::vector<AuditEntry> result;
    while (step(db_, g.stmt, "list_audit") == SQLITE_ROW) {
        AuditEntry entry;
        entry.audit_id = column_text(g.stmt, 0);
        entry.consumer_id = column_text(g.stmt, 1);
        entry.user_id = column_text(g.stmt, 2);
        entry.operation = column_text(g.stmt, 3);
        entry.target = column_text(g.stmt, 4);
        entry.timestamp = sqlite3_column_int64(g.stmt, 5);
        entry.success = sqlite3_column_int(g.stmt, 6) != 0;
        entry.result_count = sqlite3_column_int(g.stmt, 7);
        entry.error_message = column_text(g.stmt, 8);
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace cogmem
