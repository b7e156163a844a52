#include "cogmem/consumer/access_gateway.hpp"
#include "cogmem/core/errors.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <iostream>

namespace cogmem {

using json = nlohmann::json;

std::string access_level_to_string(AccessLevel level) {
    switch (level) {
        case AccessLevel::ReadOnly: return "read_only";
        case AccessLevel::ReadWriteDerived: return "read_write_derived";
        default: return "read_only";
    }
}

json UsageStatistics::to_json() const {
    return {
        {"user_id", user_id},
        {"from", to_iso8601(from)},
        {"to", to_iso8601(to)},
        {"event_count", event_count},
        {"entity_count", entity_count},
        {"view_count", view_count},
        {"active_view_count", active_view_count},
        {"concept_count", concept_count},
        {"actions", actions},
        {"computed_at", to_iso8601(computed_at)},
        {"stale", stale}
    };
}

AccessGateway::AccessGateway(MemoryStore& store, double llm_discount, int view_ttl_days)
    : store_(store), llm_discount_(llm_discount), view_ttl_days_(view_ttl_days) {}

void AccessGateway::register_consumer(const std::string& consumer_id, AccessLevel level) {
    if (trim(consumer_id).empty()) {
        throw ValidationError("consumer id is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    consumers_[consumer_id] = level;
}

std::optional<AccessLevel> AccessGateway::access_level(const std::string& consumer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = consumers_.find(consumer_id);
    if (it == consumers_.end()) return std::nullopt;
    return it->second;
}

// ============================================================================
// Audit and permission checks
// ============================================================================

void AccessGateway::audit(const std::string& consumer_id,
                          const std::string& user_id,
                          const std::string& operation,
                          const std::string& target,
                          Timestamp now,
                          bool success,
                          int result_count,
                          const std::string& error_message) {
    AuditEntry entry;
    entry.audit_id = generate_id("audit");
    entry.consumer_id = consumer_id;
    entry.user_id = user_id;
    entry.operation = operation;
    entry.target = target;
    entry.timestamp = now;
    entry.success = success;
    entry.result_count = result_count;
    entry.error_message = error_message;

    try {
        store_.append_audit(entry);
    } catch (const StorageUnavailable& e) {
        // The call itself already has an outcome; report the lost audit row loudly
        std::cerr << "AUDIT LOST " << entry.to_json().dump() << ": " << e.what() << std::endl;
    }
}

void AccessGateway::require(const std::string& consumer_id,
                            const std::string& user_id,
                            AccessLevel needed,
                            const std::string& operation,
                            Timestamp now) {
    auto level = access_level(consumer_id);
    if (!level) {
        std::string message = "unknown consumer '" + consumer_id + "'";
        audit(consumer_id, user_id, operation, "", now, false, 0, message);
        throw PermissionDenied(message);
    }
    if (static_cast<int>(*level) < static_cast<int>(needed)) {
        std::string message = "consumer '" + consumer_id + "' has " + access_level_to_string(*level) +
                              ", " + operation + " needs " + access_level_to_string(needed);
        audit(consumer_id, user_id, operation, "", now, false, 0, message);
        throw PermissionDenied(message);
    }
}

// ============================================================================
// Read operations
// ============================================================================

UsageStatistics AccessGateway::query_statistics(const std::string& consumer_id,
                                                const std::string& user_id,
                                                Timestamp from,
                                                Timestamp to,
                                                Timestamp now) {
    const std::string operation = "query_statistics";
    require(consumer_id, user_id, AccessLevel::ReadOnly, operation, now);

    const std::string cache_key = user_id + "|" + std::to_string(from) + "|" + std::to_string(to);

    try {
        UsageStatistics stats;
        stats.user_id = user_id;
        stats.from = from;
        stats.to = to;
        stats.computed_at = now;

        EventFilter filter;
        filter.user_id = user_id;
        filter.from = from;
        filter.to = to;
        stats.event_count = store_.count_events(filter);

        auto cursor = store_.query_events(filter);
        Event event;
        while (cursor->next(event)) {
            stats.actions[event.action]++;
        }

        stats.entity_count = store_.list_entities(user_id).size();
        auto views = store_.list_views(user_id);
        stats.view_count = views.size();
        stats.active_view_count = static_cast<size_t>(std::count_if(views.begin(), views.end(),
            [](const DerivedView& v) { return v.status == ViewStatus::Active; }));
        stats.concept_count = store_.list_concepts(user_id, true).size();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            statistics_cache_[cache_key] = stats;
            statistics_cache_[user_id] = stats;
        }

        audit(consumer_id, user_id, operation, cache_key, now, true, static_cast<int>(stats.event_count));
        return stats;
    } catch (const StorageUnavailable& e) {
        std::optional<UsageStatistics> cached;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = statistics_cache_.find(cache_key);
            if (it == statistics_cache_.end()) it = statistics_cache_.find(user_id);
            if (it != statistics_cache_.end()) cached = it->second;
        }
        if (!cached) {
            audit(consumer_id, user_id, operation, cache_key, now, false, 0, e.what());
            throw;
        }
        cached->stale = true;
        audit(consumer_id, user_id, operation, cache_key, now, true,
              static_cast<int>(cached->event_count), std::string("served stale: ") + e.what());
        return *cached;
    }
}

std::vector<DerivedView> AccessGateway::list_active_views(const std::string& consumer_id,
                                                          const std::string& user_id,
                                                          Timestamp now) {
    const std::string operation = "list_active_views";
    require(consumer_id, user_id, AccessLevel::ReadOnly, operation, now);

    try {
        auto views = store_.list_views(user_id, ViewStatus::Active);
        audit(consumer_id, user_id, operation, "", now, true, static_cast<int>(views.size()));
        return views;
    } catch (const CogmemError& e) {
        audit(consumer_id, user_id, operation, "", now, false, 0, e.what());
        throw;
    }
}

std::vector<Entity> AccessGateway::query_entities(const std::string& consumer_id,
                                                  const std::string& user_id,
                                                  Timestamp now) {
    const std::string operation = "query_entities";
    require(consumer_id, user_id, AccessLevel::ReadOnly, operation, now);

    try {
        auto entities = store_.list_entities(user_id);
        audit(consumer_id, user_id, operation, "", now, true, static_cast<int>(entities.size()));
        return entities;
    } catch (const CogmemError& e) {
        audit(consumer_id, user_id, operation, "", now, false, 0, e.what());
        throw;
    }
}

// ============================================================================
// Write operations
// ============================================================================

std::string AccessGateway::propose_view(const std::string& consumer_id,
                                        const std::string& user_id,
                                        const std::string& hypothesis,
                                        const std::string& view_type,
                                        const std::vector<std::string>& evidence_event_ids,
                                        double confidence,
                                        Timestamp now) {
    const std::string operation = "propose_view";
    require(consumer_id, user_id, AccessLevel::ReadWriteDerived, operation, now);

    try {
        // Evidence that agrees on one action and target gives the view a
        // structured subject, so later events can support or contradict it
        std::string subject;
        std::string action;
        bool agreed = true;
        for (const auto& event_id : evidence_event_ids) {
            auto event = store_.get_event(event_id);
            if (!event || event->user_id != user_id) {
                throw ValidationError("evidence " + event_id + " is not an event of user " + user_id);
            }
            if (action.empty()) {
                action = event->action;
                subject = event->target;
            } else if (event->action != action || event->target != subject) {
                agreed = false;
            }
        }
        if (!agreed) {
            subject.clear();
            action.clear();
        }
        if (!(confidence >= 0.0 && confidence <= 1.0)) {
            throw ValidationError("proposed confidence must be within [0, 1]");
        }

        DerivedView view = DerivedView::create(
            user_id, hypothesis, view_type.empty() ? view_types::Pattern : view_type,
            subject, action, evidence_event_ids, confidence * llm_discount_, now, view_ttl_days_);
        view.source = "consumer:" + consumer_id;
        store_.insert_view(view);

        audit(consumer_id, user_id, operation, view.view_id, now, true, 1);
        return view.view_id;
    } catch (const CogmemError& e) {
        audit(consumer_id, user_id, operation, hypothesis, now, false, 0, e.what());
        throw;
    }
}

void AccessGateway::submit_event(const std::string& consumer_id, const Event& event, Timestamp now) {
    std::string message = "consumer '" + consumer_id + "' may not write events";
    audit(consumer_id, event.user_id, "submit_event", event.action + " " + event.target, now, false, 0, message);
    throw PermissionDenied(message);
}

void AccessGateway::write_concept(const std::string& consumer_id, const StableConcept& concept_row, Timestamp now) {
    std::string message = "consumer '" + consumer_id + "' may not write stable concepts";
    audit(consumer_id, concept_row.user_id, "write_concept", concept_row.name, now, false, 0, message);
    throw PermissionDenied(message);
}

std::vector<AuditEntry> AccessGateway::audit_log(const std::string& user_id) const {
    return store_.list_audit(user_id);
}

} // namespace cogmem
