#include "cogmem/export/data_exporter.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace cogmem {

using json = nlohmann::json;

DataExporter::DataExporter(MemoryStore& store) : store_(store) {}

json DataExporter::export_user(const std::string& user_id, Timestamp now) const {
    auto start = std::chrono::steady_clock::now();

    json raw_inputs = json::array();
    for (const auto& raw : store_.list_raw_inputs(user_id)) {
        raw_inputs.push_back(raw.to_json());
    }

    json events = json::array();
    EventFilter filter;
    filter.user_id = user_id;
    auto cursor = store_.query_events(filter);
    Event event;
    while (cursor->next(event)) {
        events.push_back(event.to_json());
    }

    json archived = json::array();
    for (const auto& e : store_.list_archived_events(user_id)) {
        archived.push_back(e.to_json());
    }

    json entities = json::array();
    for (const auto& entity : store_.list_entities(user_id)) {
        entities.push_back(entity.to_json());
    }

    json relations = json::array();
    for (const auto& rel : store_.list_relations(user_id)) {
        relations.push_back(rel.to_json());
    }

    json views = json::array();
    for (const auto& view : store_.list_views(user_id)) {
        views.push_back(view.to_json());
    }

    json concepts = json::array();
    for (const auto& c : store_.list_concepts(user_id, false)) {
        concepts.push_back(c.to_json());
    }

    json audit = json::array();
    for (const auto& entry : store_.list_audit(user_id)) {
        audit.push_back(entry.to_json());
    }

    auto end = std::chrono::steady_clock::now();

    json j;
    j["version"] = kFormatVersion;
    j["user_id"] = user_id;
    j["exported_at"] = to_iso8601(now);
    j["raw_inputs"] = raw_inputs;
    j["events"] = events;
    j["archived_events"] = archived;
    j["entities"] = entities;
    j["relations"] = relations;
    j["views"] = views;
    j["concepts"] = concepts;
    j["audit_log"] = audit;
    j["metadata"] = {
        {"counts", {
            {"raw_inputs", raw_inputs.size()},
            {"events", events.size()},
            {"archived_events", archived.size()},
            {"entities", entities.size()},
            {"relations", relations.size()},
            {"views", views.size()},
            {"concepts", concepts.size()},
            {"audit_log", audit.size()}
        }},
        {"export_duration_secs", std::chrono::duration<double>(end - start).count()}
    };
    return j;
}

void DataExporter::export_to_file(const std::string& user_id, const std::string& path, Timestamp now) const {
    json j = export_user(user_id, now);

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open export file: " + path);
    }
    file << j.dump(2);
    if (!file) {
        throw std::runtime_error("Failed to write export file: " + path);
    }
}

} // namespace cogmem
