#pragma once

#include "cogmem/core/time_utils.hpp"
#include "cogmem/storage/memory_store.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace cogmem {

/**
 * @brief Full per-user dump for backup and portability
 *
 * Output layout:
 * {
 *   "version": "1.0.0", "user_id": ..., "exported_at": ...,
 *   "raw_inputs": [...], "events": [...], "archived_events": [...],
 *   "entities": [...], "relations": [...], "views": [...],
 *   "concepts": [...], "audit_log": [...],
 *   "metadata": {"counts": {...}, "export_duration_secs": ...}
 * }
 */
class DataExporter {
public:
    static constexpr const char* kFormatVersion = "1.0.0";

    explicit DataExporter(MemoryStore& store);

    nlohmann::json export_user(const std::string& user_id, Timestamp now) const;

    /**
     * @brief Write export_user() to a file
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void export_to_file(const std::string& user_id, const std::string& path, Timestamp now) const;

private:
    MemoryStore& store_;
};

} // namespace cogmem
