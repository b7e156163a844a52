#pragma once

#include "cogmem/core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace cogmem {

/**
 * @brief One crossing of the consumer boundary (who, what, when, result size)
 */
struct AuditEntry {
    std::string audit_id;
    std::string consumer_id;
    std::string user_id;
    std::string operation;                 ///< "query_statistics", "propose_view", ...
    std::string target;
    Timestamp timestamp = 0;
    bool success = false;
    int result_count = 0;
    std::string error_message;

    nlohmann::json to_json() const {
        return {
            {"audit_id", audit_id},
            {"consumer_id", consumer_id},
            {"user_id", user_id},
            {"operation", operation},
            {"target", target},
            {"timestamp", to_iso8601(timestamp)},
            {"success", success},
            {"result_count", result_count},
            {"error_message", error_message}
        };
    }
};

} // namespace cogmem
