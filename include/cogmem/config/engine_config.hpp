#pragma once

#include "cogmem/cognitive/pattern_detector.hpp"
#include "cogmem/cognitive/promotion_gate.hpp"
#include "cogmem/core/retry.hpp"
#include "cogmem/entity/entity_resolver.hpp"
#include "cogmem/extraction/inference_provider.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace cogmem {

/**
 * @brief When and how widely background sweeps run
 */
struct SchedulerConfig {
    int sweep_event_batch = 20;             ///< New events per user that trigger a sweep
    int sweep_interval_minutes = 60;        ///< Periodic sweep for users with any new events
    int max_parallel_users = 4;             ///< Users swept concurrently
};

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Every tunable of the engine, in one place
 *
 * Thresholds are configuration, not code: sub-configs are handed to the
 * components that own them.
 */
struct EngineConfig {
    // Storage
    std::string database_path = "cogmem.db";    ///< SQLite file, or ":memory:"
    RetryPolicy storage_retry;                  ///< Event-store write retries
    int view_retention_days = 90;               ///< Terminal views older than this are archived
    int event_archive_days = 730;               ///< Events older than this move to the cold tier

    // Components
    InferenceConfig inference;
    ResolverConfig resolver;
    DetectorConfig detector;
    GateConfig gate;
    SchedulerConfig scheduler;
    std::string conflict_lexicon_path;          ///< Optional JSON lexicon override

    bool verbose = false;

    /**
     * @brief Load configuration from JSON file
     *
     * Missing keys keep their defaults.
     *
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (the API key is redacted)
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by COGMEM_* environment variables
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     *
     * @param error_message Receives the first problem found
     */
    bool validate(std::string& error_message) const;

    nlohmann::json to_json(bool redact_secrets = true) const;
    static EngineConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Load config from a given path, then ./.cogmem.json, then the environment
 */
EngineConfig load_config_with_fallback(const std::string& config_path);

} // namespace cogmem
