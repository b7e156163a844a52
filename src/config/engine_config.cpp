#include "cogmem/config/engine_config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>
#include <vector>

namespace cogmem {

using json = nlohmann::json;

namespace {

const char* const kRedacted = "***REDACTED***";

template<typename T>
void read_if_present(const json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j[key].get<T>();
    }
}

void env_int(const char* name, int& target) {
    const char* value = std::getenv(name);
    if (!value) return;
    try {
        target = std::stoi(value);
    } catch (const std::exception&) {
        std::cerr << "Ignoring non-numeric " << name << "=" << value << std::endl;
    }
}

void env_double(const char* name, double& target) {
    const char* value = std::getenv(name);
    if (!value) return;
    try {
        target = std::stod(value);
    } catch (const std::exception&) {
        std::cerr << "Ignoring non-numeric " << name << "=" << value << std::endl;
    }
}

bool in_unit_range(double v) {
    return v >= 0.0 && v <= 1.0;
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

json EngineConfig::to_json(bool redact_secrets) const {
    json j;

    j["database_path"] = database_path;
    j["storage_max_attempts"] = storage_retry.max_attempts;
    j["storage_base_delay_ms"] = storage_retry.base_delay_ms;
    j["view_retention_days"] = view_retention_days;
    j["event_archive_days"] = event_archive_days;

    // Inference
    j["inference_provider"] = inference.provider;
    j["inference_api_key"] = (redact_secrets && !inference.api_key.empty()) ? kRedacted : inference.api_key;
    j["inference_model"] = inference.model;
    j["inference_host"] = inference.api_base_url;
    j["inference_temperature"] = inference.temperature;
    j["inference_max_tokens"] = inference.max_tokens;
    j["inference_timeout_seconds"] = inference.timeout_seconds;
    j["inference_max_retries"] = inference.max_retries;

    // Entity resolution
    j["fuzzy_match_threshold"] = resolver.fuzzy_match_threshold;
    j["context_score_threshold"] = resolver.context_score_threshold;
    j["type_conflict_confidence"] = resolver.type_conflict_confidence;
    j["attribute_decay_days"] = resolver.attribute_decay_days;
    j["aliases"] = resolver.aliases;

    // Pattern detection
    j["lookback_days"] = detector.lookback_days;
    j["frequency_threshold"] = detector.frequency_threshold;
    j["hour_bucket_size"] = detector.hour_bucket_size;
    j["llm_discount"] = detector.llm_discount;
    j["preference_ratio"] = detector.preference_ratio;
    j["preference_min_count"] = detector.preference_min_count;
    j["view_ttl_days"] = detector.view_ttl_days;

    // Promotion gate
    j["promote_confidence"] = gate.promote_confidence;
    j["min_age_days"] = gate.min_age_days;
    j["min_validations"] = gate.min_validations;
    j["promote_ratio"] = gate.promote_ratio;
    j["reject_ratio"] = gate.reject_ratio;
    j["confidence_base"] = gate.confidence_base;
    j["confidence_log_weight"] = gate.confidence_log_weight;
    j["counter_penalty"] = gate.counter_penalty;

    // Scheduling
    j["sweep_event_batch"] = scheduler.sweep_event_batch;
    j["sweep_interval_minutes"] = scheduler.sweep_interval_minutes;
    j["max_parallel_users"] = scheduler.max_parallel_users;

    j["conflict_lexicon_path"] = conflict_lexicon_path;
    j["verbose"] = verbose;
    return j;
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    read_if_present(j, "database_path", config.database_path);
    read_if_present(j, "storage_max_attempts", config.storage_retry.max_attempts);
    read_if_present(j, "storage_base_delay_ms", config.storage_retry.base_delay_ms);
    read_if_present(j, "view_retention_days", config.view_retention_days);
    read_if_present(j, "event_archive_days", config.event_archive_days);

    read_if_present(j, "inference_provider", config.inference.provider);
    if (j.contains("inference_api_key") && j["inference_api_key"] != kRedacted) {
        config.inference.api_key = j["inference_api_key"].get<std::string>();
    }
    read_if_present(j, "inference_model", config.inference.model);
    read_if_present(j, "inference_host", config.inference.api_base_url);
    read_if_present(j, "inference_temperature", config.inference.temperature);
    read_if_present(j, "inference_max_tokens", config.inference.max_tokens);
    read_if_present(j, "inference_timeout_seconds", config.inference.timeout_seconds);
    read_if_present(j, "inference_max_retries", config.inference.max_retries);

    read_if_present(j, "fuzzy_match_threshold", config.resolver.fuzzy_match_threshold);
    read_if_present(j, "context_score_threshold", config.resolver.context_score_threshold);
    read_if_present(j, "type_conflict_confidence", config.resolver.type_conflict_confidence);
    read_if_present(j, "attribute_decay_days", config.resolver.attribute_decay_days);
    read_if_present(j, "aliases", config.resolver.aliases);

    read_if_present(j, "lookback_days", config.detector.lookback_days);
    read_if_present(j, "frequency_threshold", config.detector.frequency_threshold);
    read_if_present(j, "hour_bucket_size", config.detector.hour_bucket_size);
    read_if_present(j, "llm_discount", config.detector.llm_discount);
    read_if_present(j, "preference_ratio", config.detector.preference_ratio);
    read_if_present(j, "preference_min_count", config.detector.preference_min_count);
    read_if_present(j, "view_ttl_days", config.detector.view_ttl_days);

    read_if_present(j, "promote_confidence", config.gate.promote_confidence);
    read_if_present(j, "min_age_days", config.gate.min_age_days);
    read_if_present(j, "min_validations", config.gate.min_validations);
    read_if_present(j, "promote_ratio", config.gate.promote_ratio);
    read_if_present(j, "reject_ratio", config.gate.reject_ratio);
    read_if_present(j, "confidence_base", config.gate.confidence_base);
    read_if_present(j, "confidence_log_weight", config.gate.confidence_log_weight);
    read_if_present(j, "counter_penalty", config.gate.counter_penalty);

    read_if_present(j, "sweep_event_batch", config.scheduler.sweep_event_batch);
    read_if_present(j, "sweep_interval_minutes", config.scheduler.sweep_interval_minutes);
    read_if_present(j, "max_parallel_users", config.scheduler.max_parallel_users);

    read_if_present(j, "conflict_lexicon_path", config.conflict_lexicon_path);
    read_if_present(j, "verbose", config.verbose);

    config.inference.verbose = config.verbose;
    config.resolver.verbose = config.verbose;
    config.detector.verbose = config.verbose;
    config.storage_retry.verbose = config.verbose;
    return config;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    try {
        json j;
        file >> j;
        return from_json(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json(true).dump(2) << std::endl;
}

// ============================================================================
// Environment
// ============================================================================

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    if (const char* db = std::getenv("COGMEM_DB_PATH")) config.database_path = db;
    if (const char* provider = std::getenv("COGMEM_INFERENCE_PROVIDER")) config.inference.provider = provider;
    if (const char* model = std::getenv("COGMEM_INFERENCE_MODEL")) config.inference.model = model;
    if (const char* host = std::getenv("COGMEM_INFERENCE_HOST")) config.inference.api_base_url = host;

    const char* api_key = std::getenv("COGMEM_OPENAI_API_KEY");
    if (!api_key) api_key = std::getenv("OPENAI_API_KEY");
    if (api_key) config.inference.api_key = api_key;
    if (config.inference.provider == "openai" && !std::getenv("COGMEM_INFERENCE_MODEL")) {
        config.inference.model = "gpt-4o-mini";
        config.inference.api_base_url = "https://api.openai.com/v1";
    }

    env_int("COGMEM_FREQUENCY_THRESHOLD", config.detector.frequency_threshold);
    env_int("COGMEM_LOOKBACK_DAYS", config.detector.lookback_days);
    env_double("COGMEM_LLM_DISCOUNT", config.detector.llm_discount);
    env_double("COGMEM_PROMOTE_CONFIDENCE", config.gate.promote_confidence);
    env_int("COGMEM_MIN_AGE_DAYS", config.gate.min_age_days);
    env_double("COGMEM_CONFIDENCE_LOG_WEIGHT", config.gate.confidence_log_weight);
    env_int("COGMEM_SWEEP_EVENT_BATCH", config.scheduler.sweep_event_batch);

    if (const char* lexicon = std::getenv("COGMEM_CONFLICT_LEXICON")) config.conflict_lexicon_path = lexicon;

    const char* verbose = std::getenv("COGMEM_VERBOSE");
    if (verbose && std::string(verbose) != "0") {
        config.verbose = true;
        config.inference.verbose = true;
        config.resolver.verbose = true;
        config.detector.verbose = true;
    }

    return config;
}

// ============================================================================
// Validation
// ============================================================================

bool EngineConfig::validate(std::string& error_message) const {
    if (database_path.empty()) {
        error_message = "Database path is required";
        return false;
    }

    if (inference.provider != "ollama" && inference.provider != "openai" && inference.provider != "none") {
        error_message = "Inference provider must be 'ollama', 'openai' or 'none'";
        return false;
    }

    if (inference.provider == "openai" && inference.api_key.empty()) {
        error_message = "OpenAI provider requires an API key";
        return false;
    }

    if (!in_unit_range(resolver.fuzzy_match_threshold) || !in_unit_range(resolver.context_score_threshold) ||
        !in_unit_range(resolver.type_conflict_confidence)) {
        error_message = "Resolver thresholds must be between 0.0 and 1.0";
        return false;
    }

    if (detector.frequency_threshold < 1 || detector.lookback_days < 1 || detector.view_ttl_days < 1) {
        error_message = "Frequency threshold, lookback and view TTL must be positive";
        return false;
    }

    if (detector.hour_bucket_size < 1 || detector.hour_bucket_size > 24) {
        error_message = "Hour bucket size must be between 1 and 24";
        return false;
    }

    if (!in_unit_range(detector.llm_discount) || !in_unit_range(detector.preference_ratio)) {
        error_message = "LLM discount and preference ratio must be between 0.0 and 1.0";
        return false;
    }

    if (!in_unit_range(gate.promote_confidence) || !in_unit_range(gate.promote_ratio) ||
        !in_unit_range(gate.reject_ratio)) {
        error_message = "Gate thresholds must be between 0.0 and 1.0";
        return false;
    }

    if (gate.promote_ratio > gate.reject_ratio) {
        error_message = "Promote ratio must not exceed reject ratio";
        return false;
    }

    if (gate.min_validations < 1 || gate.min_age_days < 0) {
        error_message = "Minimum validations must be positive and minimum age non-negative";
        return false;
    }

    if (scheduler.sweep_event_batch < 1 || scheduler.max_parallel_users < 1) {
        error_message = "Sweep batch and parallelism must be positive";
        return false;
    }

    if (storage_retry.max_attempts < 1) {
        error_message = "Storage retry attempts must be positive";
        return false;
    }

    return true;
}

EngineConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        // An explicit path must load; a broken file is an error, not a fallback
        return EngineConfig::from_json_file(config_path);
    }

    paths_to_try.push_back(".cogmem.json");
    paths_to_try.push_back("../.cogmem.json");

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) == 0) {
            try {
                return EngineConfig::from_json_file(path);
            } catch (const std::runtime_error& e) {
                std::cerr << "Skipping " << path << ": " << e.what() << std::endl;
            }
        }
    }

    return EngineConfig::from_environment();
}

} // namespace cogmem
